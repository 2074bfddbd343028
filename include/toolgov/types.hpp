#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace toolgov {

// Token counts (estimated, never measured)
using TokenCount = std::int64_t;

// Time types
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;

// Middleware ordering (ascending = earlier for pre-hooks)
using MiddlewareOrder = std::int32_t;

// Tool category. Only selects default estimates, never behaviour.
enum class ToolCategory {
    General,
    Query,
    Analysis,
    Generation,
    Refactoring,
    Validation,
    Documentation,
    Configuration,
    Diagnostics,
    Testing,
    Deployment,
    Security,
    Resources,
    Integration,
    Monitoring,
    Utility
};

// What to do when an estimate exceeds the configured ceiling
enum class BudgetStrategy {
    Warn,
    Throw,
    Truncate,
    Ignore
};

// Outcome of consulting the budget policy
enum class BudgetDecision {
    Proceed,
    ProceedWarn,
    ProceedTruncateSignal,
    Abort
};

// Terminal state of one invocation
enum class InvocationStatus {
    Succeeded,
    Failed,
    Cancelled
};

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

inline const char* to_string(ToolCategory c) {
    switch (c) {
        case ToolCategory::General:       return "General";
        case ToolCategory::Query:         return "Query";
        case ToolCategory::Analysis:      return "Analysis";
        case ToolCategory::Generation:    return "Generation";
        case ToolCategory::Refactoring:   return "Refactoring";
        case ToolCategory::Validation:    return "Validation";
        case ToolCategory::Documentation: return "Documentation";
        case ToolCategory::Configuration: return "Configuration";
        case ToolCategory::Diagnostics:   return "Diagnostics";
        case ToolCategory::Testing:       return "Testing";
        case ToolCategory::Deployment:    return "Deployment";
        case ToolCategory::Security:      return "Security";
        case ToolCategory::Resources:     return "Resources";
        case ToolCategory::Integration:   return "Integration";
        case ToolCategory::Monitoring:    return "Monitoring";
        case ToolCategory::Utility:       return "Utility";
    }
    return "Unknown";
}

inline const char* to_string(BudgetStrategy s) {
    switch (s) {
        case BudgetStrategy::Warn:     return "Warn";
        case BudgetStrategy::Throw:    return "Throw";
        case BudgetStrategy::Truncate: return "Truncate";
        case BudgetStrategy::Ignore:   return "Ignore";
    }
    return "Unknown";
}

inline const char* to_string(BudgetDecision d) {
    switch (d) {
        case BudgetDecision::Proceed:               return "Proceed";
        case BudgetDecision::ProceedWarn:           return "ProceedWarn";
        case BudgetDecision::ProceedTruncateSignal: return "ProceedTruncateSignal";
        case BudgetDecision::Abort:                 return "Abort";
    }
    return "Unknown";
}

inline const char* to_string(InvocationStatus s) {
    switch (s) {
        case InvocationStatus::Succeeded: return "Succeeded";
        case InvocationStatus::Failed:    return "Failed";
        case InvocationStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

inline const char* to_string(LogLevel l) {
    switch (l) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
    }
    return "Unknown";
}

} // namespace toolgov
