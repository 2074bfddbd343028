#pragma once

#include "toolgov/types.hpp"

namespace toolgov {

// Token budget for one tool. Immutable once handed to the governor.
struct BudgetConfiguration {
    // Ceiling checked against the padded pre-execution estimate
    TokenCount max_tokens = 10000;

    // Estimates above this (but within max_tokens) get a debug note
    TokenCount warning_threshold = 8000;

    BudgetStrategy strategy = BudgetStrategy::Warn;

    // Safety padding applied to the summed estimate
    double estimation_multiplier = 1.2;

    // Throws std::invalid_argument on an inconsistent configuration
    void validate() const;
};

// Options for AlternativeToolCatalog
struct ErrorRecoveryOptions {
    // Add tool-aware recovery steps when tools are available
    bool enable_recovery_guidance = true;

    // Append "try tool X" suggested actions
    bool suggest_alternative_tools = true;
};

struct GovernorConfig {
    // Budget used when neither the tool nor a BudgetRegistry supplies one
    BudgetConfiguration default_budget;

    // Estimate the realized result after success and report accuracy
    bool emit_accuracy_telemetry = true;
};

} // namespace toolgov
