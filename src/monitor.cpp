#include "toolgov/monitor.hpp"

#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace toolgov {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::InvocationStarted:         return "InvocationStarted";
        case EventType::InvocationSucceeded:       return "InvocationSucceeded";
        case EventType::InvocationFailed:          return "InvocationFailed";
        case EventType::InvocationCancelled:       return "InvocationCancelled";
        case EventType::ValidationFailed:          return "ValidationFailed";
        case EventType::BudgetApproachingLimit:    return "BudgetApproachingLimit";
        case EventType::BudgetExceededWarning:     return "BudgetExceededWarning";
        case EventType::BudgetTruncationSignalled: return "BudgetTruncationSignalled";
        case EventType::BudgetExceededAbort:       return "BudgetExceededAbort";
        case EventType::EstimateAccuracy:          return "EstimateAccuracy";
        case EventType::MiddlewareRegistered:      return "MiddlewareRegistered";
        case EventType::MiddlewareHookFailed:      return "MiddlewareHookFailed";
        case EventType::MiddlewareActivity:        return "MiddlewareActivity";
        case EventType::ToolRegistered:            return "ToolRegistered";
        case EventType::ToolUnregistered:          return "ToolUnregistered";
        case EventType::ToolReleased:              return "ToolReleased";
        case EventType::ToolReleaseFailed:         return "ToolReleaseFailed";
        case EventType::ToolLeaked:                return "ToolLeaked";
        case EventType::ErrorCatalogFailure:       return "ErrorCatalogFailure";
    }
    return "Unknown";
}

MonitorEvent make_event(EventType type, LogLevel level, std::string message,
                        std::optional<std::string> tool_name) {
    MonitorEvent event;
    event.type = type;
    event.level = level;
    event.timestamp = Clock::now();
    event.message = std::move(message);
    event.tool_name = std::move(tool_name);
    return event;
}

void notify(Monitor* monitor, const MonitorEvent& event) noexcept {
    if (!monitor) return;
    try {
        monitor->on_event(event);
    } catch (const std::exception& e) {
        std::cerr << "[ToolGov] monitor failed on " << to_string(event.type)
                  << ": " << e.what() << "\n";
    } catch (...) {
        std::cerr << "[ToolGov] monitor failed on " << to_string(event.type)
                  << ": unknown error\n";
    }
}

namespace {

LogLevel min_level_for(ConsoleMonitor::Verbosity v) {
    switch (v) {
        case ConsoleMonitor::Verbosity::Debug:   return LogLevel::Debug;
        case ConsoleMonitor::Verbosity::Verbose: return LogLevel::Info;
        case ConsoleMonitor::Verbosity::Normal:  return LogLevel::Warning;
        case ConsoleMonitor::Verbosity::Quiet:   return LogLevel::Error;
    }
    return LogLevel::Info;
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (event.level < min_level_for(verbosity_)) return;

    // Formatted locally so std::cout keeps its own flags
    std::ostringstream line;
    line << "[ToolGov] " << to_string(event.level) << " " << to_string(event.type);

    if (event.tool_name.has_value()) {
        line << " tool=" << event.tool_name.value();
    }
    if (event.elapsed_ms.has_value()) {
        line << " elapsed_ms=" << std::fixed << std::setprecision(2)
             << event.elapsed_ms.value();
    }
    if (event.estimated_tokens.has_value()) {
        line << " estimated=" << event.estimated_tokens.value();
    }
    if (event.actual_tokens.has_value()) {
        line << " actual=" << event.actual_tokens.value();
    }
    if (event.accuracy.has_value()) {
        line << " accuracy=" << std::fixed << std::setprecision(3)
             << event.accuracy.value();
    }
    if (event.error_code.has_value()) {
        line << " code=" << event.error_code.value();
    }

    if (!event.message.empty()) {
        line << " | " << event.message;
    }
    line << "\n";

    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << line.str();
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    AlertCallback pending_alert;
    std::string alert_message;

    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);

        if (event.level == LogLevel::Warning) {
            metrics_.warnings_logged++;
        }

        switch (event.type) {
            case EventType::InvocationStarted:
                metrics_.invocations++;
                break;
            case EventType::InvocationSucceeded:
                metrics_.succeeded++;
                break;
            case EventType::InvocationFailed:
                metrics_.failed++;
                if (failure_cb_ && failure_threshold_ > 0 &&
                    metrics_.failed == failure_threshold_) {
                    pending_alert = failure_cb_;
                    alert_message = "Failed invocations reached " +
                                    std::to_string(failure_threshold_);
                }
                break;
            case EventType::InvocationCancelled:
                metrics_.cancelled++;
                break;
            case EventType::ValidationFailed:
                metrics_.validation_failures++;
                break;
            case EventType::BudgetExceededWarning:
                metrics_.budget_warnings++;
                break;
            case EventType::BudgetExceededAbort:
                metrics_.budget_aborts++;
                break;
            case EventType::BudgetTruncationSignalled:
                metrics_.truncation_signals++;
                break;
            case EventType::MiddlewareHookFailed:
                metrics_.hook_failures++;
                break;
            case EventType::EstimateAccuracy:
                if (event.accuracy.has_value()) {
                    accuracy_sample_count_++;
                    accuracy_sum_ += event.accuracy.value();
                    metrics_.average_estimate_accuracy =
                        accuracy_sum_ / static_cast<double>(accuracy_sample_count_);
                }
                break;
            default:
                break;
        }

        bool terminal = event.type == EventType::InvocationSucceeded ||
                        event.type == EventType::InvocationFailed ||
                        event.type == EventType::InvocationCancelled;
        if (terminal && event.elapsed_ms.has_value()) {
            elapsed_sample_count_++;
            elapsed_sum_ms_ += event.elapsed_ms.value();
            metrics_.average_elapsed_ms =
                elapsed_sum_ms_ / static_cast<double>(elapsed_sample_count_);
        }
    }

    // Invoke outside the lock so the callback may query metrics
    if (pending_alert) {
        pending_alert(alert_message);
    }
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
    elapsed_sample_count_ = 0;
    elapsed_sum_ms_ = 0.0;
    accuracy_sample_count_ = 0;
    accuracy_sum_ = 0.0;
}

void MetricsMonitor::set_failure_alert_threshold(std::uint64_t failures, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    failure_threshold_ = failures;
    failure_cb_ = std::move(cb);
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    // One failing monitor does not starve the others
    for (auto& m : monitors_) {
        notify(m.get(), event);
    }
}

} // namespace toolgov
