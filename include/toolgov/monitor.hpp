#pragma once

#include "toolgov/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolgov {

enum class EventType {
    InvocationStarted,
    InvocationSucceeded,
    InvocationFailed,
    InvocationCancelled,
    ValidationFailed,
    // Budget events
    BudgetApproachingLimit,
    BudgetExceededWarning,
    BudgetTruncationSignalled,
    BudgetExceededAbort,
    EstimateAccuracy,
    // Middleware events
    MiddlewareRegistered,
    MiddlewareHookFailed,
    MiddlewareActivity,
    // Registry / lifecycle events
    ToolRegistered,
    ToolUnregistered,
    ToolReleased,
    ToolReleaseFailed,
    ToolLeaked,
    ErrorCatalogFailure
};

struct MonitorEvent {
    EventType type;
    LogLevel level{LogLevel::Info};
    Timestamp timestamp;
    std::string message;

    // Structured fields (ILogger-style scopes)
    std::optional<std::string> tool_name;
    std::optional<double> elapsed_ms;
    std::optional<TokenCount> estimated_tokens;
    std::optional<TokenCount> actual_tokens;
    std::optional<std::string> error_code;

    // |estimate - actual| / max(estimate, actual)
    std::optional<double> accuracy;
};

const char* to_string(EventType t);

// Event stamped with the current time
MonitorEvent make_event(EventType type, LogLevel level, std::string message,
                        std::optional<std::string> tool_name = std::nullopt);

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
};

// Delivers `event` to `monitor` when one is attached. A monitor that throws
// is reported on stderr; the failure never reaches the caller.
void notify(Monitor* monitor, const MonitorEvent& event) noexcept;

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t invocations{0};
        std::uint64_t succeeded{0};
        std::uint64_t failed{0};
        std::uint64_t cancelled{0};
        std::uint64_t validation_failures{0};
        std::uint64_t budget_warnings{0};
        std::uint64_t budget_aborts{0};
        std::uint64_t truncation_signals{0};
        std::uint64_t hook_failures{0};
        std::uint64_t warnings_logged{0};
        double average_elapsed_ms{0.0};
        double average_estimate_accuracy{0.0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;

    Metrics get_metrics() const;
    void reset_metrics();

    using AlertCallback = std::function<void(const std::string&)>;
    void set_failure_alert_threshold(std::uint64_t failures, AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    std::uint64_t elapsed_sample_count_{0};
    double elapsed_sum_ms_{0.0};
    std::uint64_t accuracy_sample_count_{0};
    double accuracy_sum_{0.0};

    std::uint64_t failure_threshold_{0};  // 0 = disabled
    AlertCallback failure_cb_;
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

} // namespace toolgov
