#pragma once

#include "toolgov/budget_policy.hpp"
#include "toolgov/cancellation.hpp"
#include "toolgov/config.hpp"
#include "toolgov/error_catalog.hpp"
#include "toolgov/middleware.hpp"
#include "toolgov/monitor.hpp"
#include "toolgov/tool.hpp"

#include <nlohmann/json.hpp>

#include <future>
#include <memory>
#include <optional>
#include <string>

namespace toolgov {

// Exactly one of: value (Succeeded), error (Failed), cancellation_reason
// (Cancelled). Estimates are filled as far as the invocation got.
struct InvocationResult {
    InvocationStatus status{InvocationStatus::Failed};
    std::string tool_name;

    nlohmann::json value;
    std::optional<ErrorRecord> error;
    std::string cancellation_reason;

    // Padded pre-execution estimate; 0 if the budget stage was not reached
    TokenCount estimated_tokens{0};
    // Estimate of the realized result, successes only
    std::optional<TokenCount> actual_tokens;

    BudgetDecision budget_decision{BudgetDecision::Proceed};

    // Downstream response builders should shrink the payload
    bool truncation_requested{false};

    double elapsed_ms{0.0};

    bool succeeded() const noexcept { return status == InvocationStatus::Succeeded; }
    bool failed() const noexcept { return status == InvocationStatus::Failed; }
    bool cancelled() const noexcept { return status == InvocationStatus::Cancelled; }

    // Value on success; otherwise throws ToolExecutionError (ToolReleasedError
    // for TOOL_RELEASED) or OperationCancelledException
    nlohmann::json& value_or_throw() &;
    nlohmann::json value_or_throw() &&;
};

// Runs one inbound call through middleware, validation, budget and the
// tool body, converting every failure into an ErrorRecord. Stateless per
// invocation; safe to call concurrently.
//
// Setters are for wiring at startup, before the first invocation.
class ExecutionGovernor {
public:
    explicit ExecutionGovernor(GovernorConfig config = GovernorConfig{});

    ExecutionGovernor(const ExecutionGovernor&) = delete;
    ExecutionGovernor& operator=(const ExecutionGovernor&) = delete;

    // ==================== Invocation ====================

    InvocationResult try_invoke(Tool& tool, const nlohmann::json& raw_params,
                                const CancellationToken& token = CancellationToken{});

    // Throws ToolExecutionError or OperationCancelledException
    nlohmann::json invoke(Tool& tool, const nlohmann::json& raw_params,
                          const CancellationToken& token = CancellationToken{});

    std::future<nlohmann::json> invoke_async(std::shared_ptr<Tool> tool,
                                             nlohmann::json raw_params,
                                             CancellationToken token = CancellationToken{});

    // ==================== Wiring ====================

    void set_middleware_registry(std::shared_ptr<MiddlewareRegistry> registry);
    void set_budget_registry(std::shared_ptr<BudgetRegistry> registry);
    void set_error_catalog(std::shared_ptr<const ErrorCatalog> catalog);
    void set_monitor(std::shared_ptr<Monitor> monitor);

    MiddlewareRegistry& middleware() noexcept { return *middleware_; }
    BudgetRegistry& budgets() noexcept { return *budgets_; }
    const ErrorCatalog& error_catalog() const noexcept { return *catalog_; }
    const GovernorConfig& config() const noexcept { return config_; }

    // Tool override > registry (tool name > category > default)
    BudgetConfiguration resolve_budget(const Tool& tool) const;

private:
    struct StageOutcome;

    GovernorConfig config_;
    std::shared_ptr<MiddlewareRegistry> middleware_;
    std::shared_ptr<BudgetRegistry> budgets_;
    std::shared_ptr<const ErrorCatalog> catalog_;
    std::shared_ptr<Monitor> monitor_;

    StageOutcome run_pre_hooks(const MiddlewareChain& chain, const Tool& tool,
                               const nlohmann::json& raw_params,
                               const CancellationToken& token,
                               const ErrorCatalog& catalog) const;
    StageOutcome run_validation(const Tool& tool, const nlohmann::json& raw_params,
                                const ErrorCatalog& catalog) const;
    StageOutcome run_budget_check(const Tool& tool, const nlohmann::json& raw_params,
                                  const ErrorCatalog& catalog,
                                  InvocationResult& result) const;
    StageOutcome run_body(Tool& tool, const nlohmann::json& raw_params,
                          const CancellationToken& token,
                          const ErrorCatalog& catalog,
                          nlohmann::json& value) const;

    // Must be called from inside a catch block
    StageOutcome classify_current_exception(const Tool& tool,
                                            const ErrorCatalog& catalog) const;

    void record_accuracy(const Tool& tool, InvocationResult& result) const;
    void release_after_failure(Tool& tool) const;
    void emit(MonitorEvent event) const;
};

} // namespace toolgov
