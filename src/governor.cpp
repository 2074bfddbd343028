#include "toolgov/governor.hpp"

#include "toolgov/cost_estimator.hpp"
#include "toolgov/exceptions.hpp"
#include "toolgov/resource_lifecycle.hpp"
#include "toolgov/validation.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace toolgov {

// Result of one governor stage. Failures and cancellations are carried
// as values between stages; nothing unwinds across them.
struct ExecutionGovernor::StageOutcome {
    enum class Kind { Continue, Failed, Cancelled };

    Kind kind{Kind::Continue};
    ErrorRecord record;
    std::string reason;

    bool proceeding() const noexcept { return kind == Kind::Continue; }

    static StageOutcome proceed() { return StageOutcome{}; }

    static StageOutcome failed(ErrorRecord record) {
        StageOutcome o;
        o.kind = Kind::Failed;
        o.record = std::move(record);
        return o;
    }

    static StageOutcome cancelled(std::string reason) {
        StageOutcome o;
        o.kind = Kind::Cancelled;
        o.reason = std::move(reason);
        return o;
    }

    static StageOutcome checkpoint(const CancellationToken& token) {
        if (token.is_cancellation_requested()) {
            return cancelled(OperationCancelledException().what());
        }
        return proceed();
    }
};

namespace {

[[noreturn]] void throw_failure(const InvocationResult& result) {
    if (result.status == InvocationStatus::Cancelled) {
        if (result.cancellation_reason.empty()) {
            throw OperationCancelledException();
        }
        throw OperationCancelledException(result.cancellation_reason);
    }
    ErrorRecord record = result.error.value_or(
        ErrorRecord{error_codes::ToolError, "Invocation failed", RecoveryInfo{}});
    if (record.code == error_codes::ToolReleased) {
        throw ToolReleasedError(result.tool_name, std::move(record));
    }
    throw ToolExecutionError(result.tool_name, std::move(record));
}

double millis_since(Timestamp start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// InvocationResult
// ---------------------------------------------------------------------------

nlohmann::json& InvocationResult::value_or_throw() & {
    if (status != InvocationStatus::Succeeded) {
        throw_failure(*this);
    }
    return value;
}

nlohmann::json InvocationResult::value_or_throw() && {
    return std::move(value_or_throw());
}

// ---------------------------------------------------------------------------
// ExecutionGovernor
// ---------------------------------------------------------------------------

ExecutionGovernor::ExecutionGovernor(GovernorConfig config)
    : config_(std::move(config)) {
    config_.default_budget.validate();
    middleware_ = std::make_shared<MiddlewareRegistry>();
    budgets_ = std::make_shared<BudgetRegistry>(config_.default_budget);
    catalog_ = std::make_shared<ErrorCatalog>();
}

void ExecutionGovernor::set_middleware_registry(std::shared_ptr<MiddlewareRegistry> registry) {
    if (!registry) throw std::invalid_argument("middleware registry cannot be null");
    middleware_ = std::move(registry);
}

void ExecutionGovernor::set_budget_registry(std::shared_ptr<BudgetRegistry> registry) {
    if (!registry) throw std::invalid_argument("budget registry cannot be null");
    budgets_ = std::move(registry);
}

void ExecutionGovernor::set_error_catalog(std::shared_ptr<const ErrorCatalog> catalog) {
    if (!catalog) throw std::invalid_argument("error catalog cannot be null");
    catalog_ = std::move(catalog);
}

void ExecutionGovernor::set_monitor(std::shared_ptr<Monitor> monitor) {
    monitor_ = std::move(monitor);
}

BudgetConfiguration ExecutionGovernor::resolve_budget(const Tool& tool) const {
    if (auto own = tool.budget()) {
        return *own;
    }
    return budgets_->resolve(tool.name(), tool.category());
}

InvocationResult ExecutionGovernor::try_invoke(Tool& tool, const nlohmann::json& raw_params,
                                               const CancellationToken& token) {
    const Timestamp start = Clock::now();

    InvocationResult result;
    result.tool_name = tool.name();

    const auto tool_catalog = tool.error_catalog();
    const ErrorCatalog& catalog = tool_catalog ? *tool_catalog : *catalog_;

    emit(make_event(EventType::InvocationStarted, LogLevel::Debug,
                    "Invocation started", tool.name()));

    // A released tool fails before any hook sees the call
    if (ResourceLifecycle* lifecycle = tool.lifecycle(); lifecycle && lifecycle->is_released()) {
        result.error = catalog.lookup(error_codes::ToolReleased,
                                      catalog.tool_released(tool.name()), tool.name());
        result.elapsed_ms = millis_since(start);

        auto event = make_event(EventType::InvocationFailed, LogLevel::Error,
                                result.error->message, tool.name());
        event.error_code = result.error->code;
        emit(std::move(event));
        return result;
    }

    const MiddlewareChain chain = MiddlewareChain::compose(middleware_->snapshot(),
                                                           tool.middleware());

    StageOutcome outcome = StageOutcome::checkpoint(token);
    if (outcome.proceeding()) outcome = run_pre_hooks(chain, tool, raw_params, token, catalog);
    if (outcome.proceeding()) outcome = StageOutcome::checkpoint(token);
    if (outcome.proceeding()) outcome = run_validation(tool, raw_params, catalog);
    if (outcome.proceeding()) outcome = StageOutcome::checkpoint(token);
    if (outcome.proceeding()) outcome = run_budget_check(tool, raw_params, catalog, result);
    if (outcome.proceeding()) outcome = StageOutcome::checkpoint(token);
    if (outcome.proceeding()) outcome = run_body(tool, raw_params, token, catalog, result.value);

    const double elapsed = millis_since(start);
    result.elapsed_ms = elapsed;

    switch (outcome.kind) {
        case StageOutcome::Kind::Continue: {
            result.status = InvocationStatus::Succeeded;
            record_accuracy(tool, result);
            chain.run_after(tool.name(), raw_params, result.value, elapsed, monitor_.get());

            auto event = make_event(EventType::InvocationSucceeded, LogLevel::Info,
                                    "Invocation succeeded", tool.name());
            event.elapsed_ms = elapsed;
            event.estimated_tokens = result.estimated_tokens;
            event.actual_tokens = result.actual_tokens;
            emit(std::move(event));
            break;
        }
        case StageOutcome::Kind::Cancelled: {
            result.status = InvocationStatus::Cancelled;
            result.value = nullptr;
            result.cancellation_reason = outcome.reason;

            const OperationCancelledException error(outcome.reason);
            chain.run_on_error(tool.name(), raw_params, error, elapsed, monitor_.get());

            auto event = make_event(EventType::InvocationCancelled, LogLevel::Info,
                                    outcome.reason, tool.name());
            event.elapsed_ms = elapsed;
            emit(std::move(event));
            break;
        }
        case StageOutcome::Kind::Failed: {
            result.status = InvocationStatus::Failed;
            result.value = nullptr;

            const ToolExecutionError error(tool.name(), outcome.record);
            chain.run_on_error(tool.name(), raw_params, error, elapsed, monitor_.get());

            auto event = make_event(EventType::InvocationFailed, LogLevel::Error,
                                    outcome.record.message, tool.name());
            event.elapsed_ms = elapsed;
            event.error_code = outcome.record.code;
            emit(std::move(event));

            result.error = std::move(outcome.record);
            release_after_failure(tool);
            break;
        }
    }
    return result;
}

nlohmann::json ExecutionGovernor::invoke(Tool& tool, const nlohmann::json& raw_params,
                                         const CancellationToken& token) {
    return try_invoke(tool, raw_params, token).value_or_throw();
}

std::future<nlohmann::json> ExecutionGovernor::invoke_async(std::shared_ptr<Tool> tool,
                                                            nlohmann::json raw_params,
                                                            CancellationToken token) {
    if (!tool) {
        throw std::invalid_argument("invoke_async: null tool");
    }
    return std::async(std::launch::async,
                      [this, tool = std::move(tool), params = std::move(raw_params),
                       token = std::move(token)]() {
                          return invoke(*tool, params, token);
                      });
}

// ---------------------------------------------------------------------------
// Stages
// ---------------------------------------------------------------------------

ExecutionGovernor::StageOutcome ExecutionGovernor::run_pre_hooks(
    const MiddlewareChain& chain, const Tool& tool, const nlohmann::json& raw_params,
    const CancellationToken& token, const ErrorCatalog& catalog) const {
    try {
        chain.run_before(tool.name(), raw_params, token);
        return StageOutcome::proceed();
    } catch (...) {
        return classify_current_exception(tool, catalog);
    }
}

ExecutionGovernor::StageOutcome ExecutionGovernor::run_validation(
    const Tool& tool, const nlohmann::json& raw_params, const ErrorCatalog& catalog) const {
    auto report_failure = [&](const ErrorRecord& record) {
        auto event = make_event(EventType::ValidationFailed, LogLevel::Warning,
                                record.message, tool.name());
        event.error_code = record.code;
        emit(std::move(event));
    };

    if (tool.validates_structure()) {
        const ValidationReport report =
            Validator::validate(raw_params, tool.parameter_schema(), catalog);
        if (!report.is_valid()) {
            ErrorRecord record = catalog.lookup(report.code(), report.message(), tool.name());
            report_failure(record);
            return StageOutcome::failed(std::move(record));
        }
    }

    try {
        tool.validate(raw_params);
    } catch (...) {
        StageOutcome outcome = classify_current_exception(tool, catalog);
        if (outcome.kind == StageOutcome::Kind::Failed) {
            report_failure(outcome.record);
        }
        return outcome;
    }
    return StageOutcome::proceed();
}

ExecutionGovernor::StageOutcome ExecutionGovernor::run_budget_check(
    const Tool& tool, const nlohmann::json& raw_params, const ErrorCatalog& catalog,
    InvocationResult& result) const {
    BudgetConfiguration budget;
    EstimateBreakdown breakdown;
    try {
        budget = resolve_budget(tool);
        breakdown = CostEstimator::estimate_breakdown(raw_params, tool.result_shape(),
                                                      tool.category(),
                                                      budget.estimation_multiplier);
    } catch (...) {
        return classify_current_exception(tool, catalog);
    }

    const BudgetVerdict verdict = BudgetPolicy::evaluate(breakdown.total, budget);
    result.estimated_tokens = breakdown.total;
    result.budget_decision = verdict.decision;

    auto budget_event = [&](EventType type, LogLevel level, std::string message) {
        auto event = make_event(type, level, std::move(message), tool.name());
        event.estimated_tokens = breakdown.total;
        emit(std::move(event));
    };

    switch (verdict.decision) {
        case BudgetDecision::Abort: {
            std::string message = catalog.budget_exceeded(tool.name(), breakdown.total,
                                                          budget.max_tokens);
            budget_event(EventType::BudgetExceededAbort, LogLevel::Error, message);
            return StageOutcome::failed(catalog.lookup(error_codes::ResourceLimitExceeded,
                                                       message, tool.name()));
        }
        case BudgetDecision::ProceedWarn:
            budget_event(EventType::BudgetExceededWarning, LogLevel::Warning,
                         catalog.budget_exceeded(tool.name(), breakdown.total,
                                                 budget.max_tokens));
            break;
        case BudgetDecision::ProceedTruncateSignal:
            result.truncation_requested = true;
            budget_event(EventType::BudgetTruncationSignalled, LogLevel::Warning,
                         catalog.budget_exceeded(tool.name(), breakdown.total,
                                                 budget.max_tokens) +
                             "; response truncation requested");
            break;
        case BudgetDecision::Proceed:
            if (verdict.approaching_limit) {
                budget_event(EventType::BudgetApproachingLimit, LogLevel::Debug,
                             "Estimate " + std::to_string(breakdown.total) +
                                 " is above the warning threshold " +
                                 std::to_string(budget.warning_threshold));
            }
            break;
    }
    return StageOutcome::proceed();
}

ExecutionGovernor::StageOutcome ExecutionGovernor::run_body(
    Tool& tool, const nlohmann::json& raw_params, const CancellationToken& token,
    const ErrorCatalog& catalog, nlohmann::json& value) const {
    try {
        value = tool.execute(raw_params, token);
        return StageOutcome::proceed();
    } catch (...) {
        return classify_current_exception(tool, catalog);
    }
}

ExecutionGovernor::StageOutcome ExecutionGovernor::classify_current_exception(
    const Tool& tool, const ErrorCatalog& catalog) const {
    const std::string& name = tool.name();
    try {
        throw;
    } catch (const OperationCancelledException& e) {
        return StageOutcome::cancelled(e.what());
    } catch (const ToolExecutionError& e) {
        return StageOutcome::failed(e.record());
    } catch (const ValidationException& e) {
        return StageOutcome::failed(catalog.lookup(e.code(), e.what(), name));
    } catch (const ToolError& e) {
        return StageOutcome::failed(
            catalog.lookup(e.code(), catalog.tool_execution_failed(name, e.what()), name));
    } catch (const std::exception& e) {
        return StageOutcome::failed(catalog.lookup(catalog.classify_failure(e.what()),
                                                   catalog.tool_execution_failed(name, e.what()),
                                                   name));
    } catch (...) {
        return StageOutcome::failed(catalog.lookup(
            error_codes::ToolError, catalog.tool_execution_failed(name, "unknown error"), name));
    }
}

// ---------------------------------------------------------------------------
// Telemetry and policy helpers
// ---------------------------------------------------------------------------

void ExecutionGovernor::record_accuracy(const Tool& tool, InvocationResult& result) const {
    TokenCount actual = 0;
    try {
        actual = CostEstimator::estimate_value(result.value);
    } catch (const nlohmann::json::exception& e) {
        // Result not serializable (e.g. invalid UTF-8); no accuracy sample
        emit(make_event(EventType::EstimateAccuracy, LogLevel::Debug,
                        std::string("Result could not be estimated: ") + e.what(),
                        tool.name()));
        return;
    }
    result.actual_tokens = actual;

    if (!config_.emit_accuracy_telemetry) return;

    auto event = make_event(EventType::EstimateAccuracy, LogLevel::Debug,
                            "Estimate accuracy", tool.name());
    event.estimated_tokens = result.estimated_tokens;
    event.actual_tokens = actual;
    event.accuracy = CostEstimator::accuracy(result.estimated_tokens, actual);
    emit(std::move(event));
}

void ExecutionGovernor::release_after_failure(Tool& tool) const {
    ResourceLifecycle* lifecycle = tool.lifecycle();
    if (!lifecycle || !lifecycle->release_on_failure()) return;

    try {
        lifecycle->release();
    } catch (const std::exception& e) {
        emit(make_event(EventType::ToolReleaseFailed, LogLevel::Error,
                        std::string("Release after failure threw: ") + e.what(),
                        tool.name()));
    }
}

void ExecutionGovernor::emit(MonitorEvent event) const {
    notify(monitor_.get(), event);
}

} // namespace toolgov
