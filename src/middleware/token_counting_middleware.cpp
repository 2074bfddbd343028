#include "toolgov/middleware/token_counting_middleware.hpp"

#include "toolgov/cost_estimator.hpp"

namespace toolgov {

namespace {

// Unserializable values (invalid UTF-8) count as zero
TokenCount safe_estimate(const nlohmann::json& value) {
    try {
        return CostEstimator::estimate_value(value);
    } catch (const nlohmann::json::exception&) {
        return 0;
    }
}

} // anonymous namespace

TokenCountingMiddleware::TokenCountingMiddleware(std::shared_ptr<Monitor> monitor,
                                                 MiddlewareOrder order)
    : SimpleMiddleware(order)
    , monitor_(std::move(monitor)) {}

void TokenCountingMiddleware::before_execution(const std::string& tool_name,
                                               const nlohmann::json& params) {
    const TokenCount input = safe_estimate(params);
    input_tokens_.fetch_add(input, std::memory_order_relaxed);

    if (!monitor_) return;
    auto event = make_event(EventType::MiddlewareActivity, LogLevel::Debug,
                            "Input tokens estimated", tool_name);
    event.estimated_tokens = input;
    notify(monitor_.get(), event);
}

void TokenCountingMiddleware::after_execution(const std::string& tool_name,
                                              const nlohmann::json& params,
                                              const nlohmann::json& result,
                                              double elapsed_ms) {
    const TokenCount output = safe_estimate(result);
    output_tokens_.fetch_add(output, std::memory_order_relaxed);
    completed_.fetch_add(1, std::memory_order_relaxed);

    if (!monitor_) return;
    auto event = make_event(EventType::MiddlewareActivity, LogLevel::Debug,
                            "Output tokens estimated", tool_name);
    event.estimated_tokens = safe_estimate(params);
    event.actual_tokens = output;
    event.elapsed_ms = elapsed_ms;
    notify(monitor_.get(), event);
}

void TokenCountingMiddleware::on_error(const std::string&, const nlohmann::json&,
                                       const std::exception&, double) {
    failed_.fetch_add(1, std::memory_order_relaxed);
}

TokenCountingMiddleware::Totals TokenCountingMiddleware::totals() const noexcept {
    Totals t;
    t.input_tokens = input_tokens_.load(std::memory_order_relaxed);
    t.output_tokens = output_tokens_.load(std::memory_order_relaxed);
    t.completed = completed_.load(std::memory_order_relaxed);
    t.failed = failed_.load(std::memory_order_relaxed);
    return t;
}

void TokenCountingMiddleware::reset() noexcept {
    input_tokens_.store(0, std::memory_order_relaxed);
    output_tokens_.store(0, std::memory_order_relaxed);
    completed_.store(0, std::memory_order_relaxed);
    failed_.store(0, std::memory_order_relaxed);
}

} // namespace toolgov
