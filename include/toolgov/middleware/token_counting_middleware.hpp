#pragma once

#include "toolgov/middleware.hpp"
#include "toolgov/monitor.hpp"

#include <atomic>
#include <cstdint>
#include <memory>

namespace toolgov {

// Estimates input and output tokens of every invocation with the text
// heuristic and keeps running totals.
class TokenCountingMiddleware : public SimpleMiddleware {
public:
    static constexpr MiddlewareOrder kDefaultOrder = 100;

    struct Totals {
        TokenCount input_tokens{0};
        TokenCount output_tokens{0};
        std::uint64_t completed{0};
        std::uint64_t failed{0};
    };

    explicit TokenCountingMiddleware(std::shared_ptr<Monitor> monitor = nullptr,
                                     MiddlewareOrder order = kDefaultOrder);

    void before_execution(const std::string& tool_name,
                          const nlohmann::json& params) override;
    void after_execution(const std::string& tool_name, const nlohmann::json& params,
                         const nlohmann::json& result, double elapsed_ms) override;
    void on_error(const std::string& tool_name, const nlohmann::json& params,
                  const std::exception& error, double elapsed_ms) override;

    Totals totals() const noexcept;
    void reset() noexcept;

private:
    std::shared_ptr<Monitor> monitor_;

    std::atomic<TokenCount> input_tokens_{0};
    std::atomic<TokenCount> output_tokens_{0};
    std::atomic<std::uint64_t> completed_{0};
    std::atomic<std::uint64_t> failed_{0};
};

} // namespace toolgov
