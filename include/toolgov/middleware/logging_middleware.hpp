#pragma once

#include "toolgov/middleware.hpp"
#include "toolgov/monitor.hpp"

#include <memory>

namespace toolgov {

// Logs invocation start, completion and failure through a Monitor
class LoggingMiddleware : public SimpleMiddleware {
public:
    static constexpr MiddlewareOrder kDefaultOrder = 10;

    explicit LoggingMiddleware(std::shared_ptr<Monitor> monitor,
                               MiddlewareOrder order = kDefaultOrder);

    void before_execution(const std::string& tool_name,
                          const nlohmann::json& params) override;
    void after_execution(const std::string& tool_name, const nlohmann::json& params,
                         const nlohmann::json& result, double elapsed_ms) override;
    void on_error(const std::string& tool_name, const nlohmann::json& params,
                  const std::exception& error, double elapsed_ms) override;

private:
    std::shared_ptr<Monitor> monitor_;
};

} // namespace toolgov
