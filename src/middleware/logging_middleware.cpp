#include "toolgov/middleware/logging_middleware.hpp"

#include "toolgov/exceptions.hpp"

namespace toolgov {

LoggingMiddleware::LoggingMiddleware(std::shared_ptr<Monitor> monitor, MiddlewareOrder order)
    : SimpleMiddleware(order)
    , monitor_(std::move(monitor)) {}

void LoggingMiddleware::before_execution(const std::string& tool_name,
                                         const nlohmann::json&) {
    if (!monitor_) return;
    notify(monitor_.get(), make_event(EventType::MiddlewareActivity, LogLevel::Info,
                                      "Executing tool", tool_name));
}

void LoggingMiddleware::after_execution(const std::string& tool_name, const nlohmann::json&,
                                        const nlohmann::json&, double elapsed_ms) {
    if (!monitor_) return;
    auto event = make_event(EventType::MiddlewareActivity, LogLevel::Info,
                            "Tool completed", tool_name);
    event.elapsed_ms = elapsed_ms;
    notify(monitor_.get(), event);
}

void LoggingMiddleware::on_error(const std::string& tool_name, const nlohmann::json&,
                                 const std::exception& error, double elapsed_ms) {
    if (!monitor_) return;
    auto event = make_event(EventType::MiddlewareActivity, LogLevel::Error,
                            std::string("Tool failed: ") + error.what(), tool_name);
    event.elapsed_ms = elapsed_ms;
    if (const auto* failure = dynamic_cast<const ToolExecutionError*>(&error)) {
        event.error_code = failure->code();
    } else {
        event.level = LogLevel::Info;
    }
    notify(monitor_.get(), event);
}

} // namespace toolgov
