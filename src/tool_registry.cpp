#include "toolgov/tool_registry.hpp"

#include "toolgov/exceptions.hpp"
#include "toolgov/resource_lifecycle.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace toolgov {

ToolRegistry::ToolRegistry(GovernorConfig config, ErrorRecoveryOptions recovery,
                           std::shared_ptr<Monitor> monitor)
    : monitor_(std::move(monitor))
    , middleware_(std::make_shared<MiddlewareRegistry>())
    , budgets_(std::make_shared<BudgetRegistry>(config.default_budget))
    , governor_(config) {
    catalog_ = std::make_shared<AlternativeToolCatalog>(
        [this] { return tool_names(); }, recovery, monitor_);

    middleware_->set_monitor(monitor_);
    governor_.set_middleware_registry(middleware_);
    governor_.set_budget_registry(budgets_);
    governor_.set_error_catalog(catalog_);
    governor_.set_monitor(monitor_);
}

ToolRegistry::~ToolRegistry() {
    release_all();
}

// ==================== Tool Registration ====================

void ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
    if (!tool) {
        throw std::invalid_argument("ToolRegistry::register_tool: null tool");
    }
    const std::string name = tool->name();
    {
        std::unique_lock lock(tools_mutex_);
        if (by_name_.count(name) > 0) {
            throw ToolAlreadyRegisteredException(name);
        }
        by_name_.emplace(name, tool);
        tools_.push_back(tool);
    }
    if (ResourceLifecycle* lifecycle = tool->lifecycle()) {
        lifecycle->set_lifecycle_monitor(monitor_);
    }
    emit(EventType::ToolRegistered, LogLevel::Debug, "Tool registered", name);
}

bool ToolRegistry::unregister_tool(const std::string& name) {
    std::shared_ptr<Tool> removed;
    {
        std::unique_lock lock(tools_mutex_);
        auto it = by_name_.find(name);
        if (it == by_name_.end()) {
            return false;
        }
        removed = it->second;
        by_name_.erase(it);
        tools_.erase(std::remove(tools_.begin(), tools_.end(), removed), tools_.end());
    }
    release_tool(*removed);
    emit(EventType::ToolUnregistered, LogLevel::Debug, "Tool unregistered", name);
    return true;
}

std::shared_ptr<Tool> ToolRegistry::find(const std::string& name) const {
    std::shared_lock lock(tools_mutex_);
    auto it = by_name_.find(name);
    return it != by_name_.end() ? it->second : nullptr;
}

std::shared_ptr<Tool> ToolRegistry::get(const std::string& name) const {
    auto tool = find(name);
    if (!tool) {
        throw ToolNotFoundException(name);
    }
    return tool;
}

std::vector<std::string> ToolRegistry::tool_names() const {
    std::shared_lock lock(tools_mutex_);
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& t : tools_) {
        names.push_back(t->name());
    }
    return names;
}

std::size_t ToolRegistry::size() const {
    std::shared_lock lock(tools_mutex_);
    return tools_.size();
}

// ==================== Invocation ====================

InvocationResult ToolRegistry::invoke(const std::string& name, const nlohmann::json& raw_params,
                                      const CancellationToken& token) {
    auto tool = find(name);
    if (!tool) {
        InvocationResult result;
        result.status = InvocationStatus::Failed;
        result.tool_name = name;
        result.error = catalog_->lookup(error_codes::ToolNotFound,
                                        ToolNotFoundException(name).what(), name);
        emit(EventType::InvocationFailed, LogLevel::Error, result.error->message, name);
        return result;
    }
    return governor_.try_invoke(*tool, raw_params, token);
}

// ==================== Configuration ====================

void ToolRegistry::add_middleware(MiddlewarePtr middleware) {
    middleware_->add(std::move(middleware));
}

// ==================== Shutdown ====================

void ToolRegistry::release_all() {
    std::vector<std::shared_ptr<Tool>> snapshot;
    {
        std::shared_lock lock(tools_mutex_);
        snapshot = tools_;
    }
    for (auto it = snapshot.rbegin(); it != snapshot.rend(); ++it) {
        release_tool(**it);
    }
}

void ToolRegistry::release_tool(Tool& tool) {
    ResourceLifecycle* lifecycle = tool.lifecycle();
    if (!lifecycle) return;
    try {
        lifecycle->release();
    } catch (const std::exception& e) {
        emit(EventType::ToolReleaseFailed, LogLevel::Error,
             std::string("Release failed: ") + e.what(), tool.name());
    }
}

void ToolRegistry::emit(EventType type, LogLevel level, const std::string& message,
                        const std::string& tool_name) const {
    notify(monitor_.get(), make_event(type, level, message, tool_name));
}

} // namespace toolgov
