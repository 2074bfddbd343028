#pragma once

#include "toolgov/budget_policy.hpp"
#include "toolgov/config.hpp"
#include "toolgov/error_catalog.hpp"
#include "toolgov/governor.hpp"
#include "toolgov/middleware.hpp"
#include "toolgov/monitor.hpp"
#include "toolgov/tool.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolgov {

// Host side of the governor: owns the tools, the global middleware set,
// the budget table and an AlternativeToolCatalog that knows the
// registered tool names.
class ToolRegistry {
public:
    explicit ToolRegistry(GovernorConfig config = GovernorConfig{},
                          ErrorRecoveryOptions recovery = ErrorRecoveryOptions{},
                          std::shared_ptr<Monitor> monitor = nullptr);

    // Calls release_all()
    ~ToolRegistry();

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    // ==================== Tool Registration ====================

    // Throws ToolAlreadyRegisteredException, std::invalid_argument on null
    void register_tool(std::shared_ptr<Tool> tool);

    // Releases a scoped-resource tool before dropping it
    bool unregister_tool(const std::string& name);

    std::shared_ptr<Tool> find(const std::string& name) const;

    // Throws ToolNotFoundException
    std::shared_ptr<Tool> get(const std::string& name) const;

    // Registration order
    std::vector<std::string> tool_names() const;
    std::size_t size() const;

    // ==================== Invocation ====================

    // Unknown name -> Failed result with TOOL_NOT_FOUND
    InvocationResult invoke(const std::string& name, const nlohmann::json& raw_params,
                            const CancellationToken& token = CancellationToken{});

    // ==================== Configuration ====================

    void add_middleware(MiddlewarePtr middleware);

    MiddlewareRegistry& middleware() noexcept { return *middleware_; }
    BudgetRegistry& budgets() noexcept { return *budgets_; }
    ExecutionGovernor& governor() noexcept { return governor_; }
    const AlternativeToolCatalog& error_catalog() const noexcept { return *catalog_; }

    // ==================== Shutdown ====================

    // Reverse registration order. Failures are logged, never thrown.
    void release_all();

private:
    mutable std::shared_mutex tools_mutex_;
    std::vector<std::shared_ptr<Tool>> tools_;
    std::unordered_map<std::string, std::shared_ptr<Tool>> by_name_;

    std::shared_ptr<Monitor> monitor_;
    std::shared_ptr<MiddlewareRegistry> middleware_;
    std::shared_ptr<BudgetRegistry> budgets_;
    std::shared_ptr<AlternativeToolCatalog> catalog_;
    ExecutionGovernor governor_;

    void release_tool(Tool& tool);
    void emit(EventType type, LogLevel level, const std::string& message,
              const std::string& tool_name) const;
};

} // namespace toolgov
