#pragma once

#include "toolgov/config.hpp"
#include "toolgov/types.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace toolgov {

struct BudgetVerdict {
    BudgetDecision decision{BudgetDecision::Proceed};

    // Within max_tokens but above warning_threshold
    bool approaching_limit{false};

    TokenCount estimate{0};
    TokenCount max_tokens{0};
};

// Pure decision function: estimate + configuration -> what to do
class BudgetPolicy {
public:
    static BudgetVerdict evaluate(TokenCount estimate, const BudgetConfiguration& config);
};

// Resolves budgets by priority: tool name > category > default
class BudgetRegistry {
public:
    explicit BudgetRegistry(BudgetConfiguration default_budget = BudgetConfiguration{});

    void set_tool_budget(const std::string& tool_name, BudgetConfiguration config);
    void set_category_budget(ToolCategory category, BudgetConfiguration config);
    void set_default_budget(BudgetConfiguration config);

    bool clear_tool_budget(const std::string& tool_name);

    BudgetConfiguration resolve(const std::string& tool_name, ToolCategory category) const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, BudgetConfiguration> tool_budgets_;
    std::unordered_map<ToolCategory, BudgetConfiguration> category_budgets_;
    BudgetConfiguration default_budget_;
};

} // namespace toolgov
