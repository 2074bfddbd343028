#include "toolgov/budget_policy.hpp"

#include <mutex>
#include <stdexcept>

namespace toolgov {

// ---------------------------------------------------------------------------
// BudgetConfiguration
// ---------------------------------------------------------------------------

void BudgetConfiguration::validate() const {
    if (max_tokens <= 0) {
        throw std::invalid_argument("BudgetConfiguration max_tokens must be positive");
    }
    if (warning_threshold < 0 || warning_threshold >= max_tokens) {
        throw std::invalid_argument(
            "BudgetConfiguration warning_threshold must be in [0, max_tokens)");
    }
    if (!(estimation_multiplier > 0.0)) {
        throw std::invalid_argument(
            "BudgetConfiguration estimation_multiplier must be positive");
    }
}

// ---------------------------------------------------------------------------
// BudgetPolicy
// ---------------------------------------------------------------------------

BudgetVerdict BudgetPolicy::evaluate(TokenCount estimate, const BudgetConfiguration& config) {
    BudgetVerdict verdict;
    verdict.estimate = estimate;
    verdict.max_tokens = config.max_tokens;

    if (estimate > config.max_tokens) {
        switch (config.strategy) {
            case BudgetStrategy::Throw:
                verdict.decision = BudgetDecision::Abort;
                break;
            case BudgetStrategy::Warn:
                verdict.decision = BudgetDecision::ProceedWarn;
                break;
            case BudgetStrategy::Truncate:
                verdict.decision = BudgetDecision::ProceedTruncateSignal;
                break;
            case BudgetStrategy::Ignore:
                verdict.decision = BudgetDecision::Proceed;
                break;
        }
        return verdict;
    }

    verdict.decision = BudgetDecision::Proceed;
    verdict.approaching_limit = estimate > config.warning_threshold;
    return verdict;
}

// ---------------------------------------------------------------------------
// BudgetRegistry
// ---------------------------------------------------------------------------

BudgetRegistry::BudgetRegistry(BudgetConfiguration default_budget)
    : default_budget_(default_budget)
{
    default_budget_.validate();
}

void BudgetRegistry::set_tool_budget(const std::string& tool_name, BudgetConfiguration config) {
    config.validate();
    std::unique_lock lock(mutex_);
    tool_budgets_[tool_name] = config;
}

void BudgetRegistry::set_category_budget(ToolCategory category, BudgetConfiguration config) {
    config.validate();
    std::unique_lock lock(mutex_);
    category_budgets_[category] = config;
}

void BudgetRegistry::set_default_budget(BudgetConfiguration config) {
    config.validate();
    std::unique_lock lock(mutex_);
    default_budget_ = config;
}

bool BudgetRegistry::clear_tool_budget(const std::string& tool_name) {
    std::unique_lock lock(mutex_);
    return tool_budgets_.erase(tool_name) > 0;
}

BudgetConfiguration BudgetRegistry::resolve(const std::string& tool_name,
                                            ToolCategory category) const {
    std::shared_lock lock(mutex_);

    auto tool_it = tool_budgets_.find(tool_name);
    if (tool_it != tool_budgets_.end()) {
        return tool_it->second;
    }

    auto cat_it = category_budgets_.find(category);
    if (cat_it != category_budgets_.end()) {
        return cat_it->second;
    }

    return default_budget_;
}

} // namespace toolgov
