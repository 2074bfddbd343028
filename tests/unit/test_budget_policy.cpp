#include <gtest/gtest.h>
#include <toolgov/toolgov.hpp>

#include <stdexcept>

using namespace toolgov;

namespace {

BudgetConfiguration make_budget(TokenCount max, TokenCount warn, BudgetStrategy strategy) {
    BudgetConfiguration cfg;
    cfg.max_tokens = max;
    cfg.warning_threshold = warn;
    cfg.strategy = strategy;
    return cfg;
}

} // namespace

// ===========================================================================
// BudgetConfiguration
// ===========================================================================

TEST(BudgetConfigurationTest, Defaults) {
    BudgetConfiguration cfg;
    EXPECT_EQ(cfg.max_tokens, 10000);
    EXPECT_EQ(cfg.warning_threshold, 8000);
    EXPECT_EQ(cfg.strategy, BudgetStrategy::Warn);
    EXPECT_DOUBLE_EQ(cfg.estimation_multiplier, 1.2);
    EXPECT_NO_THROW(cfg.validate());
}

TEST(BudgetConfigurationTest, RejectsInconsistentValues) {
    EXPECT_THROW(make_budget(0, 0, BudgetStrategy::Warn).validate(), std::invalid_argument);
    EXPECT_THROW(make_budget(1000, 1000, BudgetStrategy::Warn).validate(), std::invalid_argument);
    EXPECT_THROW(make_budget(1000, -1, BudgetStrategy::Warn).validate(), std::invalid_argument);

    auto cfg = make_budget(1000, 800, BudgetStrategy::Warn);
    cfg.estimation_multiplier = 0.0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

// ===========================================================================
// BudgetPolicy decisions
// ===========================================================================

TEST(BudgetPolicyTest, OverBudgetDecisionPerStrategy) {
    EXPECT_EQ(BudgetPolicy::evaluate(1500, make_budget(1000, 800, BudgetStrategy::Throw)).decision,
              BudgetDecision::Abort);
    EXPECT_EQ(BudgetPolicy::evaluate(1500, make_budget(1000, 800, BudgetStrategy::Warn)).decision,
              BudgetDecision::ProceedWarn);
    EXPECT_EQ(BudgetPolicy::evaluate(1500, make_budget(1000, 800, BudgetStrategy::Truncate)).decision,
              BudgetDecision::ProceedTruncateSignal);
    EXPECT_EQ(BudgetPolicy::evaluate(1500, make_budget(1000, 800, BudgetStrategy::Ignore)).decision,
              BudgetDecision::Proceed);
}

TEST(BudgetPolicyTest, AtCeilingIsWithinBudget) {
    auto v = BudgetPolicy::evaluate(1000, make_budget(1000, 800, BudgetStrategy::Throw));
    EXPECT_EQ(v.decision, BudgetDecision::Proceed);
    EXPECT_TRUE(v.approaching_limit);
}

TEST(BudgetPolicyTest, ApproachingLimitOnlyAboveThreshold) {
    auto cfg = make_budget(1000, 800, BudgetStrategy::Throw);

    auto near = BudgetPolicy::evaluate(900, cfg);
    EXPECT_EQ(near.decision, BudgetDecision::Proceed);
    EXPECT_TRUE(near.approaching_limit);

    auto at_threshold = BudgetPolicy::evaluate(800, cfg);
    EXPECT_FALSE(at_threshold.approaching_limit);

    auto low = BudgetPolicy::evaluate(10, cfg);
    EXPECT_EQ(low.decision, BudgetDecision::Proceed);
    EXPECT_FALSE(low.approaching_limit);
}

TEST(BudgetPolicyTest, VerdictCarriesFigures) {
    auto v = BudgetPolicy::evaluate(1234, make_budget(1000, 800, BudgetStrategy::Warn));
    EXPECT_EQ(v.estimate, 1234);
    EXPECT_EQ(v.max_tokens, 1000);
    EXPECT_FALSE(v.approaching_limit);
}

// ===========================================================================
// BudgetRegistry resolution
// ===========================================================================

TEST(BudgetRegistryTest, DefaultWhenNothingRegistered) {
    BudgetRegistry registry(make_budget(5000, 4000, BudgetStrategy::Ignore));
    auto cfg = registry.resolve("any", ToolCategory::General);
    EXPECT_EQ(cfg.max_tokens, 5000);
    EXPECT_EQ(cfg.strategy, BudgetStrategy::Ignore);
}

TEST(BudgetRegistryTest, ToolBeatsCategoryBeatsDefault) {
    BudgetRegistry registry;
    registry.set_category_budget(ToolCategory::Query, make_budget(3000, 2000, BudgetStrategy::Warn));
    registry.set_tool_budget("search", make_budget(2000, 1000, BudgetStrategy::Throw));

    EXPECT_EQ(registry.resolve("search", ToolCategory::Query).max_tokens, 2000);
    EXPECT_EQ(registry.resolve("lookup", ToolCategory::Query).max_tokens, 3000);
    EXPECT_EQ(registry.resolve("lookup", ToolCategory::Utility).max_tokens, 10000);

    EXPECT_TRUE(registry.clear_tool_budget("search"));
    EXPECT_FALSE(registry.clear_tool_budget("search"));
    EXPECT_EQ(registry.resolve("search", ToolCategory::Query).max_tokens, 3000);
}

TEST(BudgetRegistryTest, RejectsInvalidConfiguration) {
    BudgetRegistry registry;
    EXPECT_THROW(registry.set_tool_budget("x", make_budget(-5, 0, BudgetStrategy::Warn)),
                 std::invalid_argument);
    EXPECT_THROW(registry.set_default_budget(make_budget(100, 200, BudgetStrategy::Warn)),
                 std::invalid_argument);
    EXPECT_THROW(BudgetRegistry(make_budget(0, 0, BudgetStrategy::Warn)), std::invalid_argument);
}
