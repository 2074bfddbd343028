#include <gtest/gtest.h>
#include <toolgov/toolgov.hpp>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace toolgov;

namespace {

class NamedTool : public TypedTool<nlohmann::json, std::string> {
public:
    explicit NamedTool(const std::string& name, ToolCategory category = ToolCategory::General)
        : TypedTool(name, "Returns its own name", category) {}

protected:
    std::string run(const nlohmann::json& params, const CancellationToken&) override {
        if (params.contains("fail")) {
            throw std::runtime_error(params["fail"].get<std::string>());
        }
        return name();
    }
};

// Appends its name to a shared log on release
class HandleTool : public ScopedResourceTool<nlohmann::json, std::string> {
public:
    HandleTool(const std::string& name, std::shared_ptr<std::vector<std::string>> log,
               bool fail = false)
        : ScopedResourceTool(name, "Holds a handle"), log_(std::move(log)), fail_(fail) {}

protected:
    std::string run(const nlohmann::json&, const CancellationToken&) override { return "ok"; }

    void release_unmanaged() override {
        log_->push_back(name());
        if (fail_) throw std::runtime_error("handle already closed");
    }

private:
    std::shared_ptr<std::vector<std::string>> log_;
    bool fail_;
};

} // namespace

// ===========================================================================
// Registration
// ===========================================================================

TEST(ToolRegistryTest, RegisterFindAndList) {
    ToolRegistry registry;
    registry.register_tool(std::make_shared<NamedTool>("alpha"));
    registry.register_tool(std::make_shared<NamedTool>("beta"));

    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.tool_names(), (std::vector<std::string>{"alpha", "beta"}));
    ASSERT_NE(registry.find("alpha"), nullptr);
    EXPECT_EQ(registry.find("gamma"), nullptr);
    EXPECT_THROW(registry.get("gamma"), ToolNotFoundException);
}

TEST(ToolRegistryTest, DuplicateNameRejected) {
    ToolRegistry registry;
    registry.register_tool(std::make_shared<NamedTool>("alpha"));
    EXPECT_THROW(registry.register_tool(std::make_shared<NamedTool>("alpha")),
                 ToolAlreadyRegisteredException);
    EXPECT_THROW(registry.register_tool(nullptr), std::invalid_argument);
}

TEST(ToolRegistryTest, EmptyToolNameRejected) {
    EXPECT_THROW(NamedTool("  "), std::invalid_argument);
}

TEST(ToolRegistryTest, Unregister) {
    ToolRegistry registry;
    registry.register_tool(std::make_shared<NamedTool>("alpha"));
    EXPECT_TRUE(registry.unregister_tool("alpha"));
    EXPECT_FALSE(registry.unregister_tool("alpha"));
    EXPECT_EQ(registry.size(), 0u);
}

// ===========================================================================
// Invocation by name
// ===========================================================================

TEST(ToolRegistryTest, InvokeByName) {
    ToolRegistry registry;
    registry.register_tool(std::make_shared<NamedTool>("alpha"));

    auto result = registry.invoke("alpha", nlohmann::json::object());
    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.value, "alpha");
}

TEST(ToolRegistryTest, UnknownNameIsToolNotFound) {
    ToolRegistry registry;
    auto result = registry.invoke("missing", nlohmann::json::object());
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error->code, error_codes::ToolNotFound);
    EXPECT_FALSE(result.error->recovery.steps.empty());
    EXPECT_THROW(result.value_or_throw(), ToolExecutionError);
}

TEST(ToolRegistryTest, FailureSuggestsRegisteredAlternatives) {
    ToolRegistry registry;
    registry.register_tool(std::make_shared<NamedTool>("reader"));
    registry.register_tool(std::make_shared<NamedTool>("file_search"));

    auto result = registry.invoke("reader", {{"fail", "File not found: notes.md"}});
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error->code, error_codes::FileNotFound);
    ASSERT_EQ(result.error->recovery.suggested_actions.size(), 1u);
    EXPECT_EQ(result.error->recovery.suggested_actions[0].tool, "file_search");
}

TEST(ToolRegistryTest, CategoryBudgetApplies) {
    ToolRegistry registry;
    BudgetConfiguration tiny;
    tiny.max_tokens = 10;
    tiny.warning_threshold = 5;
    tiny.strategy = BudgetStrategy::Throw;
    registry.budgets().set_category_budget(ToolCategory::Query, tiny);

    registry.register_tool(std::make_shared<NamedTool>("search", ToolCategory::Query));
    registry.register_tool(std::make_shared<NamedTool>("other"));

    EXPECT_EQ(registry.invoke("search", nlohmann::json::object()).error->code,
              error_codes::ResourceLimitExceeded);
    EXPECT_TRUE(registry.invoke("other", nlohmann::json::object()).succeeded());
}

TEST(ToolRegistryTest, GlobalMiddlewareSeesEveryTool) {
    ToolRegistry registry;
    auto counter = std::make_shared<TokenCountingMiddleware>();
    registry.add_middleware(counter);
    registry.register_tool(std::make_shared<NamedTool>("alpha"));
    registry.register_tool(std::make_shared<NamedTool>("beta"));

    registry.invoke("alpha", nlohmann::json::object());
    registry.invoke("beta", nlohmann::json::object());
    EXPECT_EQ(counter->totals().completed, 2u);
}

// ===========================================================================
// Shutdown
// ===========================================================================

TEST(ToolRegistryTest, ReleaseAllInReverseRegistrationOrder) {
    auto log = std::make_shared<std::vector<std::string>>();
    {
        ToolRegistry registry;
        registry.register_tool(std::make_shared<HandleTool>("first", log));
        registry.register_tool(std::make_shared<NamedTool>("plain"));
        registry.register_tool(std::make_shared<HandleTool>("second", log));

        registry.release_all();
        EXPECT_EQ(*log, (std::vector<std::string>{"second", "first"}));
    }
    // Destructor releases again; already released tools are no-ops
    EXPECT_EQ(log->size(), 2u);
}

TEST(ToolRegistryTest, DestructorReleases) {
    auto log = std::make_shared<std::vector<std::string>>();
    auto tool = std::make_shared<HandleTool>("held", log);
    {
        ToolRegistry registry;
        registry.register_tool(tool);
    }
    EXPECT_TRUE(tool->is_released());
    EXPECT_EQ(*log, (std::vector<std::string>{"held"}));
}

TEST(ToolRegistryTest, ReleaseFailuresAreLoggedNotThrown) {
    struct Capture : Monitor {
        std::atomic<int> release_failures{0};
        void on_event(const MonitorEvent& e) override {
            if (e.type == EventType::ToolReleaseFailed) release_failures++;
        }
    };
    auto capture = std::make_shared<Capture>();
    auto log = std::make_shared<std::vector<std::string>>();

    ToolRegistry registry(GovernorConfig{}, ErrorRecoveryOptions{}, capture);
    registry.register_tool(std::make_shared<HandleTool>("broken", log, true));
    registry.register_tool(std::make_shared<HandleTool>("fine", log));

    EXPECT_NO_THROW(registry.release_all());
    EXPECT_EQ(*log, (std::vector<std::string>{"fine", "broken"}));
    EXPECT_GE(capture->release_failures.load(), 1);
}

TEST(ToolRegistryTest, UnregisterReleasesScopedTool) {
    auto log = std::make_shared<std::vector<std::string>>();
    auto tool = std::make_shared<HandleTool>("conn", log);
    ToolRegistry registry;
    registry.register_tool(tool);

    EXPECT_TRUE(registry.unregister_tool("conn"));
    EXPECT_TRUE(tool->is_released());
}
