#include <gtest/gtest.h>
#include <toolgov/toolgov.hpp>

#include <atomic>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace toolgov;

namespace {

struct ConnectionParams {
    std::string query;
};

void from_json(const nlohmann::json& j, ConnectionParams& p) {
    j.at("query").get_to(p.query);
}

// Counts how often each teardown step runs
class ConnectionTool : public ScopedResourceTool<ConnectionParams, std::string> {
public:
    explicit ConnectionTool(bool release_on_failure = false)
        : ScopedResourceTool("connection", "Queries a single-use connection",
                             ToolCategory::Resources, release_on_failure) {}

    std::atomic<int> managed_releases{0};
    std::atomic<int> unmanaged_releases{0};
    std::vector<std::string> order;
    bool fail_managed = false;
    bool fail_body = false;

protected:
    std::string run(const ConnectionParams& p, const CancellationToken&) override {
        if (fail_body) throw std::runtime_error("connection reset");
        return "rows for " + p.query;
    }

    void release_managed() override {
        managed_releases++;
        order.push_back("managed");
        if (fail_managed) throw std::runtime_error("buffer flush failed");
    }

    void release_unmanaged() override {
        unmanaged_releases++;
        order.push_back("unmanaged");
    }
};

} // namespace

// ===========================================================================
// Release discipline
// ===========================================================================

TEST(ResourceLifecycleTest, ReleaseIsIdempotent) {
    ConnectionTool tool;
    EXPECT_FALSE(tool.is_released());

    tool.release();
    EXPECT_NO_THROW(tool.release());

    EXPECT_TRUE(tool.is_released());
    EXPECT_EQ(tool.managed_releases.load(), 1);
    EXPECT_EQ(tool.unmanaged_releases.load(), 1);
}

TEST(ResourceLifecycleTest, ReleaseAsyncTwiceReleasesOnce) {
    ConnectionTool tool;
    auto f1 = tool.release_async();
    auto f2 = tool.release_async();
    f1.get();
    f2.get();
    EXPECT_EQ(tool.managed_releases.load(), 1);
    EXPECT_EQ(tool.unmanaged_releases.load(), 1);
}

TEST(ResourceLifecycleTest, ConcurrentReleaseRunsTeardownOnce) {
    ConnectionTool tool;
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&tool] { tool.release(); });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(tool.managed_releases.load(), 1);
    EXPECT_EQ(tool.unmanaged_releases.load(), 1);
}

TEST(ResourceLifecycleTest, ManagedBeforeUnmanaged) {
    ConnectionTool tool;
    tool.release();
    EXPECT_EQ(tool.order, (std::vector<std::string>{"managed", "unmanaged"}));
}

TEST(ResourceLifecycleTest, UnmanagedStillRunsWhenManagedThrows) {
    ConnectionTool tool;
    tool.fail_managed = true;

    EXPECT_THROW(tool.release(), std::runtime_error);
    EXPECT_EQ(tool.unmanaged_releases.load(), 1);
    EXPECT_TRUE(tool.is_released());

    // Not retried
    EXPECT_NO_THROW(tool.release());
    EXPECT_EQ(tool.managed_releases.load(), 1);
}

// ===========================================================================
// Interaction with the governor
// ===========================================================================

TEST(ResourceLifecycleTest, InvokeAfterReleaseFailsFast) {
    ExecutionGovernor governor;
    ConnectionTool tool;
    tool.release();

    auto result = governor.try_invoke(tool, {{"query", "select 1"}});
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error->code, error_codes::ToolReleased);
    EXPECT_THROW(governor.invoke(tool, {{"query", "select 1"}}), ToolReleasedError);
}

TEST(ResourceLifecycleTest, StaysAliveAfterFailureByDefault) {
    ExecutionGovernor governor;
    ConnectionTool tool;
    tool.fail_body = true;

    auto result = governor.try_invoke(tool, {{"query", "select 1"}});
    EXPECT_EQ(result.error->code, error_codes::ToolError);
    EXPECT_FALSE(tool.is_released());

    tool.fail_body = false;
    EXPECT_EQ(governor.invoke(tool, {{"query", "q"}}), "rows for q");
    tool.release();
}

TEST(ResourceLifecycleTest, ReleaseOnFailurePolicy) {
    ExecutionGovernor governor;
    ConnectionTool tool(true);
    EXPECT_TRUE(tool.release_on_failure());
    tool.fail_body = true;

    auto failed = governor.try_invoke(tool, {{"query", "select 1"}});
    EXPECT_TRUE(failed.failed());
    EXPECT_TRUE(tool.is_released());
    EXPECT_EQ(tool.unmanaged_releases.load(), 1);

    auto next = governor.try_invoke(tool, {{"query", "select 1"}});
    EXPECT_EQ(next.error->code, error_codes::ToolReleased);
}

TEST(ResourceLifecycleTest, LeakIsReported) {
    struct Capture : Monitor {
        std::atomic<int> leaks{0};
        void on_event(const MonitorEvent& e) override {
            if (e.type == EventType::ToolLeaked) leaks++;
        }
    };
    auto capture = std::make_shared<Capture>();
    {
        ConnectionTool tool;
        tool.set_lifecycle_monitor(capture);
    }
    EXPECT_EQ(capture->leaks.load(), 1);

    {
        ConnectionTool tool;
        tool.set_lifecycle_monitor(capture);
        tool.release();
    }
    EXPECT_EQ(capture->leaks.load(), 1);
}
