#include <gtest/gtest.h>
#include <toolgov/toolgov.hpp>

#include <thread>

using namespace toolgov;

TEST(CancellationTest, DefaultTokenNeverCancels) {
    CancellationToken token;
    EXPECT_FALSE(token.can_be_cancelled());
    EXPECT_FALSE(token.is_cancellation_requested());
    EXPECT_NO_THROW(token.throw_if_cancellation_requested());
    EXPECT_FALSE(CancellationToken::none().can_be_cancelled());
}

TEST(CancellationTest, SourceFiresAllTokens) {
    CancellationSource source;
    auto t1 = source.token();
    auto t2 = source.token();
    EXPECT_TRUE(t1.can_be_cancelled());
    EXPECT_FALSE(t1.is_cancellation_requested());

    source.cancel();
    EXPECT_TRUE(source.is_cancellation_requested());
    EXPECT_TRUE(t1.is_cancellation_requested());
    EXPECT_TRUE(t2.is_cancellation_requested());
    EXPECT_THROW(t2.throw_if_cancellation_requested(), OperationCancelledException);
}

TEST(CancellationTest, CancelIsVisibleAcrossThreads) {
    CancellationSource source;
    auto token = source.token();
    std::thread canceller([&source] { source.cancel(); });
    canceller.join();
    EXPECT_TRUE(token.is_cancellation_requested());
}

TEST(CancellationTest, TokenOutlivesSource) {
    CancellationToken token;
    {
        CancellationSource source;
        token = source.token();
        source.cancel();
    }
    EXPECT_TRUE(token.is_cancellation_requested());
}

TEST(CancellationTest, CancellationIsNotAToolExecutionError) {
    try {
        throw OperationCancelledException();
    } catch (const ToolExecutionError&) {
        FAIL() << "cancellation must not be a ToolExecutionError";
    } catch (const OperationCancelledException& e) {
        EXPECT_STREQ(e.what(), "Operation was cancelled");
    }
}
