#include <atomic>
#include <chrono>
#include <thread>
#include <gtest/gtest.h>
#include "core/concurrency/cancel_token.hpp"

namespace {

using hive::core::concurrency::CancelToken;

TEST(CancelTokenTest, CopiesShareState) {
    CancelToken token;
    CancelToken copy = token;
    EXPECT_FALSE(copy.is_cancelled());

    token.cancel();
    EXPECT_TRUE(copy.is_cancelled());
}

TEST(CancelTokenTest, CallbacksRunExactlyOnce) {
    CancelToken token;
    int calls = 0;
    token.on_cancel([&calls] { ++calls; });

    token.cancel();
    token.cancel();
    EXPECT_EQ(calls, 1);
}

TEST(CancelTokenTest, CallbackRegisteredAfterCancelRunsImmediately) {
    CancelToken token;
    token.cancel();

    bool ran = false;
    token.on_cancel([&ran] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(CancelTokenTest, RemovedCallbackDoesNotRun) {
    CancelToken token;
    bool ran = false;
    const auto id = token.on_cancel([&ran] { ran = true; });
    token.remove_callback(id);

    token.cancel();
    EXPECT_FALSE(ran);
}

TEST(CancelTokenTest, ChildFollowsParentButNotTheOtherWay) {
    CancelToken parent;
    CancelToken first = parent.child();
    CancelToken second = parent.child();

    first.cancel();
    EXPECT_TRUE(first.is_cancelled());
    EXPECT_FALSE(parent.is_cancelled());
    EXPECT_FALSE(second.is_cancelled());

    parent.cancel();
    EXPECT_TRUE(second.is_cancelled());
}

TEST(CancelTokenTest, DroppedChildrenDoNotAccumulateOnParent) {
    CancelToken parent;
    for (int i = 0; i < 100; ++i) {
        CancelToken child = parent.child();
        EXPECT_EQ(parent.pending_callbacks(), 1u);
    }
    EXPECT_EQ(parent.pending_callbacks(), 0u);

    CancelToken live = parent.child();
    CancelToken copy = live;
    live = CancelToken();
    EXPECT_EQ(parent.pending_callbacks(), 1u);

    parent.cancel();
    EXPECT_TRUE(copy.is_cancelled());
    EXPECT_EQ(parent.pending_callbacks(), 0u);
}

TEST(CancelTokenTest, WaitForTimesOutWithoutCancellation) {
    CancelToken token;
    EXPECT_FALSE(token.wait_for(std::chrono::milliseconds(10)));
}

TEST(CancelTokenTest, WaitForWakesOnCancellation) {
    CancelToken token;
    std::thread canceller([token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.cancel();
    });

    const auto started = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.wait_for(std::chrono::seconds(5)));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    canceller.join();
}

}  // namespace
