#include <gtest/gtest.h>
#include "sync/cancel_scope.h"

#include <atomic>
#include <chrono>
#include <thread>

namespace auctionsim {
namespace test {

using namespace std::chrono_literals;

TEST(CancelScope, BackgroundNeverExpires) {
    auto root = CancelScope::background();
    EXPECT_FALSE(root.done());
    EXPECT_FALSE(root.cancelled());
    EXPECT_FALSE(root.hasDeadline());
    EXPECT_EQ(root.remaining(), std::chrono::nanoseconds::max());
}

TEST(CancelScope, TimeoutExpires) {
    auto root = CancelScope::background();
    auto scope = CancelScope::withTimeout(root, 30ms);
    EXPECT_TRUE(scope.hasDeadline());
    EXPECT_FALSE(scope.done());

    scope.wait();
    EXPECT_TRUE(scope.done());
    EXPECT_FALSE(scope.cancelled());
    EXPECT_EQ(scope.remaining(), std::chrono::nanoseconds::zero());
}

TEST(CancelScope, ChildDeadlineCappedByParent) {
    auto root = CancelScope::background();
    auto parent = CancelScope::withTimeout(root, 50ms);
    auto child = CancelScope::withTimeout(parent, 10s);
    EXPECT_EQ(child.deadline(), parent.deadline());

    auto shorter = CancelScope::withTimeout(parent, 5ms);
    EXPECT_LT(shorter.deadline(), parent.deadline());
}

TEST(CancelScope, CancelPropagatesToChildren) {
    auto root = CancelScope::background();
    auto a = CancelScope::withTimeout(root, 10s);
    auto b = CancelScope::withTimeout(a, 10s);

    root.cancel();
    EXPECT_TRUE(a.cancelled());
    EXPECT_TRUE(b.cancelled());
    EXPECT_TRUE(b.done());
}

TEST(CancelScope, CancelChildLeavesParentLive) {
    auto root = CancelScope::background();
    auto child = CancelScope::withTimeout(root, 10s);
    child.cancel();
    EXPECT_TRUE(child.done());
    EXPECT_FALSE(root.done());
}

TEST(CancelScope, ChildOfCancelledParentIsBornCancelled) {
    auto root = CancelScope::background();
    root.cancel();
    auto child = CancelScope::withTimeout(root, 10s);
    EXPECT_TRUE(child.cancelled());
}

TEST(CancelScope, CopiesShareState) {
    auto root = CancelScope::background();
    auto scope = CancelScope::withTimeout(root, 10s);
    CancelScope copy = scope;
    copy.cancel();
    EXPECT_TRUE(scope.cancelled());
}

TEST(CancelScope, SleepForCompletesWithinDeadline) {
    auto root = CancelScope::background();
    auto scope = CancelScope::withTimeout(root, 1s);
    auto t0 = SteadyClock::now();
    EXPECT_TRUE(scope.sleepFor(20ms));
    EXPECT_GE(SteadyClock::now() - t0, 20ms);
}

TEST(CancelScope, SleepForCutShortByDeadline) {
    auto root = CancelScope::background();
    auto scope = CancelScope::withTimeout(root, 30ms);
    auto t0 = SteadyClock::now();
    EXPECT_FALSE(scope.sleepFor(2s));
    EXPECT_LT(SteadyClock::now() - t0, 1s);
}

TEST(CancelScope, SleepForCutShortByCancel) {
    auto root = CancelScope::background();
    auto scope = CancelScope::withTimeout(root, 10s);

    std::thread canceller([root]() {
        std::this_thread::sleep_for(20ms);
        root.cancel();
    });

    auto t0 = SteadyClock::now();
    EXPECT_FALSE(scope.sleepFor(5s));
    EXPECT_LT(SteadyClock::now() - t0, 2s);
    canceller.join();
}

TEST(CancelScope, SubscribeFiresOnCancel) {
    auto scope = CancelScope::background();
    std::atomic<int> fired{0};
    auto sub = scope.subscribe([&fired] { ++fired; });

    scope.cancel();
    scope.cancel();
    EXPECT_EQ(fired.load(), 1);
}

TEST(CancelScope, SubscribeAfterCancelRunsImmediately) {
    auto scope = CancelScope::background();
    scope.cancel();
    bool fired = false;
    auto sub = scope.subscribe([&fired] { fired = true; });
    EXPECT_TRUE(fired);
}

TEST(CancelScope, DestroyedSubscriptionDoesNotFire) {
    auto scope = CancelScope::background();
    bool fired = false;
    {
        auto sub = scope.subscribe([&fired] { fired = true; });
    }
    scope.cancel();
    EXPECT_FALSE(fired);
}

TEST(CancelScope, ManyShortLivedChildren) {
    auto root = CancelScope::background();
    for (int i = 0; i < 2000; ++i) {
        auto child = CancelScope::withTimeout(root, 1s);
        EXPECT_FALSE(child.done());
    }
    root.cancel();
    EXPECT_TRUE(root.done());
}

}  // namespace test
}  // namespace auctionsim
