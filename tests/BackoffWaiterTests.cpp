// Tests for the interruptible sleep used between cast attempts.

#include "cast/BackoffWaiter.h"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>

using std::chrono::milliseconds;
using std::chrono::steady_clock;

TEST(InterruptibleBackoffWaiterTest, ReturnsTrueAfterDelay)
{
    InterruptibleBackoffWaiter waiter;

    auto before = steady_clock::now();
    EXPECT_TRUE(waiter.waitFor(milliseconds(30)));
    EXPECT_GE(steady_clock::now() - before, milliseconds(30));
}

TEST(InterruptibleBackoffWaiterTest, ZeroDelayReturnsAtOnce)
{
    InterruptibleBackoffWaiter waiter;
    EXPECT_TRUE(waiter.waitFor(milliseconds(0)));
}

TEST(InterruptibleBackoffWaiterTest, InterruptWakesBlockedWaiter)
{
    InterruptibleBackoffWaiter waiter;

    auto before = steady_clock::now();
    std::future<bool> waited = std::async(std::launch::async, [&waiter]() {
        return waiter.waitFor(milliseconds(10000));
    });

    std::this_thread::sleep_for(milliseconds(20));
    waiter.interrupt();

    ASSERT_EQ(waited.wait_for(milliseconds(2000)), std::future_status::ready);
    EXPECT_FALSE(waited.get());
    EXPECT_LT(steady_clock::now() - before, milliseconds(5000));
}

TEST(InterruptibleBackoffWaiterTest, LaterWaitsFailAfterInterrupt)
{
    InterruptibleBackoffWaiter waiter;
    waiter.interrupt();

    auto before = steady_clock::now();
    EXPECT_FALSE(waiter.waitFor(milliseconds(10000)));
    EXPECT_FALSE(waiter.waitFor(milliseconds(10000)));
    EXPECT_LT(steady_clock::now() - before, milliseconds(1000));
}
