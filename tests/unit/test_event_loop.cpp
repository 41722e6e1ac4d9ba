// File: tests/unit/test_event_loop.cpp
// Purpose: Verify timer ordering, rescheduling from callbacks, readable
//          descriptor dispatch and quit handling of the UI event loop.
// Key invariants: Callbacks run on the calling thread in deadline order, ties
//                 broken by scheduling order.
// Ownership/Lifetime: Pipes created by a test are closed by that test.
// Links: src/ui/EventLoop.cpp

#include "ui/EventLoop.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace ite::ui;
using namespace std::chrono_literals;

TEST(EventLoop, ZeroDelayTimersFireInSchedulingOrder)
{
    EventLoop loop;
    std::vector<int> order;
    for (int i = 0; i < 5; ++i)
        loop.runAfter(0ms, [&order, i] { order.push_back(i); });

    EXPECT_EQ(loop.runOnce(0ms), 5u);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
    EXPECT_EQ(loop.pendingTimers(), 0u);
}

TEST(EventLoop, EarlierDeadlineFiresFirst)
{
    EventLoop loop;
    std::vector<std::string> order;
    loop.runAfter(30ms, [&] { order.push_back("late"); });
    loop.runAfter(5ms, [&] { order.push_back("early"); });

    const auto deadline = EventLoop::Clock::now() + 2s;
    while (order.size() < 2 && EventLoop::Clock::now() < deadline)
        loop.runOnce(50ms);

    EXPECT_EQ(order, (std::vector<std::string>{"early", "late"}));
}

TEST(EventLoop, TimerDoesNotFireEarly)
{
    EventLoop loop;
    bool fired = false;
    loop.runAfter(1h, [&] { fired = true; });

    EXPECT_EQ(loop.runOnce(0ms), 0u);
    EXPECT_FALSE(fired);
    EXPECT_EQ(loop.pendingTimers(), 1u);
}

TEST(EventLoop, NegativeDelayIsTreatedAsImmediate)
{
    EventLoop loop;
    bool fired = false;
    loop.runAfter(-5ms, [&] { fired = true; });
    loop.runOnce(0ms);
    EXPECT_TRUE(fired);
}

TEST(EventLoop, CallbackRescheduledWithZeroDelayWaitsForNextPass)
{
    EventLoop loop;
    int ticks = 0;
    std::function<void()> tick = [&]
    {
        ++ticks;
        loop.post(tick);
    };
    loop.post(tick);

    EXPECT_EQ(loop.runOnce(0ms), 1u);
    EXPECT_EQ(ticks, 1);
    EXPECT_EQ(loop.pendingTimers(), 1u);
    loop.runOnce(0ms);
    EXPECT_EQ(ticks, 2);
}

TEST(EventLoop, RunStopsWhenQuitIsCalled)
{
    EventLoop loop;
    int ticks = 0;
    std::function<void()> tick = [&]
    {
        if (++ticks == 3)
            loop.quit();
        else
            loop.runAfter(1ms, tick);
    };
    loop.post(tick);

    loop.run();
    EXPECT_EQ(ticks, 3);
    EXPECT_TRUE(loop.quitRequested());
}

TEST(EventLoop, DispatchesReadableDescriptor)
{
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);

    EventLoop loop;
    std::string received;
    loop.watchReadable(fds[0],
                       [&]
                       {
                           char buf[16];
                           const ssize_t n = ::read(fds[0], buf, sizeof(buf));
                           if (n > 0)
                               received.append(buf, static_cast<std::size_t>(n));
                       });

    EXPECT_EQ(loop.runOnce(0ms), 0u);

    ASSERT_EQ(::write(fds[1], "hi", 2), 2);
    EXPECT_EQ(loop.runOnce(1s), 1u);
    EXPECT_EQ(received, "hi");

    loop.unwatch();
    ASSERT_EQ(::write(fds[1], "x", 1), 1);
    EXPECT_EQ(loop.runOnce(0ms), 0u);
    EXPECT_EQ(received, "hi");

    ::close(fds[0]);
    ::close(fds[1]);
}

TEST(EventLoop, WaitIsCutShortByTimerDeadline)
{
    EventLoop loop;
    bool fired = false;
    loop.runAfter(10ms, [&] { fired = true; });

    const auto start = EventLoop::Clock::now();
    const auto deadline = start + 2s;
    while (!fired && EventLoop::Clock::now() < deadline)
        loop.runOnce(10s);

    EXPECT_TRUE(fired);
    EXPECT_LT(EventLoop::Clock::now() - start, 2s);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
