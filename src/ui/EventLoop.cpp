//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ui/EventLoop.cpp
// Purpose: Implement the timer queue and input wait of the UI event loop.
// Key invariants: runOnce() never sleeps past the earliest timer deadline.
// Ownership/Lifetime: See EventLoop.hpp.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Cooperative UI loop.
/// @details Each pass waits in poll(2) for the watched descriptor, bounded by
///          the earliest timer deadline, then dispatches input followed by all
///          timers whose deadline has passed. Callbacks are free to schedule
///          more timers; those are considered on the next pass.

#include "ui/EventLoop.hpp"

#include "support/log.hpp"

#include <algorithm>
#include <cerrno>
#include <string>
#include <system_error>
#include <utility>

#include <poll.h>

namespace ite::ui
{

void EventLoop::runAfter(std::chrono::milliseconds delay, std::function<void()> callback)
{
    if (delay.count() < 0)
    {
        delay = std::chrono::milliseconds{0};
    }
    timers_.push(Timer{Clock::now() + delay, nextSeq_++, std::move(callback)});
}

void EventLoop::watchReadable(int fd, std::function<void()> onReadable)
{
    watchFd_ = fd;
    onReadable_ = std::move(onReadable);
}

void EventLoop::unwatch()
{
    watchFd_ = -1;
    onReadable_ = nullptr;
}

std::size_t EventLoop::fireDueTimers()
{
    // Snapshot the due set first so callbacks that reschedule with a zero
    // delay cannot starve the loop.
    const Clock::time_point now = Clock::now();
    std::vector<Timer> due;
    while (!timers_.empty() && timers_.top().due <= now)
    {
        due.push_back(timers_.top());
        timers_.pop();
    }
    for (auto &t : due)
    {
        t.callback();
    }
    return due.size();
}

/// @brief One pass of the loop.
/// @details Step-by-step summary:
///          1. Clamp the wait to the earliest timer deadline.
///          2. poll(2) the watched descriptor, or sleep in poll with no
///             descriptors when none is watched.
///          3. Dispatch the input callback on readiness or hang-up.
///          4. Fire every due timer in deadline/sequence order.
std::size_t EventLoop::runOnce(std::chrono::milliseconds maxWait)
{
    auto wait = maxWait;
    if (!timers_.empty())
    {
        const auto untilDue =
            std::chrono::duration_cast<std::chrono::milliseconds>(timers_.top().due - Clock::now());
        wait = std::clamp(untilDue, std::chrono::milliseconds{0}, maxWait);
        // Round a sub-millisecond remainder up so we do not spin.
        if (wait.count() == 0 && timers_.top().due > Clock::now())
        {
            wait = std::chrono::milliseconds{1};
        }
    }

    std::size_t dispatched = 0;
    pollfd pfd{watchFd_, POLLIN, 0};
    const nfds_t count = watchFd_ >= 0 ? 1 : 0;
    const int rc = ::poll(count ? &pfd : nullptr, count, static_cast<int>(wait.count()));
    if (rc < 0 && errno != EINTR)
    {
        log::error("poll: " + std::error_code(errno, std::generic_category()).message());
    }
    else if (rc > 0 && (pfd.revents & POLLNVAL) != 0)
    {
        log::warn("watched descriptor " + std::to_string(watchFd_) + " is not open");
        unwatch();
    }
    else if (rc > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0 && onReadable_)
    {
        auto handler = onReadable_;
        handler();
        ++dispatched;
    }

    dispatched += fireDueTimers();
    return dispatched;
}

void EventLoop::run()
{
    quit_ = false;
    while (!quit_)
    {
        runOnce(std::chrono::milliseconds{1000});
    }
}

} // namespace ite::ui
