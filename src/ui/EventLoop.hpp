//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ui/EventLoop.hpp
// Purpose: Single-threaded cooperative loop driving timers and console input.
// Key invariants:
//   - Every callback runs on the thread that calls run()/runOnce().
//   - Timers due at the same instant fire in the order they were scheduled.
//   - Timers scheduled from inside a callback never fire in the same pass.
// Ownership/Lifetime: The loop owns queued callbacks; it borrows the watched
//                     descriptor, which the caller keeps open.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "task/TaskContext.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <queue>
#include <vector>

namespace ite::ui
{

/// @brief UI-thread event loop implementing the task scheduler interface.
class EventLoop final : public task::Scheduler
{
  public:
    using Clock = std::chrono::steady_clock;

    EventLoop() = default;
    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    /// @brief Queue @p callback to run once after @p delay.
    void runAfter(std::chrono::milliseconds delay, std::function<void()> callback) override;

    /// @brief Queue @p callback for the next pass.
    void post(std::function<void()> callback)
    {
        runAfter(std::chrono::milliseconds{0}, std::move(callback));
    }

    /// @brief Invoke @p onReadable whenever @p fd becomes readable or hangs up.
    /// @note Only one descriptor is watched; a second call replaces the first.
    void watchReadable(int fd, std::function<void()> onReadable);

    /// @brief Stop watching the descriptor registered with watchReadable().
    void unwatch();

    /// @brief Wait up to @p maxWait for input or a timer and dispatch what is ready.
    /// @return Number of callbacks invoked.
    std::size_t runOnce(std::chrono::milliseconds maxWait);

    /// @brief Dispatch until quit() is called.
    void run();

    /// @brief Make run() return after the current pass.
    void quit()
    {
        quit_ = true;
    }

    bool quitRequested() const noexcept
    {
        return quit_;
    }

    /// @brief Number of timers that have not fired yet.
    std::size_t pendingTimers() const noexcept
    {
        return timers_.size();
    }

  private:
    struct Timer
    {
        Clock::time_point due;
        std::uint64_t seq;
        std::function<void()> callback;
    };

    struct Later
    {
        bool operator()(const Timer &a, const Timer &b) const
        {
            if (a.due != b.due)
                return a.due > b.due;
            return a.seq > b.seq;
        }
    };

    std::size_t fireDueTimers();

    std::priority_queue<Timer, std::vector<Timer>, Later> timers_;
    std::uint64_t nextSeq_ = 0;
    int watchFd_ = -1;
    std::function<void()> onReadable_;
    bool quit_ = false;
};

} // namespace ite::ui
