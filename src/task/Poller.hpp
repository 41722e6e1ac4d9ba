//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: task/Poller.hpp
// Purpose: Recurring UI-thread tick that drains the result mailbox.
// Key invariants:
//   - The poller is the only consumer of the mailbox and the only code that
//     renders task results.
//   - Every firing reschedules exactly one next firing, whether or not a
//     message was present.
// Ownership/Lifetime: Borrows the scheduler and the context's sink; the
//                     scheduled callbacks capture `this`, so the poller must
//                     outlive the scheduler's pending timers.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "task/TaskContext.hpp"

#include <chrono>
#include <cstdint>

namespace ite::task
{

/// @brief Polling cadence used when none is configured.
inline constexpr std::chrono::milliseconds kDefaultPollInterval{100};

/// @brief Self-rescheduling mailbox drain.
class Poller
{
  public:
    enum class State
    {
        Idle,      ///< Not yet started.
        Scheduled, ///< Waiting for the next timer.
        Firing     ///< Inside fire().
    };

    /// @param discardStale When true, messages from epochs older than the last
    ///        displayed one are dropped instead of rendered.
    Poller(TaskContext ctx,
           Scheduler &scheduler,
           std::chrono::milliseconds interval = kDefaultPollInterval,
           bool discardStale = false);

    Poller(const Poller &) = delete;
    Poller &operator=(const Poller &) = delete;

    /// @brief Schedule the first firing; later calls are ignored.
    void start();

    /// @brief Drain the mailbox once and schedule the next firing.
    /// @return True when a message was rendered.
    bool fire();

    State state() const noexcept
    {
        return state_;
    }

    std::chrono::milliseconds interval() const noexcept
    {
        return interval_;
    }

    /// @brief Epoch of the most recently rendered message (0 before any).
    std::uint64_t lastDisplayedEpoch() const noexcept
    {
        return lastEpoch_;
    }

  private:
    void scheduleNext();

    TaskContext ctx_;
    Scheduler &scheduler_;
    std::chrono::milliseconds interval_;
    bool discardStale_;
    State state_ = State::Idle;
    std::uint64_t lastEpoch_ = 0;
};

} // namespace ite::task
