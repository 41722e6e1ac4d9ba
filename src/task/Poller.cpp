//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: task/Poller.cpp
// Purpose: Implement the mailbox drain that runs on every poll tick.
// Key invariants: fire() never blocks; it performs one tryTake().
// Ownership/Lifetime: See Poller.hpp.
//
//===----------------------------------------------------------------------===//

#include "task/Poller.hpp"

#include "support/log.hpp"

#include <string>
#include <utility>

namespace ite::task
{

Poller::Poller(TaskContext ctx,
               Scheduler &scheduler,
               std::chrono::milliseconds interval,
               bool discardStale)
    : ctx_(std::move(ctx)), scheduler_(scheduler), interval_(interval), discardStale_(discardStale)
{
}

void Poller::start()
{
    if (state_ != State::Idle)
    {
        return;
    }
    scheduleNext();
}

/// @brief Handle one timer expiry.
/// @details Takes at most one message. With stale discarding enabled a
///          message whose epoch precedes the last rendered one is dropped.
///          The next firing is scheduled unconditionally.
bool Poller::fire()
{
    state_ = State::Firing;
    bool rendered = false;
    if (std::optional<OutputMessage> msg = ctx_.mailbox->tryTake())
    {
        if (discardStale_ && msg->epoch < lastEpoch_)
        {
            log::debug("dropping stale result #" + std::to_string(msg->epoch) + " (showing #" +
                       std::to_string(lastEpoch_) + ")");
        }
        else
        {
            lastEpoch_ = msg->epoch;
            ctx_.sink.setOutput(msg->text);
            rendered = true;
        }
    }
    scheduleNext();
    return rendered;
}

void Poller::scheduleNext()
{
    state_ = State::Scheduled;
    scheduler_.runAfter(interval_, [this] { fire(); });
}

} // namespace ite::task
