//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: task/TaskRunner.cpp
// Purpose: Implement the UI-side entry point for build/run and the body of
//          the background task thread.
// Key invariants: Failures inside a task thread are converted to display text
//                 and delivered through the mailbox; they never propagate to
//                 the UI thread.
// Ownership/Lifetime: See TaskRunner.hpp.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Background execution of build and run commands.
/// @details The UI thread performs the synchronous part of a request:
///          precondition checks, saving, and painting the placeholder. The
///          blocking part (process execution, formatting and delivery) runs on
///          a detached thread that shares only the mailbox with the UI.

#include "task/TaskRunner.hpp"

#include "support/log.hpp"
#include "task/ResultFormatter.hpp"

#include <exception>
#include <system_error>
#include <thread>
#include <utility>

namespace ite::task
{

TaskRunner::TaskRunner(TaskContext ctx, std::shared_ptr<ProcessInvoker> invoker, CommandSet commands)
    : ctx_(std::move(ctx)), shared_(std::make_shared<Shared>()), commands_(std::move(commands))
{
    shared_->mailbox = ctx_.mailbox;
    shared_->invoker = std::move(invoker);
}

std::size_t TaskRunner::inFlight() const noexcept
{
    return shared_->inFlight.load(std::memory_order_acquire);
}

const std::vector<std::string> &TaskRunner::commandFor(Operation op) const
{
    return op == Operation::Build ? commands_.build : commands_.run;
}

/// @brief Begin one build or run request.
/// @details Step-by-step summary:
///          1. Without a file context, show @ref kNoFileMessage and stop.
///          2. Save a modified document so the command sees on-disk content;
///             a failed save is reported and stops the request.
///          3. Replace the output view with the operation's placeholder.
///          4. Spawn a detached thread running @ref execute.
/// @return True when a task thread was started.
bool TaskRunner::start(Operation op)
{
    const char *label = operationLabel(op);
    const std::optional<std::string> dir = ctx_.editor.currentDirectory();
    if (!dir)
    {
        log::debug(std::string(label) + " rejected: no file");
        ctx_.sink.showError(kNoFileMessage);
        return false;
    }

    if (ctx_.editor.isModified())
    {
        const support::Result<void> saved = ctx_.editor.save();
        if (!saved)
        {
            log::warn(std::string(label) + " aborted: " + saved.error());
            ctx_.sink.showError("Error saving file: " + saved.error());
            return false;
        }
    }

    ctx_.sink.setOutput(operationPlaceholder(op));

    CommandRequest request(commandFor(op), *dir);
    const std::uint64_t epoch = ++lastEpoch_;
    log::info("starting " + std::string(label) + " #" + std::to_string(epoch) + ": " +
              request.describe());

    shared_->inFlight.fetch_add(1, std::memory_order_acq_rel);
    try
    {
        std::thread(&TaskRunner::execute, shared_, op, std::move(request), epoch).detach();
    }
    catch (const std::system_error &ex)
    {
        shared_->inFlight.fetch_sub(1, std::memory_order_acq_rel);
        log::error(std::string("cannot start task thread: ") + ex.what());
        ctx_.sink.showError(std::string("Could not start ") + label + ": " + ex.what());
        return false;
    }
    return true;
}

/// @brief Body of a task thread: invoke, format, offer.
/// @details The in-flight counter is released only after the offer so an
///          observer that sees zero in-flight tasks also sees every result
///          that will ever be delivered.
void TaskRunner::execute(std::shared_ptr<Shared> shared,
                         Operation op,
                         CommandRequest request,
                         std::uint64_t epoch)
{
    CommandOutcome outcome;
    try
    {
        outcome = shared->invoker->invoke(request);
    }
    catch (const std::exception &ex)
    {
        outcome = CommandOutcome::failure({}, ex.what());
    }

    const char *label = operationLabel(op);
    if (outcome.succeeded)
    {
        log::info(std::string(label) + " #" + std::to_string(epoch) + " succeeded");
    }
    else
    {
        log::info(std::string(label) + " #" + std::to_string(epoch) + " failed: " +
                  (outcome.error.empty() ? std::string("(no description)") : outcome.error));
    }

    OutputMessage message{epoch, formatOutcome(outcome, op)};
    if (shared->mailbox->offer(std::move(message)))
    {
        log::debug("unread result replaced by " + std::string(label) + " #" +
                   std::to_string(epoch));
    }
    shared->inFlight.fetch_sub(1, std::memory_order_acq_rel);
}

} // namespace ite::task
