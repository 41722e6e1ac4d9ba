//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: task/ProcessInvoker.cpp
// Purpose: Map raw process results onto the task outcome model.
// Key invariants: Success requires a launched child that exited with status 0.
// Ownership/Lifetime: Stateless; safe to call from any number of threads.
//
//===----------------------------------------------------------------------===//

#include "task/ProcessInvoker.hpp"

#include "common/RunProcess.hpp"
#include "support/log.hpp"

#include <string>
#include <utility>

namespace ite::task
{

/// @brief Run @p request through @ref ite::run_process and classify the result.
/// @details A launch failure keeps the error text produced by the process
///          helper (for example "exec go: No such file or directory"). A
///          non-zero exit is reported as "exit status N". Captured output is
///          carried over untouched in every case.
CommandOutcome SystemProcessInvoker::invoke(const CommandRequest &request)
{
    log::debug("invoke: " + request.describe() + " in " +
               request.workingDirectory().value_or(std::string(".")));

    RunResult rr = run_process(request.argv(), request.workingDirectory());

    if (!rr.launched)
    {
        return CommandOutcome::failure(std::move(rr.out), std::move(rr.err));
    }
    if (!rr.err.empty())
    {
        return CommandOutcome::failure(std::move(rr.out), std::move(rr.err));
    }
    if (rr.exit_code != 0)
    {
        return CommandOutcome::failure(std::move(rr.out),
                                       "exit status " + std::to_string(rr.exit_code));
    }
    return CommandOutcome::success(std::move(rr.out));
}

} // namespace ite::task
