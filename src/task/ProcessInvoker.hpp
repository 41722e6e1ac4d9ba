//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: task/ProcessInvoker.hpp
// Purpose: Blocking "run this command and tell me how it went" seam.
// Key invariants: invoke() never throws for launch or exit failures; both are
//                 reported as a failed CommandOutcome with output preserved.
// Ownership/Lifetime: Implementations are shared between the UI thread and
//                     every background task thread, so they must be stateless
//                     or internally synchronised.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "task/Command.hpp"

namespace ite::task
{

/// @brief Launches a command, waits for it and reports the outcome.
/// @note Blocks for the full child lifetime; never call from the UI thread.
class ProcessInvoker
{
  public:
    virtual ~ProcessInvoker() = default;

    virtual CommandOutcome invoke(const CommandRequest &request) = 0;
};

/// @brief Invoker backed by the operating system process facility.
class SystemProcessInvoker final : public ProcessInvoker
{
  public:
    CommandOutcome invoke(const CommandRequest &request) override;
};

} // namespace ite::task
