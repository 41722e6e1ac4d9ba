//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: task/TaskRunner.hpp
// Purpose: Start build and run commands without blocking the UI thread.
// Key invariants:
//   - start() is called on the UI thread and returns without waiting for the
//     child process.
//   - Each accepted request spawns exactly one detached task thread whose only
//     effect on shared state is a single mailbox offer.
//   - Requests are not serialised; overlapping tasks race into the same slot.
// Ownership/Lifetime: The runner borrows the editor state and sink from its
//                     TaskContext. Task threads co-own the mailbox, the invoker
//                     and the in-flight counter, so the runner may be destroyed
//                     while tasks are still running.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "task/Command.hpp"
#include "task/ProcessInvoker.hpp"
#include "task/TaskContext.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ite::task
{

/// @brief Argument vectors used for the two operations.
struct CommandSet
{
    std::vector<std::string> build{"go", "build", "./..."};
    std::vector<std::string> run{"go", "run", "."};
};

/// @brief Error shown when build or run is requested without a file.
inline constexpr const char *kNoFileMessage = "No file open. Please save first.";

/// @brief Launches build/run requests on background threads.
class TaskRunner
{
  public:
    TaskRunner(TaskContext ctx, std::shared_ptr<ProcessInvoker> invoker, CommandSet commands = {});

    TaskRunner(const TaskRunner &) = delete;
    TaskRunner &operator=(const TaskRunner &) = delete;

    /// @brief Start a build of the current file's directory.
    bool build()
    {
        return start(Operation::Build);
    }

    /// @brief Start a run of the current file's directory.
    bool run()
    {
        return start(Operation::Run);
    }

    /// @brief Validate, save if needed, show the placeholder and spawn the task.
    /// @return True when a background task was started.
    bool start(Operation op);

    /// @brief Number of task threads that have not yet delivered their result.
    [[nodiscard]] std::size_t inFlight() const noexcept;

    /// @brief Epoch assigned to the most recently started task (0 before any).
    [[nodiscard]] std::uint64_t lastEpoch() const noexcept
    {
        return lastEpoch_;
    }

  private:
    struct Shared
    {
        std::shared_ptr<OutputMailbox> mailbox;
        std::shared_ptr<ProcessInvoker> invoker;
        std::atomic<std::size_t> inFlight{0};
    };

    static void execute(std::shared_ptr<Shared> shared,
                        Operation op,
                        CommandRequest request,
                        std::uint64_t epoch);

    const std::vector<std::string> &commandFor(Operation op) const;

    TaskContext ctx_;
    std::shared_ptr<Shared> shared_;
    CommandSet commands_;
    std::uint64_t lastEpoch_ = 0;
};

} // namespace ite::task
