//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: task/Command.hpp
// Purpose: Data model shared by the task runner, process invoker and formatter.
// Key invariants: CommandRequest is immutable after construction; a failed
//                 CommandOutcome always carries a non-empty error description.
// Ownership/Lifetime: Plain value types; each invocation owns its own copies.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ite::task
{

/// @brief The two user actions that launch background work.
enum class Operation
{
    Build,
    Run
};

/// @brief Lower-case label used in formatted results ("build"/"run").
const char *operationLabel(Operation op) noexcept;

/// @brief Placeholder shown while the operation is in flight.
const char *operationPlaceholder(Operation op) noexcept;

/// @brief Program arguments and optional working directory for one invocation.
class CommandRequest
{
  public:
    explicit CommandRequest(std::vector<std::string> argv,
                            std::optional<std::string> workingDirectory = std::nullopt)
        : argv_(std::move(argv)), workingDirectory_(std::move(workingDirectory))
    {
    }

    /// @brief Argument tokens; the program is the first token.
    const std::vector<std::string> &argv() const
    {
        return argv_;
    }

    /// @brief Directory the child starts in; nullopt means the current directory.
    const std::optional<std::string> &workingDirectory() const
    {
        return workingDirectory_;
    }

    /// @brief Space-joined argv for log lines.
    std::string describe() const;

  private:
    std::vector<std::string> argv_;
    std::optional<std::string> workingDirectory_;
};

/// @brief Captured result of one completed external invocation.
struct CommandOutcome
{
    enum class Kind
    {
        SucceededWithOutput,
        SucceededEmpty,
        FailedWithOutput,
        FailedEmpty
    };

    bool succeeded = false;
    std::string output; ///< Combined stdout/stderr bytes, possibly empty.
    std::string error;  ///< Launch/wait error description; empty on success.

    static CommandOutcome success(std::string output)
    {
        return CommandOutcome{true, std::move(output), {}};
    }

    static CommandOutcome failure(std::string output, std::string error)
    {
        return CommandOutcome{false, std::move(output), std::move(error)};
    }

    Kind kind() const noexcept
    {
        if (succeeded)
            return output.empty() ? Kind::SucceededEmpty : Kind::SucceededWithOutput;
        return output.empty() ? Kind::FailedEmpty : Kind::FailedWithOutput;
    }
};

} // namespace ite::task
