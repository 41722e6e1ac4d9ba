//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: task/TaskContext.hpp
// Purpose: Collaborator interfaces consumed by the build/run core and the
//          context object that bundles them.
// Key invariants: EditorState and OutputSink are touched only on the UI
//                 thread; the mailbox is the only member reachable from task
//                 threads.
// Ownership/Lifetime: TaskContext borrows the editor state and the sink and
//                     shares ownership of the mailbox with running tasks.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/result.hpp"
#include "task/Mailbox.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace ite::task
{

/// @brief Read/persist access to the document being edited.
class EditorState
{
  public:
    virtual ~EditorState() = default;

    /// @brief Whether the document has unsaved modifications.
    virtual bool isModified() const = 0;

    /// @brief Persist the document to its current path.
    virtual support::Result<void> save() = 0;

    /// @brief Directory holding the current file, or nullopt when no file is open.
    virtual std::optional<std::string> currentDirectory() const = 0;
};

/// @brief Where user-visible text ends up.
class OutputSink
{
  public:
    virtual ~OutputSink() = default;

    /// @brief Replace the displayed output with @p text.
    virtual void setOutput(const std::string &text) = 0;

    /// @brief Show a blocking error dialog carrying @p message.
    virtual void showError(const std::string &message) = 0;
};

/// @brief One-shot timers executed on the UI thread.
class Scheduler
{
  public:
    virtual ~Scheduler() = default;

    /// @brief Run @p callback once on the UI thread after @p delay.
    virtual void runAfter(std::chrono::milliseconds delay, std::function<void()> callback) = 0;
};

/// @brief Explicit state shared by the task runner and the poller.
struct TaskContext
{
    EditorState &editor;
    OutputSink &sink;
    std::shared_ptr<OutputMailbox> mailbox;
};

} // namespace ite::task
