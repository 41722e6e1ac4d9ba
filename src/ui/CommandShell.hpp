//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ui/CommandShell.hpp
// Purpose: Translate console command lines into document and task actions.
// Key invariants: Runs on the UI thread; never blocks on a child process.
// Ownership/Lifetime: Borrows the document, runner, sink and output stream.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "task/TaskRunner.hpp"
#include "ui/Document.hpp"

#include <ostream>
#include <string>
#include <string_view>

namespace ite::ui
{

/// @brief Line-oriented command interpreter standing in for menus and shortcuts.
class CommandShell
{
  public:
    enum class Status
    {
        Continue,
        Quit
    };

    CommandShell(Document &doc, task::TaskRunner &runner, task::OutputSink &sink, std::ostream &out);

    /// @brief Execute one command line.
    Status execute(std::string_view line);

    /// @brief Buffer raw input and execute every complete line.
    Status feed(std::string_view chunk);

    /// @brief Execute a trailing line that had no newline (end of input).
    Status finish();

    /// @brief Print the command summary.
    void printHelp() const;

  private:
    bool guardUnsaved(bool force, std::string_view action);
    void showStatus() const;

    Document &doc_;
    task::TaskRunner &runner_;
    task::OutputSink &sink_;
    std::ostream &out_;
    std::string pending_;
};

} // namespace ite::ui
