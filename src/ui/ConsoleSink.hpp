//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ui/ConsoleSink.hpp
// Purpose: Output pane and error dialogs rendered as console text.
// Key invariants: Used only from the UI thread.
// Ownership/Lifetime: Borrows both streams; they must outlive the sink.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "task/TaskContext.hpp"

#include <ostream>
#include <string>

namespace ite::ui
{

/// @brief OutputSink that prints the output pane to @p out and errors to @p err.
class ConsoleSink final : public task::OutputSink
{
  public:
    ConsoleSink(std::ostream &out, std::ostream &err) : out_(out), err_(err) {}

    void setOutput(const std::string &text) override;
    void showError(const std::string &message) override;

    /// @brief Text most recently passed to setOutput().
    const std::string &output() const noexcept
    {
        return output_;
    }

  private:
    std::ostream &out_;
    std::ostream &err_;
    std::string output_;
};

} // namespace ite::ui
