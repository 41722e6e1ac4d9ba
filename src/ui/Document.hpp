//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ui/Document.hpp
// Purpose: File-backed document that provides editor state to the task runner.
// Key invariants:
//   - A document with a path always stores it as an absolute path, so its
//     containing directory is well defined.
//   - isModified() is false right after new/open/save and true after any edit.
// Ownership/Lifetime: Owns the text; touched only on the UI thread.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/result.hpp"
#include "task/TaskContext.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace ite::ui
{

/// @brief The single document edited by the front end.
class Document final : public task::EditorState
{
  public:
    explicit Document(std::string defaultExtension = ".go");

    /// @brief Discard the text and forget the path ("new").
    void reset();

    /// @brief Replace the document with the contents of @p path.
    support::Result<void> open(const std::string &path);

    /// @brief Write the text to the current path.
    support::Result<void> save() override;

    /// @brief Write the text to @p path and adopt it as the current path.
    /// @details The default extension is appended when @p path has none.
    support::Result<void> saveAs(std::string path);

    /// @brief Append @p line and a newline; marks the document modified.
    void append(std::string_view line);

    const std::string &text() const noexcept
    {
        return text_;
    }

    bool isModified() const override
    {
        return modified_;
    }

    std::optional<std::string> currentDirectory() const override;

    const std::optional<std::string> &path() const noexcept
    {
        return path_;
    }

    /// @brief Window title: "Untitled - ITE" or "<file name> - ITE".
    std::string title() const;

    /// @brief "Saved" or "Not saved".
    const char *statusText() const noexcept
    {
        return modified_ ? "Not saved" : "Saved";
    }

    std::size_t lineCount() const noexcept;

  private:
    support::Result<void> writeTo(const std::string &path) const;

    std::string defaultExtension_;
    std::optional<std::string> path_;
    std::string text_;
    bool modified_ = false;
};

} // namespace ite::ui
