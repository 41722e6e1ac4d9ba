//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: task/ResultFormatter.hpp
// Purpose: Turn a command outcome into the text block shown in the output view.
// Key invariants: Pure and deterministic; captured output is never truncated
//                 or rewritten, only prefixed.
// Ownership/Lifetime: Returns a new string; borrows its inputs.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "task/Command.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace ite::task
{

/// @brief Format @p outcome for display under @p label.
/// @details Rules, first match wins:
///          1. failed, no output:  "<label> failed: <error>\n"
///          2. failed, output:     "<Label> failed:\n<output>"
///          3. success, no output: @p emptySuccess when given, else "<Label> successful\n"
///          4. success, output:    "<Label> output:\n<output>"
///          where <Label> is @p label with its first letter upper-cased.
std::string formatOutcome(const CommandOutcome &outcome,
                          std::string_view label,
                          std::optional<std::string_view> emptySuccess = std::nullopt);

/// @brief Format @p outcome using the label and wording of @p op.
/// @details A run that succeeds silently reads "Program finished (no output)\n".
std::string formatOutcome(const CommandOutcome &outcome, Operation op);

/// @brief Upper-case the first character of @p label.
std::string capitalize(std::string_view label);

} // namespace ite::task
