//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: task/ResultFormatter.cpp
// Purpose: Implement the outcome-to-text rules for build and run results.
// Key invariants: Output bytes are appended verbatim after the prefix line.
// Ownership/Lifetime: Stateless.
//
//===----------------------------------------------------------------------===//

#include "task/ResultFormatter.hpp"

#include <cctype>

namespace ite::task
{

std::string capitalize(std::string_view label)
{
    std::string text(label);
    if (!text.empty())
    {
        text[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
    }
    return text;
}

std::string formatOutcome(const CommandOutcome &outcome,
                          std::string_view label,
                          std::optional<std::string_view> emptySuccess)
{
    std::string msg;
    switch (outcome.kind())
    {
        case CommandOutcome::Kind::FailedEmpty:
            msg.append(label).append(" failed: ").append(outcome.error).append("\n");
            break;
        case CommandOutcome::Kind::FailedWithOutput:
            msg = capitalize(label) + " failed:\n" + outcome.output;
            break;
        case CommandOutcome::Kind::SucceededEmpty:
            if (emptySuccess)
                msg.assign(*emptySuccess);
            else
                msg = capitalize(label) + " successful\n";
            break;
        case CommandOutcome::Kind::SucceededWithOutput:
            msg = capitalize(label) + " output:\n" + outcome.output;
            break;
    }
    return msg;
}

std::string formatOutcome(const CommandOutcome &outcome, Operation op)
{
    if (op == Operation::Run)
    {
        return formatOutcome(outcome, operationLabel(op), "Program finished (no output)\n");
    }
    return formatOutcome(outcome, operationLabel(op));
}

} // namespace ite::task
