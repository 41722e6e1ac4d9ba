//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: task/Command.cpp
// Purpose: Labels and helpers for the task data model.
// Key invariants: Returned strings are literals with static storage.
// Ownership/Lifetime: Stateless.
//
//===----------------------------------------------------------------------===//

#include "task/Command.hpp"

namespace ite::task
{

const char *operationLabel(Operation op) noexcept
{
    switch (op)
    {
        case Operation::Build:
            return "build";
        case Operation::Run:
            return "run";
    }
    return "task";
}

const char *operationPlaceholder(Operation op) noexcept
{
    switch (op)
    {
        case Operation::Build:
            return "Building...\n";
        case Operation::Run:
            return "Running...\n";
    }
    return "Working...\n";
}

std::string CommandRequest::describe() const
{
    std::string text;
    for (const auto &arg : argv_)
    {
        if (!text.empty())
            text += ' ';
        text += arg;
    }
    return text;
}

} // namespace ite::task
