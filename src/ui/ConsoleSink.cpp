//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ui/ConsoleSink.cpp
// Purpose: Print output-pane replacements and error dialogs.
// Key invariants: Every printed block ends with a newline.
// Ownership/Lifetime: See ConsoleSink.hpp.
//
//===----------------------------------------------------------------------===//

#include "ui/ConsoleSink.hpp"

namespace ite::ui
{

void ConsoleSink::setOutput(const std::string &text)
{
    output_ = text;
    out_ << "---- output ----\n" << text;
    if (text.empty() || text.back() != '\n')
    {
        out_ << '\n';
    }
    out_.flush();
}

void ConsoleSink::showError(const std::string &message)
{
    err_ << "error: " << message << '\n';
    err_.flush();
}

} // namespace ite::ui
