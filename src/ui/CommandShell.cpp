//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ui/CommandShell.cpp
// Purpose: Implement the console command set of the ite front end.
// Key invariants: Commands that would discard unsaved text are refused unless
//                 their forcing variant (suffix '!') is used.
// Ownership/Lifetime: See CommandShell.hpp.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Console command dispatch.
/// @details Each line is split into a command word and an argument string.
///          File commands act on the Document directly; build and run are
///          forwarded to the TaskRunner, which returns immediately and lets
///          the poller render the result later.

#include "ui/CommandShell.hpp"

#include "support/log.hpp"

#include <cctype>
#include <utility>

namespace ite::ui
{
namespace
{
std::string_view trim(std::string_view sv)
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}
} // namespace

CommandShell::CommandShell(Document &doc,
                           task::TaskRunner &runner,
                           task::OutputSink &sink,
                           std::ostream &out)
    : doc_(doc), runner_(runner), sink_(sink), out_(out)
{
}

void CommandShell::printHelp() const
{
    out_ << "Commands:\n"
         << "  new[!]            start an untitled document\n"
         << "  open[!] <path>    load a file\n"
         << "  save              write the document to its file\n"
         << "  saveas <path>     write the document to a new file\n"
         << "  append <text>     add a line to the document\n"
         << "  status            show title and save state\n"
         << "  build             build the current file's directory\n"
         << "  run               run the current file's directory\n"
         << "  quit[!]           exit ('!' discards unsaved changes)\n"
         << "  help              show this list\n";
    out_.flush();
}

void CommandShell::showStatus() const
{
    out_ << doc_.title() << " | " << doc_.statusText() << " | " << doc_.lineCount() << " lines\n";
    out_.flush();
}

/// @brief Refuse @p action while the document has unsaved changes.
/// @return True when the action may proceed.
bool CommandShell::guardUnsaved(bool force, std::string_view action)
{
    if (force || !doc_.isModified())
    {
        return true;
    }
    sink_.showError("Unsaved changes. Save first or use '" + std::string(action) + "!'.");
    return false;
}

CommandShell::Status CommandShell::execute(std::string_view line)
{
    line = trim(line);
    if (line.empty() || line.front() == '#')
    {
        return Status::Continue;
    }

    const auto space = line.find_first_of(" \t");
    std::string_view word = line.substr(0, space);
    const std::string_view arg = space == std::string_view::npos ? std::string_view{}
                                                                 : trim(line.substr(space + 1));
    bool force = false;
    if (word.size() > 1 && word.back() == '!')
    {
        force = true;
        word.remove_suffix(1);
    }

    log::debug("command: " + std::string(line));

    if (word == "build")
    {
        runner_.build();
    }
    else if (word == "run")
    {
        runner_.run();
    }
    else if (word == "new")
    {
        if (guardUnsaved(force, "new"))
        {
            doc_.reset();
            showStatus();
        }
    }
    else if (word == "open")
    {
        if (arg.empty())
        {
            sink_.showError("usage: open <path>");
        }
        else if (guardUnsaved(force, "open"))
        {
            if (auto opened = doc_.open(std::string(arg)); !opened)
                sink_.showError(opened.error());
            else
                showStatus();
        }
    }
    else if (word == "save")
    {
        if (auto saved = doc_.save(); !saved)
            sink_.showError("Error saving file: " + saved.error());
        else
            showStatus();
    }
    else if (word == "saveas")
    {
        if (arg.empty())
        {
            sink_.showError("usage: saveas <path>");
        }
        else if (auto saved = doc_.saveAs(std::string(arg)); !saved)
        {
            sink_.showError("Error saving file: " + saved.error());
        }
        else
        {
            showStatus();
        }
    }
    else if (word == "append")
    {
        doc_.append(arg);
    }
    else if (word == "status")
    {
        showStatus();
    }
    else if (word == "help")
    {
        printHelp();
    }
    else if (word == "quit" || word == "exit")
    {
        if (guardUnsaved(force, "quit"))
        {
            return Status::Quit;
        }
    }
    else
    {
        sink_.showError("unknown command '" + std::string(word) + "' (try 'help')");
    }
    return Status::Continue;
}

CommandShell::Status CommandShell::feed(std::string_view chunk)
{
    pending_.append(chunk);
    std::size_t start = 0;
    while (true)
    {
        const auto nl = pending_.find('\n', start);
        if (nl == std::string::npos)
        {
            break;
        }
        const std::string line = pending_.substr(start, nl - start);
        start = nl + 1;
        if (execute(line) == Status::Quit)
        {
            pending_.clear();
            return Status::Quit;
        }
    }
    pending_.erase(0, start);
    return Status::Continue;
}

CommandShell::Status CommandShell::finish()
{
    std::string rest = std::move(pending_);
    pending_.clear();
    return execute(rest);
}

} // namespace ite::ui
