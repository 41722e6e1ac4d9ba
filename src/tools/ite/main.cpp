//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the `ite` console front end. The executable loads settings, opens
// the optional file argument and then feeds stdin lines to the command shell
// from a single-threaded event loop. Build and run requests are handed to the
// task runner; their results come back through the mailbox poller.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `ite` editor.
/// @details The translation unit only wires components together. Every object
///          with a UI-thread role (document, sink, shell, poller) lives on the
///          stack of main and is touched only from the event loop.

#include "config/Config.hpp"
#include "support/log.hpp"
#include "task/Mailbox.hpp"
#include "task/Poller.hpp"
#include "task/ProcessInvoker.hpp"
#include "task/TaskRunner.hpp"
#include "ui/CommandShell.hpp"
#include "ui/ConsoleSink.hpp"
#include "ui/Document.hpp"
#include "ui/EventLoop.hpp"
#include "ite/version.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <unistd.h>

namespace
{

struct Options
{
    std::optional<std::string> configPath;
    std::optional<std::string> file;
    bool showVersion = false;
    bool showHelp = false;
};

void usage(std::ostream &os)
{
    os << "ite v" << ITE_VERSION_STR << "\n"
       << "Usage: ite [--config <file>] [--version] [--help] [<file>]\n"
       << "\nCommands are read from standard input, one per line. Type 'help'\n"
       << "for the list. Settings are read from --config, $ITE_CONFIG or\n"
       << "$HOME/.config/ite/ite.ini.\n";
}

/// @brief Parse the command line into @p opts.
/// @return False on a malformed invocation; a message has been printed.
bool parseArgs(int argc, char **argv, Options &opts)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "--version")
        {
            opts.showVersion = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            opts.showHelp = true;
        }
        else if (arg == "--config")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "ite: --config requires a path\n";
                return false;
            }
            opts.configPath = argv[++i];
        }
        else if (arg.size() > 1 && arg.front() == '-')
        {
            std::cerr << "ite: unknown option '" << arg << "'\n";
            return false;
        }
        else if (opts.file)
        {
            std::cerr << "ite: only one file may be given\n";
            return false;
        }
        else
        {
            opts.file = std::string(arg);
        }
    }
    return true;
}

} // namespace

int main(int argc, char **argv)
{
    using namespace ite;

    Options opts;
    if (!parseArgs(argc, argv, opts))
    {
        usage(std::cerr);
        return 2;
    }
    if (opts.showHelp)
    {
        usage(std::cout);
        return 0;
    }
    if (opts.showVersion)
    {
        std::cout << "ite v" << ITE_VERSION_STR << "\n";
        return 0;
    }

    log::applyEnvironment();

    config::Config cfg;
    auto resolved = config::resolveConfigPath(opts.configPath);
    if (!resolved)
    {
        std::cerr << "ite: " << resolved.error() << "\n";
        return 1;
    }
    if (resolved.value() && !config::loadFromFile(*resolved.value(), cfg))
    {
        std::cerr << "ite: cannot read config '" << *resolved.value() << "'\n";
        return 1;
    }
    // The environment wins over the file.
    log::setLevel(cfg.log_level);
    log::applyEnvironment();

    ui::Document doc(cfg.editor.default_extension);
    ui::ConsoleSink sink(std::cout, std::cerr);
    auto mailbox = std::make_shared<task::OutputMailbox>();
    task::TaskContext ctx{doc, sink, mailbox};

    task::TaskRunner runner(ctx, std::make_shared<task::SystemProcessInvoker>(), cfg.commands);
    ui::EventLoop loop;
    task::Poller poller(ctx, loop, cfg.poller.interval, cfg.poller.discard_stale);
    ui::CommandShell shell(doc, runner, sink, std::cout);

    if (opts.file)
    {
        if (auto opened = doc.open(*opts.file); !opened)
            sink.showError(opened.error());
    }

    // At end of input, keep the loop alive until every task has reported and
    // the poller has rendered the final message.
    std::function<void()> drainCheck = [&]()
    {
        if (runner.inFlight() == 0 && mailbox->empty())
        {
            loop.quit();
            return;
        }
        loop.runAfter(poller.interval(), drainCheck);
    };

    loop.watchReadable(STDIN_FILENO,
                       [&]()
                       {
                           char buf[4096];
                           const ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
                           if (n < 0)
                           {
                               if (errno == EINTR || errno == EAGAIN)
                                   return;
                               log::error(std::string("read stdin: ") + std::strerror(errno));
                           }
                           if (n <= 0)
                           {
                               loop.unwatch();
                               if (shell.finish() == ui::CommandShell::Status::Quit)
                                   loop.quit();
                               else
                                   drainCheck();
                               return;
                           }
                           if (shell.feed(std::string_view(buf, static_cast<std::size_t>(n))) ==
                               ui::CommandShell::Status::Quit)
                           {
                               loop.unwatch();
                               loop.quit();
                           }
                       });

    log::debug(std::string("ite v") + ITE_VERSION_STR + " ready");
    poller.start();
    loop.run();

    if (runner.inFlight() != 0)
    {
        log::info(std::to_string(runner.inFlight()) + " task(s) still running at exit");
    }
    return 0;
}
