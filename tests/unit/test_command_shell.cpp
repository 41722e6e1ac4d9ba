// File: tests/unit/test_command_shell.cpp
// Purpose: Drive the console front end the way a user would: type commands,
//          start tasks and let the poller render their results.
// Key invariants:
//   - Commands that would lose unsaved text are refused unless forced.
//   - build/run return immediately; results appear only through the poller.
// Ownership/Lifetime: Streams, document and sink live in the fixture; the fake
//                     invoker is co-owned by task threads.
// Links: src/ui/CommandShell.cpp, src/ui/ConsoleSink.cpp

#include "task/Poller.hpp"
#include "task/TaskRunner.hpp"
#include "ui/CommandShell.hpp"
#include "ui/ConsoleSink.hpp"
#include "ui/Document.hpp"
#include "ui/EventLoop.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

using namespace ite;
using namespace ite::ui;
namespace fs = std::filesystem;
using Status = CommandShell::Status;

namespace
{
class ScriptedInvoker final : public task::ProcessInvoker
{
  public:
    explicit ScriptedInvoker(task::CommandOutcome outcome) : outcome_(std::move(outcome)) {}

    task::CommandOutcome invoke(const task::CommandRequest &request) override
    {
        std::lock_guard<std::mutex> lock(mu_);
        dirs_.push_back(request.workingDirectory().value_or(""));
        return outcome_;
    }

    std::vector<std::string> dirs()
    {
        std::lock_guard<std::mutex> lock(mu_);
        return dirs_;
    }

  private:
    std::mutex mu_;
    task::CommandOutcome outcome_;
    std::vector<std::string> dirs_;
};

class CommandShellTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir = fs::temp_directory_path() / ("ite-shell-" + std::to_string(stamp));
        fs::create_directories(dir);
        invoker = std::make_shared<ScriptedInvoker>(task::CommandOutcome::success("hello\n"));
        runner = std::make_unique<task::TaskRunner>(context(), invoker);
        shell = std::make_unique<CommandShell>(doc, *runner, sink, out);
    }

    void TearDown() override
    {
        shell.reset();
        runner.reset();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    task::TaskContext context()
    {
        return task::TaskContext{doc, sink, mailbox};
    }

    /// Spin the loop until every task has finished and its result is shown.
    bool settle(EventLoop &loop)
    {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (runner->inFlight() != 0 || !mailbox->empty())
        {
            if (std::chrono::steady_clock::now() > deadline)
                return false;
            loop.runOnce(std::chrono::milliseconds(5));
        }
        return true;
    }

    fs::path dir;
    std::ostringstream out;
    std::ostringstream err;
    Document doc;
    ConsoleSink sink{out, err};
    std::shared_ptr<task::OutputMailbox> mailbox = std::make_shared<task::OutputMailbox>();
    std::shared_ptr<ScriptedInvoker> invoker;
    std::unique_ptr<task::TaskRunner> runner;
    std::unique_ptr<CommandShell> shell;
};
} // namespace

TEST(ConsoleSink, WritesOutputPaneAndErrors)
{
    std::ostringstream out;
    std::ostringstream err;
    ConsoleSink sink(out, err);

    sink.setOutput("Building...\n");
    sink.setOutput("no newline");
    sink.showError("No file open. Please save first.");

    EXPECT_EQ(out.str(), "---- output ----\nBuilding...\n---- output ----\nno newline\n");
    EXPECT_EQ(err.str(), "error: No file open. Please save first.\n");
    EXPECT_EQ(sink.output(), "no newline");
}

TEST_F(CommandShellTest, BuildWithoutFileReportsError)
{
    EXPECT_EQ(shell->execute("build"), Status::Continue);
    EXPECT_EQ(err.str(), "error: No file open. Please save first.\n");
    EXPECT_TRUE(invoker->dirs().empty());
}

TEST_F(CommandShellTest, SaveAsThenRunShowsResultThroughPoller)
{
    EventLoop loop;
    task::Poller poller(context(), loop, std::chrono::milliseconds(1));
    poller.start();

    shell->execute("append package main");
    shell->execute("saveas " + (dir / "main").string());
    ASSERT_TRUE(fs::exists(dir / "main.go"));

    shell->execute("run");
    EXPECT_EQ(sink.output(), "Running...\n");
    ASSERT_TRUE(settle(loop));

    EXPECT_EQ(sink.output(), "Run output:\nhello\n");
    ASSERT_EQ(invoker->dirs().size(), 1u);
    EXPECT_EQ(invoker->dirs()[0], dir.lexically_normal().string());
    EXPECT_TRUE(err.str().empty()) << err.str();
}

TEST_F(CommandShellTest, BuildSavesModifiedDocumentFirst)
{
    EventLoop loop;
    task::Poller poller(context(), loop, std::chrono::milliseconds(1));
    poller.start();

    shell->execute("saveas " + (dir / "main.go").string());
    shell->execute("append func main() {}");
    ASSERT_TRUE(doc.isModified());

    shell->execute("build");
    EXPECT_FALSE(doc.isModified());
    ASSERT_TRUE(settle(loop));
    EXPECT_EQ(sink.output(), "Build output:\nhello\n");

    std::ifstream in(dir / "main.go");
    std::string line;
    std::getline(in, line);
    EXPECT_EQ(line, "func main() {}");
}

TEST_F(CommandShellTest, QuitIsRefusedWhileModified)
{
    shell->execute("append x");
    EXPECT_EQ(shell->execute("quit"), Status::Continue);
    EXPECT_NE(err.str().find("Unsaved changes"), std::string::npos);
    EXPECT_EQ(shell->execute("quit!"), Status::Quit);
}

TEST_F(CommandShellTest, NewAndOpenAreGuarded)
{
    {
        std::ofstream f(dir / "other.go");
        f << "package other\n";
    }
    shell->execute("append x");
    shell->execute("new");
    EXPECT_TRUE(doc.isModified());
    shell->execute("open " + (dir / "other.go").string());
    EXPECT_EQ(doc.text(), "x\n");

    shell->execute("open! " + (dir / "other.go").string());
    EXPECT_EQ(doc.text(), "package other\n");
    EXPECT_FALSE(doc.isModified());

    shell->execute("append y");
    shell->execute("new!");
    EXPECT_FALSE(doc.path().has_value());
    EXPECT_TRUE(doc.text().empty());
}

TEST_F(CommandShellTest, SaveWithoutNameIsAnError)
{
    shell->execute("append x");
    shell->execute("save");
    EXPECT_EQ(err.str(), "error: Error saving file: document has no file name; use saveas\n");
}

TEST_F(CommandShellTest, StatusReportsTitleAndState)
{
    shell->execute("status");
    EXPECT_NE(out.str().find("Untitled - ITE | Saved"), std::string::npos);

    shell->execute("append x");
    shell->execute("saveas " + (dir / "prog.go").string());
    EXPECT_NE(out.str().find("prog.go - ITE | Saved"), std::string::npos);

    shell->execute("append y");
    shell->execute("status");
    EXPECT_NE(out.str().find("prog.go - ITE | Not saved | 2 lines"), std::string::npos);
}

TEST_F(CommandShellTest, UnknownCommandAndBlankLines)
{
    EXPECT_EQ(shell->execute("   "), Status::Continue);
    EXPECT_EQ(shell->execute("# comment"), Status::Continue);
    EXPECT_TRUE(err.str().empty());

    shell->execute("frobnicate");
    EXPECT_EQ(err.str(), "error: unknown command 'frobnicate' (try 'help')\n");
}

TEST_F(CommandShellTest, FeedSplitsLinesAcrossChunks)
{
    EXPECT_EQ(shell->feed("app"), Status::Continue);
    EXPECT_EQ(doc.text(), "");
    EXPECT_EQ(shell->feed("end one\nappend two\nappe"), Status::Continue);
    EXPECT_EQ(doc.text(), "one\ntwo\n");
    EXPECT_EQ(shell->feed("nd three"), Status::Continue);
    EXPECT_EQ(shell->finish(), Status::Continue);
    EXPECT_EQ(doc.text(), "one\ntwo\nthree\n");
}

TEST_F(CommandShellTest, FeedStopsAtQuit)
{
    EXPECT_EQ(shell->feed("quit\nappend ignored\n"), Status::Quit);
    EXPECT_TRUE(doc.text().empty());
}

TEST_F(CommandShellTest, HelpListsCommands)
{
    shell->execute("help");
    for (const char *cmd : {"new", "open", "save", "saveas", "append", "status", "build", "run",
                            "quit", "help"})
    {
        EXPECT_NE(out.str().find(std::string("  ") + cmd), std::string::npos) << cmd;
    }
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
