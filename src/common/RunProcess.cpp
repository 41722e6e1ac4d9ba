//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the helper used by build and run tasks to launch external
// processes. The routine forks, rewires the child's standard streams onto a
// single capture pipe, applies the requested working directory and executes
// the program. Launch failures detected in the child travel back to the
// parent through a close-on-exec status pipe so they can be reported as text.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Subprocess launcher backing the External Process Invoker.
/// @details Provides @ref ite::run_process, which spawns an argv vector,
///          captures the combined output and reports how the child ended.

#include "common/RunProcess.hpp"

#include <cerrno>
#include <cstddef>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace
{
constexpr int kStageChdir = 1;
constexpr int kStageExec = 2;

/// @brief Failure report written by the child before it exits.
struct ChildFailure
{
    int stage;
    int error;
};

class ScopedFd
{
public:
    explicit ScopedFd(int fd = -1) : fd_(fd) {}

    ScopedFd(const ScopedFd &) = delete;
    ScopedFd &operator=(const ScopedFd &) = delete;

    ScopedFd(ScopedFd &&other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    ScopedFd &operator=(ScopedFd &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    ~ScopedFd()
    {
        reset();
    }

    int get() const
    {
        return fd_;
    }

    void reset()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
};

std::string describe_errno(int err)
{
    return std::error_code(err, std::generic_category()).message();
}

bool open_pipe(ScopedFd &readEnd, ScopedFd &writeEnd, std::string &error)
{
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0)
    {
        error = "pipe: " + describe_errno(errno);
        return false;
    }
    readEnd = ScopedFd(fds[0]);
    writeEnd = ScopedFd(fds[1]);
    return true;
}

/// @brief Read until EOF, retrying on EINTR.
/// @return 0 on EOF or the errno of the failing read.
int read_to_end(int fd, std::string &out)
{
    char buffer[4096];
    while (true)
    {
        const ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0)
        {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0)
        {
            return 0;
        }
        if (errno == EINTR)
        {
            continue;
        }
        return errno;
    }
}

/// @brief Child side of the fork; only async-signal-safe calls are made here.
[[noreturn]] void exec_child(char *const *argv, const char *dir, int stdinFd, int outFd, int statusFd)
{
    if (stdinFd >= 0)
    {
        ::dup2(stdinFd, STDIN_FILENO);
    }
    ::dup2(outFd, STDOUT_FILENO);
    ::dup2(outFd, STDERR_FILENO);

    ChildFailure failure{0, 0};
    if (dir != nullptr && ::chdir(dir) != 0)
    {
        failure = {kStageChdir, errno};
    }
    else
    {
        ::execvp(argv[0], argv);
        failure = {kStageExec, errno};
    }
    ssize_t ignored = ::write(statusFd, &failure, sizeof(failure));
    (void)ignored;
    ::_exit(127);
}
} // namespace

namespace ite
{

/// @brief Launch a subprocess and capture its combined output.
/// @details Step-by-step summary:
///          1. Build a NUL-terminated argv array before forking so the child
///             performs no allocation.
///          2. Open the capture pipe and the status pipe with O_CLOEXEC so
///             concurrently spawned children never inherit them.
///          3. In the child, wire stdin to /dev/null and stdout/stderr to the
///             capture pipe, change directory, and exec.
///          4. In the parent, read the status pipe (EOF means exec succeeded),
///             drain the capture pipe, then reap the child.
RunResult run_process(const std::vector<std::string> &argv, const std::optional<std::string> &cwd)
{
    RunResult rr;
    if (argv.empty() || argv.front().empty())
    {
        rr.err = "empty command";
        return rr;
    }

    std::vector<char *> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto &arg : argv)
    {
        cargv.push_back(const_cast<char *>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    const char *dir = (cwd && !cwd->empty()) ? cwd->c_str() : nullptr;

    ScopedFd outRead, outWrite, statusRead, statusWrite;
    if (!open_pipe(outRead, outWrite, rr.err) || !open_pipe(statusRead, statusWrite, rr.err))
    {
        return rr;
    }
    ScopedFd devNull(::open("/dev/null", O_RDONLY | O_CLOEXEC));

    const pid_t pid = ::fork();
    if (pid == -1)
    {
        rr.err = "fork: " + describe_errno(errno);
        return rr;
    }
    if (pid == 0)
    {
        exec_child(cargv.data(), dir, devNull.get(), outWrite.get(), statusWrite.get());
    }

    outWrite.reset();
    statusWrite.reset();
    devNull.reset();

    std::string status;
    const int statusErr = read_to_end(statusRead.get(), status);
    const int readErr = read_to_end(outRead.get(), rr.out);

    int waitStatus = 0;
    pid_t waited = -1;
    do
    {
        waited = ::waitpid(pid, &waitStatus, 0);
    } while (waited == -1 && errno == EINTR);
    const int waitErr = waited == -1 ? errno : 0;

    if (status.size() >= sizeof(ChildFailure))
    {
        ChildFailure failure{};
        status.copy(reinterpret_cast<char *>(&failure), sizeof(failure));
        const std::string reason = describe_errno(failure.error);
        rr.err = failure.stage == kStageChdir ? "chdir " + *cwd + ": " + reason
                                              : "exec " + argv.front() + ": " + reason;
        return rr;
    }
    if (statusErr != 0)
    {
        rr.err = "read: " + describe_errno(statusErr);
        return rr;
    }

    rr.launched = true;
    if (waited == -1)
    {
        rr.err = "wait: " + describe_errno(waitErr);
        return rr;
    }
    if (WIFEXITED(waitStatus))
    {
        rr.exit_code = WEXITSTATUS(waitStatus);
    }
    else if (WIFSIGNALED(waitStatus))
    {
        rr.term_signal = WTERMSIG(waitStatus);
        rr.err = "signal: " + std::to_string(rr.term_signal);
    }
    if (readErr != 0 && rr.err.empty())
    {
        rr.err = "read: " + describe_errno(readErr);
    }
    return rr;
}

} // namespace ite
