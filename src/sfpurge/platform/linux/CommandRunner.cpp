#include "../CommandRunner.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <plog/Log.h>

namespace sfpurge
{

namespace
{

constexpr int kExecFailedStatus = 127;
constexpr auto kReapPollInterval = std::chrono::milliseconds(10);

} // namespace

CommandResult CommandRunner::Run(const std::string& program, const std::vector<std::string>& args,
                                 std::chrono::milliseconds timeout)
{
    CommandResult result;

    // Built before fork: the child may only make async-signal-safe calls
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    int pipefd[2];
    if (pipe(pipefd) == -1)
    {
        result.error = std::string("pipe() failed: ") + strerror(errno);
        PLOG_ERROR << result.error;
        return result;
    }

    pid_t pid = fork();
    if (pid < 0)
    {
        result.error = std::string("fork() failed: ") + strerror(errno);
        PLOG_ERROR << result.error;
        close(pipefd[0]);
        close(pipefd[1]);
        return result;
    }

    if (pid == 0)
    {
        close(pipefd[0]);
        if (dup2(pipefd[1], STDOUT_FILENO) == -1 || dup2(pipefd[1], STDERR_FILENO) == -1)
            _exit(kExecFailedStatus);
        close(pipefd[1]);

        execvp(program.c_str(), argv.data());
        _exit(kExecFailedStatus);
    }

    close(pipefd[1]);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[4096];
    bool eof = false;

    while (!eof)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
        {
            result.timed_out = true;
            break;
        }

        pollfd pfd{ pipefd[0], POLLIN, 0 };
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            result.error = std::string("poll() failed: ") + strerror(errno);
            break;
        }
        if (ready == 0)
            continue;

        ssize_t n = read(pipefd[0], buffer, sizeof(buffer));
        if (n > 0)
            result.raw_text.append(buffer, static_cast<size_t>(n));
        else if (n == 0 || errno != EINTR)
            eof = true;
    }

    close(pipefd[0]);

    // Closing the output does not mean the child has exited; reaping shares the deadline
    int status = 0;
    bool reaped = false;
    while (!reaped && !result.timed_out && result.error.empty())
    {
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid)
            reaped = true;
        else if (done < 0 && errno != EINTR)
            result.error = std::string("waitpid() failed: ") + strerror(errno);
        else if (std::chrono::steady_clock::now() >= deadline)
            result.timed_out = true;
        else
            usleep(static_cast<useconds_t>(std::chrono::microseconds(kReapPollInterval).count()));
    }

    if (!reaped)
    {
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
    }

    if (result.timed_out)
    {
        PLOG_WARNING << "Command timed out after " << timeout.count() << " ms: " << program;
        return result;
    }
    if (!result.error.empty())
        return result;

    if (WIFEXITED(status))
    {
        result.exit_code = WEXITSTATUS(status);
        if (result.exit_code == kExecFailedStatus && result.raw_text.empty())
            result.error = "failed to execute " + program;
    }
    else if (WIFSIGNALED(status))
    {
        result.error = program + " killed by signal " + std::to_string(WTERMSIG(status));
    }

    result.succeeded = result.error.empty() && result.exit_code == 0;
    return result;
}

} // namespace sfpurge
