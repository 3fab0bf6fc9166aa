#include "../ProcessControl.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <string>
#include <thread>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sfpurge
{

namespace
{

constexpr std::chrono::milliseconds kPollStep{ 10 };

ActionResult SendSignal(ProcessId pid, int signal)
{
    if (::kill(pid, signal) == 0)
        return ActionResult::Success();

    int err = errno;
    std::string detail = std::string("kill(") + std::to_string(pid) + ", " + std::to_string(signal) +
                         "): " + std::strerror(err);
    if (err == ESRCH)
        return ActionResult::Failure(ErrorKind::NotFound, detail);
    if (err == EPERM)
        return ActionResult::Failure(ErrorKind::Permission, detail);
    return ActionResult::Failure(ErrorKind::Unexpected, detail);
}

// Zombies still answer kill(pid, 0); they count as exited.
bool IsGone(ProcessId pid)
{
    // Reap it if it happens to be our own child
    int status = 0;
    if (::waitpid(pid, &status, WNOHANG) == pid)
        return true;

    if (::kill(pid, 0) != 0 && errno == ESRCH)
        return true;

    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat.is_open())
        return true;

    std::string content((std::istreambuf_iterator<char>(stat)), std::istreambuf_iterator<char>());
    // Field 3 follows the parenthesized comm, which may itself contain ')'
    auto close = content.rfind(')');
    if (close == std::string::npos || close + 2 >= content.size())
        return false;
    char state = content[close + 2];
    return state == 'Z' || state == 'X';
}

} // namespace

ActionResult ProcessControl::Kill(ProcessId pid)
{
    return SendSignal(pid, SIGKILL);
}

ActionResult ProcessControl::Terminate(ProcessId pid)
{
    return SendSignal(pid, SIGTERM);
}

WaitOutcome ProcessControl::WaitForExit(ProcessId pid, std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        if (IsGone(pid))
            return WaitOutcome::Exited;
        if (std::chrono::steady_clock::now() >= deadline)
            return WaitOutcome::TimedOut;
        std::this_thread::sleep_for(kPollStep);
    }
}

} // namespace sfpurge
