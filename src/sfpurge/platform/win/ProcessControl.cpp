#include "../ProcessControl.hpp"

#include <windows.h>

#include <plog/Log.h>

namespace sfpurge
{

namespace
{

ErrorKind ClassifyWin32Error(DWORD error)
{
    switch (error)
    {
    case ERROR_ACCESS_DENIED:
        return ErrorKind::Permission;
    case ERROR_INVALID_PARAMETER: // pid no longer names a process
    case ERROR_NOT_FOUND:
        return ErrorKind::NotFound;
    default:
        return ErrorKind::Unexpected;
    }
}

HANDLE OpenForTermination(ProcessId pid)
{
    // SYNCHRONIZE lets a failed terminate tell an exiting process from a protected one
    HANDLE process = OpenProcess(PROCESS_TERMINATE | SYNCHRONIZE, FALSE, pid);
    if (!process && GetLastError() == ERROR_ACCESS_DENIED)
        process = OpenProcess(PROCESS_TERMINATE, FALSE, pid);
    return process;
}

ActionResult TerminateWithFreshHandle(ProcessId pid, const char* what)
{
    HANDLE process = OpenForTermination(pid);
    if (!process)
    {
        DWORD err = GetLastError();
        return ActionResult::Failure(ClassifyWin32Error(err),
                                     std::string("OpenProcess failed (") + what + "): " + std::to_string(err));
    }

    BOOL ok = TerminateProcess(process, 1);
    DWORD err = ok ? ERROR_SUCCESS : GetLastError();

    // Terminating a process that is already exiting reports access denied
    bool exited = !ok && err == ERROR_ACCESS_DENIED && WaitForSingleObject(process, 0) == WAIT_OBJECT_0;
    CloseHandle(process);

    if (exited)
    {
        return ActionResult::Failure(ErrorKind::NotFound,
                                     std::string("process already exited (") + what + "): " + std::to_string(pid));
    }
    if (!ok)
    {
        return ActionResult::Failure(ClassifyWin32Error(err),
                                     std::string("TerminateProcess failed (") + what + "): " + std::to_string(err));
    }
    return ActionResult::Success();
}

} // namespace

ActionResult ProcessControl::Kill(ProcessId pid)
{
    return TerminateWithFreshHandle(pid, "kill");
}

ActionResult ProcessControl::Terminate(ProcessId pid)
{
    return TerminateWithFreshHandle(pid, "terminate");
}

WaitOutcome ProcessControl::WaitForExit(ProcessId pid, std::chrono::milliseconds timeout)
{
    HANDLE process = OpenProcess(SYNCHRONIZE, FALSE, pid);
    if (!process)
    {
        DWORD err = GetLastError();
        if (err == ERROR_INVALID_PARAMETER)
            return WaitOutcome::Exited;
        PLOG_DEBUG << "OpenProcess(SYNCHRONIZE) failed for " << pid << ": " << err;
        return WaitOutcome::Failed;
    }

    DWORD wait = WaitForSingleObject(process, static_cast<DWORD>(timeout.count()));
    CloseHandle(process);

    switch (wait)
    {
    case WAIT_OBJECT_0:
        return WaitOutcome::Exited;
    case WAIT_TIMEOUT:
        return WaitOutcome::TimedOut;
    default:
        return WaitOutcome::Failed;
    }
}

} // namespace sfpurge
