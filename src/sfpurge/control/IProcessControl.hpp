#pragma once

#include "../core/Result.hpp"
#include "../core/Types.hpp"

#include <chrono>
#include <vector>

namespace sfpurge
{

enum class WaitOutcome
{
    Exited,
    TimedOut,
    Failed
};

class IProcessControl
{
public:
    virtual ~IProcessControl() = default;

    virtual Result<std::vector<ProcessRecord>> Snapshot() = 0;

    virtual ProcessId CurrentProcessId() const = 0;

    /// Forceful kill (TerminateProcess / SIGKILL). A process that is already
    /// gone yields ErrorKind::NotFound.
    virtual ActionResult Kill(ProcessId pid) = 0;

    /// Escalation used when a kill was not confirmed in time.
    virtual ActionResult Terminate(ProcessId pid) = 0;

    /// Waits until `pid` exits. A process that no longer exists counts as exited.
    virtual WaitOutcome WaitForExit(ProcessId pid, std::chrono::milliseconds timeout) = 0;
};

} // namespace sfpurge
