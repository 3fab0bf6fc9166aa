#pragma once

#include "../control/IProcessControl.hpp"

namespace sfpurge
{

/// Live process control. Snapshot goes through libmem on every platform;
/// kill/terminate/wait are implemented in win/ and linux/.
class ProcessControl : public IProcessControl
{
public:
    Result<std::vector<ProcessRecord>> Snapshot() override;
    ProcessId CurrentProcessId() const override;
    ActionResult Kill(ProcessId pid) override;
    ActionResult Terminate(ProcessId pid) override;
    WaitOutcome WaitForExit(ProcessId pid, std::chrono::milliseconds timeout) override;
};

} // namespace sfpurge
