#include "ProcessControl.hpp"

#include <libmem/libmem.hpp>
#include <mutex>

#include <plog/Log.h>

namespace sfpurge
{

// Resolved once; the pid of a running process never changes
static ProcessId s_current_pid = 0;
static std::once_flag s_current_pid_flag;

static void InitializeCurrentPid()
{
    auto process = libmem::GetProcess();
    if (process)
        s_current_pid = static_cast<ProcessId>(process->pid);
    else
        PLOG_WARNING << "libmem::GetProcess failed, own pid unknown";
}

Result<std::vector<ProcessRecord>> ProcessControl::Snapshot()
{
    auto processes = libmem::EnumProcesses();
    if (!processes)
        return Result<std::vector<ProcessRecord>>::Failure(ErrorKind::Unexpected, "libmem::EnumProcesses failed");

    std::vector<ProcessRecord> records;
    records.reserve(processes->size());
    for (const auto& proc : *processes)
    {
        ProcessRecord record;
        record.pid = static_cast<ProcessId>(proc.pid);
        record.parent_pid = static_cast<ProcessId>(proc.ppid);
        record.executable_name = proc.name;
        records.push_back(std::move(record));
    }
    return Result<std::vector<ProcessRecord>>::Success(std::move(records));
}

ProcessId ProcessControl::CurrentProcessId() const
{
    std::call_once(s_current_pid_flag, InitializeCurrentPid);
    return s_current_pid;
}

} // namespace sfpurge
