#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/types.h>
#endif

namespace sfpurge
{

#ifdef _WIN32
using ProcessId = DWORD;
#else
using ProcessId = pid_t;
#endif

struct ExecutableIdentity
{
    std::string name;      // folded filename stem, unique key
    bool is_watchdog = false;
    std::string file_name; // original filename as first seen
    std::filesystem::path source_path;
};

enum class ServiceMatch
{
    Name,
    Path
};

struct ServiceRecord
{
    std::string name;
    std::optional<std::string> binary_path;
    // Snapshot taken at discovery. Callers that need the current state query
    // IServiceControl::QueryIsRunning instead of reading this.
    bool is_running = false;
    ServiceMatch matched_by = ServiceMatch::Name;
};

struct DriverRecord
{
    std::string name;
};

enum class TaskMatch
{
    Name,
    Path,
    Program
};

struct ScheduledTaskRecord
{
    std::string name;
    std::optional<std::string> program;
    TaskMatch matched_by = TaskMatch::Name;
    std::string matched_identity;
};

struct ProcessRecord
{
    ProcessId pid = 0;
    ProcessId parent_pid = 0;
    std::string executable_name;
};

// All discovery sets are keyed by the case-folded name so that duplicates
// collapse and iteration order is deterministic.
using IdentitySet = std::map<std::string, ExecutableIdentity>;
using ServiceSet = std::map<std::string, ServiceRecord>;
using DriverSet = std::map<std::string, DriverRecord>;
using TaskSet = std::map<std::string, ScheduledTaskRecord>;

inline const char* ServiceMatchToString(ServiceMatch m)
{
    return m == ServiceMatch::Name ? "name" : "path";
}

inline const char* TaskMatchToString(TaskMatch m)
{
    switch (m)
    {
    case TaskMatch::Name:
        return "name";
    case TaskMatch::Path:
        return "path";
    case TaskMatch::Program:
        return "program";
    }
    return "unknown";
}

} // namespace sfpurge
