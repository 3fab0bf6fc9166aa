#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace sfpurge
{

struct CommandResult
{
    bool succeeded = false; // process started and exited with status 0
    int exit_code = -1;
    bool timed_out = false;
    std::string raw_text;   // captured stdout + stderr, UTF-8
    std::string error;      // launch or wait failure, empty otherwise
};

class ICommandRunner
{
public:
    virtual ~ICommandRunner() = default;

    /// Runs `program` with `args`, capturing its output. The child is killed
    /// when `timeout` elapses; `timed_out` is then set and `raw_text` holds
    /// whatever was read before the deadline.
    virtual CommandResult Run(const std::string& program, const std::vector<std::string>& args,
                              std::chrono::milliseconds timeout) = 0;
};

} // namespace sfpurge
