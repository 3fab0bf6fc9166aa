#pragma once

#include "../core/Result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sfpurge
{

struct TaskEntry
{
    std::string name;
    std::optional<std::string> program;
};

class ITaskScheduler
{
public:
    virtual ~ITaskScheduler() = default;

    /// Every task in verbose form. A task may appear more than once (one entry
    /// per trigger); callers deduplicate.
    virtual Result<std::vector<TaskEntry>> QueryAllTasks(std::chrono::milliseconds timeout) = 0;

    virtual ActionResult Disable(const std::string& name, std::chrono::milliseconds timeout) = 0;
};

} // namespace sfpurge
