#pragma once

#include "ICommandRunner.hpp"
#include "ITaskScheduler.hpp"
#include "MarkerTable.hpp"

namespace sfpurge
{

/// ITaskScheduler over schtasks.exe.
class SchtasksScheduler : public ITaskScheduler
{
public:
    SchtasksScheduler(ICommandRunner& runner, MarkerTable markers);
    ~SchtasksScheduler() override = default;

    Result<std::vector<TaskEntry>> QueryAllTasks(std::chrono::milliseconds timeout) override;
    ActionResult Disable(const std::string& name, std::chrono::milliseconds timeout) override;

private:
    ICommandRunner& runner_;
    MarkerTable markers_;
};

} // namespace sfpurge
