#pragma once

#include "IServiceControl.hpp"
#include "ITaskScheduler.hpp"

namespace sfpurge {

// Stand-ins for hosts without a Windows service control manager or task
// scheduler: registries are empty and every action reports NotFound.

class NullServiceControl : public IServiceControl {
public:
    ~NullServiceControl() override = default;

    Result<std::vector<std::string>> QueryAllServices(std::chrono::milliseconds) override {
        return Result<std::vector<std::string>>::Success({});
    }
    Result<std::vector<std::string>> QueryDrivers(std::chrono::milliseconds) override {
        return Result<std::vector<std::string>>::Success({});
    }
    Result<std::optional<std::string>> QueryBinaryPath(const std::string& name, std::chrono::milliseconds) override {
        return Result<std::optional<std::string>>::Failure(ErrorKind::NotFound, "no service manager: " + name);
    }
    Result<bool> QueryIsRunning(const std::string& name, std::chrono::milliseconds) override {
        return Result<bool>::Failure(ErrorKind::NotFound, "no service manager: " + name);
    }
    ActionResult Stop(const std::string& name, std::chrono::milliseconds) override {
        return ActionResult::Failure(ErrorKind::NotFound, "no service manager: " + name);
    }
    ActionResult DisableStartup(const std::string& name, std::chrono::milliseconds) override {
        return ActionResult::Failure(ErrorKind::NotFound, "no service manager: " + name);
    }
};

class NullTaskScheduler : public ITaskScheduler {
public:
    ~NullTaskScheduler() override = default;

    Result<std::vector<TaskEntry>> QueryAllTasks(std::chrono::milliseconds) override {
        return Result<std::vector<TaskEntry>>::Success({});
    }
    ActionResult Disable(const std::string& name, std::chrono::milliseconds) override {
        return ActionResult::Failure(ErrorKind::NotFound, "no task scheduler: " + name);
    }
};

} // namespace sfpurge
