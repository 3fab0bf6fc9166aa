#pragma once

#include "ICommandRunner.hpp"
#include "IServiceControl.hpp"
#include "MarkerTable.hpp"

namespace sfpurge
{

/// IServiceControl over the sc.exe text protocol.
class ScServiceControl : public IServiceControl
{
public:
    ScServiceControl(ICommandRunner& runner, MarkerTable markers);
    ~ScServiceControl() override = default;

    Result<std::vector<std::string>> QueryAllServices(std::chrono::milliseconds timeout) override;
    Result<std::vector<std::string>> QueryDrivers(std::chrono::milliseconds timeout) override;
    Result<std::optional<std::string>> QueryBinaryPath(const std::string& name,
                                                       std::chrono::milliseconds timeout) override;
    Result<bool> QueryIsRunning(const std::string& name, std::chrono::milliseconds timeout) override;
    ActionResult Stop(const std::string& name, std::chrono::milliseconds timeout) override;
    ActionResult DisableStartup(const std::string& name, std::chrono::milliseconds timeout) override;

    // Win32 error codes sc.exe reports through its exit status
    static constexpr int kErrorAccessDenied = 5;
    static constexpr int kErrorServiceDoesNotExist = 1060;
    static constexpr int kErrorServiceNotActive = 1062;

private:
    CommandResult RunSc(const std::vector<std::string>& args, std::chrono::milliseconds timeout);
    ErrorKind Classify(const CommandResult& result) const;
    Result<std::vector<std::string>> QueryNames(const std::vector<std::string>& args,
                                                std::chrono::milliseconds timeout);

    ICommandRunner& runner_;
    MarkerTable markers_;
};

} // namespace sfpurge
