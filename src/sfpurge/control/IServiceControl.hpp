#pragma once

#include "../core/Result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sfpurge
{

class IServiceControl
{
public:
    virtual ~IServiceControl() = default;

    /// Names of every Win32 service, in registry order.
    virtual Result<std::vector<std::string>> QueryAllServices(std::chrono::milliseconds timeout) = 0;

    /// Names of every kernel/file-system driver entry.
    virtual Result<std::vector<std::string>> QueryDrivers(std::chrono::milliseconds timeout) = 0;

    /// Configured binary path. An engaged empty optional means the service
    /// exists but reports no path.
    virtual Result<std::optional<std::string>> QueryBinaryPath(const std::string& name,
                                                               std::chrono::milliseconds timeout) = 0;

    virtual Result<bool> QueryIsRunning(const std::string& name, std::chrono::milliseconds timeout) = 0;

    /// Succeeds once the stop request is acknowledged (stop pending or stopped).
    virtual ActionResult Stop(const std::string& name, std::chrono::milliseconds timeout) = 0;

    virtual ActionResult DisableStartup(const std::string& name, std::chrono::milliseconds timeout) = 0;
};

} // namespace sfpurge
