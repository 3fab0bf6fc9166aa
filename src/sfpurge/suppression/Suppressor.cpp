#include "Suppressor.hpp"
#include "../control/IServiceControl.hpp"
#include "../control/ITaskScheduler.hpp"

#include <plog/Log.h>

namespace sfpurge
{

Suppressor::Suppressor(EngineContext& ctx)
    : ctx_(ctx)
{
}

SuppressionSummary Suppressor::Run()
{
    SuppressionSummary summary;

    if (!ctx_.drivers.empty())
        DisableDrivers(summary);
    if (!ctx_.services.empty())
        StopAndDisableServices(summary);
    if (!ctx_.tasks.empty())
        DisableTasks(summary);

    ctx_.stats.drivers_disabled += summary.drivers_disabled;
    ctx_.stats.services_stopped += summary.services_stopped;
    ctx_.stats.services_disabled += summary.services_disabled;
    ctx_.stats.tasks_disabled += summary.tasks_disabled;
    ctx_.stats.errors += summary.failures;

    PLOG_INFO << "Suppression done: drivers=" << summary.drivers_disabled << " stopped=" << summary.services_stopped
              << " disabled=" << summary.services_disabled << " tasks=" << summary.tasks_disabled
              << " failures=" << summary.failures;
    return summary;
}

void Suppressor::DisableDrivers(SuppressionSummary& summary)
{
    const auto timeout = ctx_.settings.timeouts.action;

    ctx_.console->Info("");
    ctx_.console->Info("[*] Disabling driver services...");

    for (const auto& [key, driver] : ctx_.drivers)
    {
        // A driver that is not loaded reports a failure here; disabling it still matters
        auto stop = Attempt([&] { return ctx_.service_control->Stop(driver.name, timeout); });
        if (!stop.ok())
            PLOG_DEBUG << "Driver stop failed for " << driver.name << ": " << stop.detail;

        auto disable = Attempt([&] { return ctx_.service_control->DisableStartup(driver.name, timeout); });
        if (disable.ok())
        {
            ++summary.drivers_disabled;
            ctx_.console->Success("    [+] Disabled driver: " + driver.name);
            PLOG_INFO << "Disabled driver " << driver.name;
        }
        else
        {
            ++summary.failures;
            ReportFailure("disable driver", driver.name, disable, utils::ErrorCategory::ServiceControl);
        }
    }
}

void Suppressor::StopAndDisableServices(SuppressionSummary& summary)
{
    const auto& timeouts = ctx_.settings.timeouts;

    ctx_.console->Info("");
    ctx_.console->Info("[*] Stopping and disabling services...");

    for (const auto& [key, service] : ctx_.services)
    {
        auto running = Attempt([&] { return ctx_.service_control->QueryIsRunning(service.name, timeouts.status_query); });
        if (!running.ok())
        {
            PLOG_WARNING << "Status query failed for " << service.name << ": " << ErrorKindToString(running.kind)
                         << " - " << running.detail;
        }
        else if (*running)
        {
            if (StopService(service.name))
                ++summary.services_stopped;
            else
                ++summary.failures;
        }

        // Attempted whatever the stop outcome was
        if (!ctx_.settings.disable_startup)
            continue;

        auto disable = Attempt([&] { return ctx_.service_control->DisableStartup(service.name, timeouts.action); });
        if (disable.ok())
        {
            ++summary.services_disabled;
            ctx_.console->Success("    [+] Disabled startup: " + service.name);
            PLOG_INFO << "Disabled startup for service " << service.name;
        }
        else
        {
            ++summary.failures;
            ReportFailure("disable startup", service.name, disable, utils::ErrorCategory::ServiceControl);
        }
    }
}

void Suppressor::DisableTasks(SuppressionSummary& summary)
{
    const auto timeout = ctx_.settings.timeouts.action;

    ctx_.console->Info("");
    ctx_.console->Info("[*] Disabling scheduled tasks...");

    for (const auto& [key, task] : ctx_.tasks)
    {
        auto disable = Attempt([&] { return ctx_.task_scheduler->Disable(task.name, timeout); });
        if (disable.ok())
        {
            ++summary.tasks_disabled;
            ctx_.console->Success("    [+] Disabled task: " + task.name);
            PLOG_INFO << "Disabled scheduled task " << task.name;
        }
        else
        {
            ++summary.failures;
            ReportFailure("disable task", task.name, disable, utils::ErrorCategory::Scheduler);
        }
    }
}

size_t Suppressor::RestopRunningServices()
{
    size_t stopped = 0;
    for (const auto& [key, service] : ctx_.services)
    {
        auto running = Attempt(
            [&] { return ctx_.service_control->QueryIsRunning(service.name, ctx_.settings.timeouts.status_query); });
        if (!running.ok() || !*running)
            continue;

        ctx_.console->Warning("    [!] Service running again: " + service.name);
        if (StopService(service.name))
            ++stopped;
        else
            ++ctx_.stats.errors;
    }
    ctx_.stats.services_stopped += stopped;
    return stopped;
}

bool Suppressor::StopService(const std::string& name)
{
    auto stop = Attempt([&] { return ctx_.service_control->Stop(name, ctx_.settings.timeouts.action); });
    if (stop.ok())
    {
        ctx_.console->Success("    [+] Stopped service: " + name);
        PLOG_INFO << "Stopped service " << name;
        return true;
    }

    ReportFailure("stop service", name, stop, utils::ErrorCategory::ServiceControl);
    return false;
}

void Suppressor::ReportFailure(const std::string& what, const std::string& name, const ActionResult& result,
                               utils::ErrorCategory category)
{
    std::string line = "    [-] Failed to " + what + ": " + name + " (" + ErrorKindToString(result.kind) + ")";
    if (result.kind == ErrorKind::Permission || result.kind == ErrorKind::Timeout)
        ctx_.console->Warning(line);
    else
        ctx_.console->Error(line);

    utils::ErrorReporter::ReportWarning(category, "Failed to " + what + " " + name,
                                        std::string(ErrorKindToString(result.kind)) + " - " + result.detail);
}

} // namespace sfpurge
