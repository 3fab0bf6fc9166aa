#include "RestartSourceAnalyzer.hpp"

#include <algorithm>

#include <plog/Log.h>

namespace sfpurge
{

RestartSourceAnalyzer::RestartSourceAnalyzer(EngineContext& ctx)
    : ctx_(ctx)
{
}

RestartSourceReport RestartSourceAnalyzer::Build() const
{
    RestartSourceReport report;

    for (const auto& [key, service] : ctx_.services)
        report.services.push_back(service.name + " (" + ServiceMatchToString(service.matched_by) + " match)");

    for (const auto& [key, identity] : ctx_.identities)
    {
        if (identity.is_watchdog)
            report.watchdogs.push_back(identity.file_name.empty() ? identity.name : identity.file_name);
    }

    for (const auto& [key, task] : ctx_.tasks)
        report.tasks.push_back(task.name + " (" + TaskMatchToString(task.matched_by) + " match)");

    std::sort(report.services.begin(), report.services.end());
    std::sort(report.watchdogs.begin(), report.watchdogs.end());
    std::sort(report.tasks.begin(), report.tasks.end());
    return report;
}

void RestartSourceAnalyzer::Render(const RestartSourceReport& report) const
{
    auto& console = *ctx_.console;

    console.Info("");
    console.Header("Restart source analysis");

    if (report.Empty())
    {
        console.Info("[*] No restart sources identified");
        PLOG_INFO << "No restart sources identified";
        return;
    }

    if (!report.services.empty())
    {
        console.Warning("[!] Services that can relaunch processes:");
        for (const auto& line : report.services)
            console.Item(line);
    }

    if (!report.watchdogs.empty())
    {
        console.Warning("[!] Watchdog-like executables:");
        for (const auto& line : report.watchdogs)
            console.Item(line);
    }

    if (!report.tasks.empty())
    {
        console.Warning("[!] Scheduled tasks:");
        for (const auto& line : report.tasks)
            console.Item(line);
    }

    console.Info("");
    console.Info("[*] Remediation order:");
    console.Item("1. Stop and disable services, drivers and scheduled tasks");
    console.Item("2. Kill watchdog processes first");
    console.Item("3. Kill the remaining processes");
    console.Item("4. Keep monitoring and kill anything that respawns");

    PLOG_INFO << "Restart sources: " << report.services.size() << " services, " << report.watchdogs.size()
              << " watchdogs, " << report.tasks.size() << " tasks";
}

} // namespace sfpurge
