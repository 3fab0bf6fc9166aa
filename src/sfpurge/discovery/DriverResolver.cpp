#include "DriverResolver.hpp"
#include "../control/IServiceControl.hpp"

#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace sfpurge
{

DriverResolver::DriverResolver(EngineContext& ctx)
    : ctx_(ctx)
{
}

size_t DriverResolver::Resolve()
{
    ctx_.console->Info("");
    ctx_.console->Info("[*] Looking for driver services...");

    auto drivers = Attempt([&] { return ctx_.service_control->QueryDrivers(ctx_.settings.timeouts.driver_query); });
    if (!drivers.ok())
    {
        ++ctx_.stats.errors;
        ctx_.console->Warning("[!] Unable to list drivers (" + std::string(ErrorKindToString(drivers.kind)) + ")");
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::ServiceControl, "Driver listing failed",
                                            std::string(ErrorKindToString(drivers.kind)) + " - " + drivers.detail);
        return 0;
    }

    size_t added = 0;
    for (const auto& name : *drivers)
    {
        if (!ctx_.vendor_keywords.Matches(name))
            continue;

        auto [it, inserted] = ctx_.drivers.emplace(FoldCase(name), DriverRecord{ name });
        if (!inserted)
            continue;

        ++added;
        ctx_.console->Success("    [driver] " + name);
        PLOG_INFO << "Found driver service: " << name;
    }

    if (ctx_.drivers.empty())
        ctx_.console->Info("[*] No driver services found");
    else
        ctx_.console->Success("[+] Found " + std::to_string(ctx_.drivers.size()) + " driver services");

    return added;
}

} // namespace sfpurge
