#include "ServiceResolver.hpp"
#include "../control/IServiceControl.hpp"

#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace sfpurge
{

ServiceResolver::ServiceResolver(EngineContext& ctx)
    : ctx_(ctx)
{
}

size_t ServiceResolver::Resolve(const std::vector<std::filesystem::path>& directories)
{
    ctx_.console->Info("");
    ctx_.console->Info("[*] Looking for related services...");

    const auto& timeouts = ctx_.settings.timeouts;
    auto all = Attempt([&] { return ctx_.service_control->QueryAllServices(timeouts.service_query); });
    if (!all.ok())
    {
        ++ctx_.stats.errors;
        ctx_.console->Warning("[!] Unable to list services (" + std::string(ErrorKindToString(all.kind)) + ")");
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::ServiceControl, "Service listing failed",
                                            std::string(ErrorKindToString(all.kind)) + " - " + all.detail);
        return 0;
    }

    size_t added = 0;

    for (const auto& name : *all)
    {
        if (ctx_.vendor_keywords.Matches(name) && AddService(name, ServiceMatch::Name, std::nullopt))
            ++added;
    }

    std::vector<std::string> folded_directories;
    for (const auto& directory : directories)
        folded_directories.push_back(FoldCase(PathToUtf8(directory)));

    if (!folded_directories.empty())
    {
        ctx_.console->Info("    [*] Checking service binary paths...");
        for (const auto& name : *all)
        {
            if (ctx_.services.count(FoldCase(name)) > 0)
                continue;

            auto path = Attempt([&] { return ctx_.service_control->QueryBinaryPath(name, timeouts.service_config_query); });
            if (!path.ok())
            {
                // Excluded for this pass, not retried
                PLOG_DEBUG << "Binary path query failed for " << name << ": " << ErrorKindToString(path.kind) << " - "
                           << path.detail;
                continue;
            }
            if (!path->has_value())
                continue;

            if (auto directory = MatchDirectory(**path, folded_directories))
            {
                PLOG_DEBUG << "Service " << name << " path matches " << *directory;
                if (AddService(name, ServiceMatch::Path, **path))
                    ++added;
            }
        }
    }

    ctx_.console->Success("[+] Found " + std::to_string(ctx_.services.size()) + " related services");
    PLOG_INFO << "Found " << ctx_.services.size() << " related services";
    return added;
}

bool ServiceResolver::AddService(const std::string& name, ServiceMatch match, std::optional<std::string> binary_path)
{
    std::string key = FoldCase(name);
    if (ctx_.services.count(key) > 0)
        return false;

    ServiceRecord record;
    record.name = name;
    record.binary_path = std::move(binary_path);
    record.matched_by = match;

    auto running = Attempt([&] { return ctx_.service_control->QueryIsRunning(name, ctx_.settings.timeouts.status_query); });
    record.is_running = running.ok() && *running;

    const char* label = match == ServiceMatch::Name ? "[name match]" : "[path match]";
    ctx_.console->Success(std::string("    ") + label + " service: " + name);
    PLOG_INFO << "Found service (" << ServiceMatchToString(match) << " match): " << name;

    ctx_.services.emplace(std::move(key), std::move(record));
    return true;
}

std::optional<std::string> ServiceResolver::MatchDirectory(const std::string& binary_path,
                                                           const std::vector<std::string>& folded_directories) const
{
    const std::string folded_path = FoldCase(binary_path);
    for (const auto& directory : folded_directories)
    {
        if (!directory.empty() && folded_path.find(directory) != std::string::npos)
            return directory;
    }
    return std::nullopt;
}

} // namespace sfpurge
