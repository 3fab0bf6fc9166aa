#include "InventoryCollector.hpp"

#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <system_error>

namespace fs = std::filesystem;

namespace sfpurge
{

InventoryCollector::InventoryCollector(EngineContext& ctx)
    : ctx_(ctx)
{
}

bool InventoryCollector::IsExecutable(const fs::path& file) const
{
    const std::string extension = FoldCase(PathToUtf8(file.extension()));
    if (extension.empty())
        return false;

    for (const auto& candidate : ctx_.settings.executable_extensions)
    {
        if (FoldCase(candidate) == extension)
            return true;
    }
    return false;
}

size_t InventoryCollector::Collect(const std::vector<fs::path>& directories)
{
    ctx_.console->Info("");
    ctx_.console->Info("[*] Collecting executables...");

    size_t added = 0;
    for (const auto& directory : directories)
    {
        // Failures are contained per directory so sibling trees are still walked
        auto walked = Attempt(
            [&]
            {
                WalkDirectory(directory, added);
                return ActionResult::Success();
            });

        if (!walked.ok())
        {
            ++ctx_.stats.errors;
            if (walked.kind == ErrorKind::Permission)
            {
                ctx_.console->Warning("[!] Permission denied, cannot scan: " + PathToUtf8(directory));
                PLOG_WARNING << "Permission denied scanning " << PathToUtf8(directory) << ": " << walked.detail;
            }
            else
            {
                ctx_.console->Error("[!] Error scanning " + PathToUtf8(directory) + ": " + walked.detail);
                utils::ErrorReporter::ReportError(utils::ErrorCategory::Discovery, "Error scanning " + PathToUtf8(directory),
                                                  walked.detail);
            }
        }
    }

    size_t watchdogs = 0;
    std::string watchdog_list;
    for (const auto& [name, identity] : ctx_.identities)
    {
        if (!identity.is_watchdog)
            continue;
        ++watchdogs;
        if (!watchdog_list.empty())
            watchdog_list += ", ";
        watchdog_list += identity.name;
    }

    ctx_.console->Success("[+] Collected " + std::to_string(ctx_.identities.size()) + " distinct executables");
    if (watchdogs > 0)
    {
        ctx_.console->Warning("[!] " + std::to_string(watchdogs) + " possible watchdog processes: " + watchdog_list);
    }
    PLOG_INFO << "Collected " << ctx_.identities.size() << " executables (" << watchdogs << " watchdog-like)";
    return added;
}

void InventoryCollector::WalkDirectory(const fs::path& directory, size_t& added)
{
    ctx_.console->Info("    Scanning: " + PathToUtf8(directory));

    const auto options = fs::directory_options::skip_permission_denied;
    for (auto it = fs::recursive_directory_iterator(directory, options); it != fs::recursive_directory_iterator();
         ++it)
    {
        std::error_code ec;
        if (!it->is_regular_file(ec) || ec)
            continue;
        if (!IsExecutable(it->path()))
            continue;
        if (Insert(it->path()))
            ++added;
    }
}

bool InventoryCollector::Insert(const fs::path& file)
{
    std::string name = FoldCase(PathToUtf8(file.stem()));
    if (name.empty() || ctx_.identities.count(name) > 0)
        return false;

    ExecutableIdentity identity;
    identity.name = name;
    identity.is_watchdog = ctx_.watchdog_keywords.Matches(name);
    identity.file_name = PathToUtf8(file.filename());
    identity.source_path = file;

    ctx_.console->Item("found: " + identity.file_name);
    PLOG_INFO << "Found executable: " << PathToUtf8(file);
    if (identity.is_watchdog)
    {
        ctx_.console->Warning("        possible watchdog process");
        PLOG_WARNING << "Watchdog-like executable: " << identity.name;
    }

    ctx_.identities.emplace(std::move(name), std::move(identity));
    return true;
}

} // namespace sfpurge
