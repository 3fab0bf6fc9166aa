#include "DirectoryLocator.hpp"
#include "IVolumeEnumerator.hpp"

#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace sfpurge
{

DirectoryLocator::DirectoryLocator(EngineContext& ctx)
    : ctx_(ctx)
{
}

std::vector<fs::path> DirectoryLocator::Locate()
{
    std::vector<fs::path> found;

    auto volumes = Attempt([this] { return ctx_.volume_enumerator->ListFixedVolumes(); });
    if (!volumes.ok())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Discovery, "Unable to enumerate local volumes",
                                          volumes.detail);
        ctx_.console->Error("[!] Unable to enumerate local volumes: " + volumes.detail);
        ++ctx_.stats.errors;
        return found;
    }

    std::string listing;
    for (const auto& volume : *volumes)
    {
        if (!listing.empty())
            listing += ", ";
        listing += PathToUtf8(volume);
    }
    ctx_.console->Info("[*] Local volumes: " + (listing.empty() ? std::string("(none)") : listing));
    PLOG_INFO << "Local volumes: " << listing;

    for (const auto& volume : *volumes)
    {
        for (const auto& candidate : ctx_.settings.candidate_paths)
        {
            fs::path full = (volume / PathFromUtf8(candidate)).make_preferred();

            std::error_code ec;
            bool exists = fs::is_directory(full, ec);
            if (ec)
            {
                // Volume not ready or not readable; try the next candidate
                PLOG_DEBUG << "Probe failed for " << PathToUtf8(full) << ": " << ec.message();
                continue;
            }
            if (!exists)
                continue;

            if (std::find(found.begin(), found.end(), full) != found.end())
                continue;

            ctx_.console->Success("[+] Found " + ctx_.settings.product_name + " directory: " + PathToUtf8(full));
            PLOG_INFO << "Found install directory: " << PathToUtf8(full);
            found.push_back(std::move(full));
        }
    }

    return found;
}

} // namespace sfpurge
