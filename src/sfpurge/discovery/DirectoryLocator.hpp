#pragma once

#include "../core/EngineContext.hpp"

#include <filesystem>
#include <vector>

namespace sfpurge
{

/// Probes every candidate install path on every fixed volume.
class DirectoryLocator
{
public:
    explicit DirectoryLocator(EngineContext& ctx);

    /// Existing install directories, in volume order then candidate order.
    /// Never throws; an unreadable volume is skipped.
    std::vector<std::filesystem::path> Locate();

private:
    EngineContext& ctx_;
};

} // namespace sfpurge
