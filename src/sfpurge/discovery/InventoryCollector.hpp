#pragma once

#include "../core/EngineContext.hpp"
#include "../core/Result.hpp"

#include <filesystem>
#include <vector>

namespace sfpurge
{

/// Builds the executable identity set from the located install directories.
class InventoryCollector
{
public:
    explicit InventoryCollector(EngineContext& ctx);

    /// Walks every directory and inserts new identities into ctx.identities.
    /// Returns the number of identities added by this call.
    size_t Collect(const std::vector<std::filesystem::path>& directories);

    bool IsExecutable(const std::filesystem::path& file) const;

private:
    void WalkDirectory(const std::filesystem::path& directory, size_t& added);
    bool Insert(const std::filesystem::path& file);

    EngineContext& ctx_;
};

} // namespace sfpurge
