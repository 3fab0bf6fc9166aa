#pragma once

#include "../core/EngineContext.hpp"

#include <filesystem>
#include <vector>

namespace sfpurge
{

/**
 * @brief Finds services belonging to the target product
 *
 * Pass 1 matches service names against the vendor keyword. Pass 2 asks every
 * remaining service for its binary path and matches it against the located
 * install directories. The path test is a plain case-insensitive substring
 * test, so a path that merely embeds a directory string also matches.
 */
class ServiceResolver
{
public:
    explicit ServiceResolver(EngineContext& ctx);

    /// Adds matches to ctx.services. Returns the number of services added.
    size_t Resolve(const std::vector<std::filesystem::path>& directories);

private:
    bool AddService(const std::string& name, ServiceMatch match, std::optional<std::string> binary_path);
    std::optional<std::string> MatchDirectory(const std::string& binary_path,
                                              const std::vector<std::string>& folded_directories) const;

    EngineContext& ctx_;
};

} // namespace sfpurge
