#pragma once

#include "../core/Result.hpp"

#include <filesystem>
#include <vector>

namespace sfpurge
{

class IVolumeEnumerator
{
public:
    virtual ~IVolumeEnumerator() = default;

    /// Root directories of fixed local volumes ("C:\\", "/", ...).
    virtual Result<std::vector<std::filesystem::path>> ListFixedVolumes() = 0;
};

} // namespace sfpurge
