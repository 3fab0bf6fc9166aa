#pragma once

#include "../discovery/IVolumeEnumerator.hpp"

namespace sfpurge
{

/// Windows: logical drives of type DRIVE_FIXED.
/// Linux: "/" plus every mount point backed by a /dev block device.
class VolumeEnumerator : public IVolumeEnumerator
{
public:
    Result<std::vector<std::filesystem::path>> ListFixedVolumes() override;
};

} // namespace sfpurge
