#include "../VolumeEnumerator.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace sfpurge
{

namespace
{

// /proc/mounts escapes spaces and tabs as octal sequences
std::string UnescapeMountPoint(const std::string& field)
{
    std::string out;
    for (size_t i = 0; i < field.size(); ++i)
    {
        if (field[i] == '\\' && i + 3 < field.size())
        {
            const std::string octal = field.substr(i + 1, 3);
            if (std::all_of(octal.begin(), octal.end(), [](char c) { return c >= '0' && c <= '7'; }))
            {
                out += static_cast<char>(std::stoi(octal, nullptr, 8));
                i += 3;
                continue;
            }
        }
        out += field[i];
    }
    return out;
}

} // namespace

Result<std::vector<std::filesystem::path>> VolumeEnumerator::ListFixedVolumes()
{
    std::vector<std::filesystem::path> volumes{ "/" };

    std::ifstream mounts("/proc/mounts");
    if (!mounts.is_open())
        return Result<std::vector<std::filesystem::path>>::Success(std::move(volumes));

    std::string line;
    while (std::getline(mounts, line))
    {
        std::istringstream fields(line);
        std::string device;
        std::string mount_point;
        if (!(fields >> device >> mount_point))
            continue;
        if (device.rfind("/dev/", 0) != 0)
            continue;

        std::filesystem::path path(UnescapeMountPoint(mount_point));
        if (std::find(volumes.begin(), volumes.end(), path) == volumes.end())
            volumes.push_back(std::move(path));
    }
    return Result<std::vector<std::filesystem::path>>::Success(std::move(volumes));
}

} // namespace sfpurge
