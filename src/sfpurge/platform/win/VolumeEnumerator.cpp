#include "../VolumeEnumerator.hpp"

#include <windows.h>

namespace sfpurge
{

Result<std::vector<std::filesystem::path>> VolumeEnumerator::ListFixedVolumes()
{
    DWORD length = GetLogicalDriveStringsW(0, nullptr);
    if (length == 0)
    {
        return Result<std::vector<std::filesystem::path>>::Failure(
            ErrorKind::Unexpected, "GetLogicalDriveStringsW failed: " + std::to_string(GetLastError()));
    }

    std::wstring buffer(length, L'\0');
    length = GetLogicalDriveStringsW(length, buffer.data());

    std::vector<std::filesystem::path> volumes;
    for (const wchar_t* drive = buffer.c_str(); *drive; drive += wcslen(drive) + 1)
    {
        if (GetDriveTypeW(drive) == DRIVE_FIXED)
            volumes.emplace_back(drive);
    }
    return Result<std::vector<std::filesystem::path>>::Success(std::move(volumes));
}

} // namespace sfpurge
