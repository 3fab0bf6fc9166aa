#pragma once

#include "EngineSettings.hpp"
#include "MatchPolicy.hpp"
#include "Types.hpp"
#include "../console/IConsoleSink.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <vector>

namespace sfpurge
{

class IVolumeEnumerator;
class IServiceControl;
class ITaskScheduler;
class IProcessControl;

struct Statistics
{
    size_t processes_killed = 0;
    size_t services_stopped = 0;
    size_t services_disabled = 0;
    size_t drivers_disabled = 0;
    size_t tasks_disabled = 0;
    size_t iterations = 0;
    size_t errors = 0;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief State shared by every engine component for one run
 *
 * Collaborators are borrowed; whoever builds the context owns them and keeps
 * them alive for the whole run. The discovery sets are filled once during
 * discovery and only read afterwards.
 */
struct EngineContext
{
    EngineSettings settings;
    KeywordSet vendor_keywords;
    KeywordSet watchdog_keywords;

    IVolumeEnumerator* volume_enumerator = nullptr;
    IServiceControl* service_control = nullptr;
    ITaskScheduler* task_scheduler = nullptr;
    IProcessControl* process_control = nullptr;
    ConsolePtr console;
    Sleeper sleep;

    std::vector<std::filesystem::path> directories;
    IdentitySet identities;
    ServiceSet services;
    DriverSet drivers;
    TaskSet tasks;

    Statistics stats;

    /// Rebuilds the keyword sets from `settings`. Call after changing settings.
    void ApplySettings()
    {
        vendor_keywords = KeywordSet{};
        vendor_keywords.Add(settings.vendor_keyword);
        watchdog_keywords = KeywordSet(settings.watchdog_keywords);
    }

    bool HasSuppressibleTargets() const { return !drivers.empty() || !services.empty() || !tasks.empty(); }
};

} // namespace sfpurge
