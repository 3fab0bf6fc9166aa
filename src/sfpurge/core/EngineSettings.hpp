#pragma once

#include "../control/MarkerTable.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace sfpurge
{

struct Timeouts
{
    std::chrono::milliseconds service_query{ 5000 };
    std::chrono::milliseconds service_config_query{ 2000 };
    std::chrono::milliseconds driver_query{ 10000 };
    std::chrono::milliseconds task_query{ 10000 };
    std::chrono::milliseconds status_query{ 2000 };
    std::chrono::milliseconds action{ 5000 };
    std::chrono::milliseconds watchdog_kill_wait{ 2000 };
    std::chrono::milliseconds process_kill_wait{ 1000 };
    std::chrono::milliseconds settle_pause{ 1000 };
    std::chrono::milliseconds monitor_interval{ 1000 };
};

struct EngineSettings
{
    std::string product_name = "Sangfor"; // display only
    std::string vendor_keyword = "sangfor";
    std::vector<std::string> candidate_paths{ "Program Files/Sangfor", "Program Files (x86)/Sangfor" };
    std::vector<std::string> executable_extensions{ ".exe" };
    std::vector<std::string> watchdog_keywords{ "watchdog", "monitor", "service", "guard", "protect", "daemon" };

    bool loop = true;
    bool disable_startup = true;
    bool kill_watchdog_first = true;

    Timeouts timeouts;
    MarkerTable markers;
};

} // namespace sfpurge
