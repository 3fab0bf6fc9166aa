#pragma once

#include "../core/EngineContext.hpp"

#include <string>
#include <vector>

namespace sfpurge
{

struct RestartSourceReport
{
    std::vector<std::string> services;  // "<name> (<match> match)"
    std::vector<std::string> watchdogs; // original file names
    std::vector<std::string> tasks;     // "<name> (<match> match)"

    bool Empty() const { return services.empty() && watchdogs.empty() && tasks.empty(); }
};

/// Summarizes which discovered items can relaunch a killed process and prints
/// the remediation order. Pure reporting, never fails.
class RestartSourceAnalyzer
{
public:
    explicit RestartSourceAnalyzer(EngineContext& ctx);

    RestartSourceReport Build() const;
    void Render(const RestartSourceReport& report) const;

    RestartSourceReport Analyze() const
    {
        auto report = Build();
        Render(report);
        return report;
    }

private:
    EngineContext& ctx_;
};

} // namespace sfpurge
