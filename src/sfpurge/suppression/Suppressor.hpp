#pragma once

#include "../core/EngineContext.hpp"
#include "../core/Result.hpp"
#include "utils/ErrorReporter.hpp"

namespace sfpurge
{

struct SuppressionSummary
{
    size_t drivers_disabled = 0;
    size_t services_stopped = 0;
    size_t services_disabled = 0;
    size_t tasks_disabled = 0;
    size_t failures = 0;
};

/**
 * @brief Disables every restart vector found during discovery
 *
 * Drivers, services and scheduled tasks are handled in that order. Every
 * target gets its own timeout and a failed target never stops the rest.
 * Statistics are added to ctx.stats as well as returned.
 */
class Suppressor
{
public:
    explicit Suppressor(EngineContext& ctx);

    SuppressionSummary Run();

    void DisableDrivers(SuppressionSummary& summary);
    void StopAndDisableServices(SuppressionSummary& summary);
    void DisableTasks(SuppressionSummary& summary);

    /// Stops services that came back to life. Used once per monitoring pass;
    /// start mode is left alone. Returns the number of services stopped.
    size_t RestopRunningServices();

private:
    bool StopService(const std::string& name);
    void ReportFailure(const std::string& what, const std::string& name, const ActionResult& result,
                       utils::ErrorCategory category);

    EngineContext& ctx_;
};

} // namespace sfpurge
