#include "MonitorLoop.hpp"
#include "../analysis/RestartSourceAnalyzer.hpp"
#include "../discovery/DirectoryLocator.hpp"
#include "../discovery/DriverResolver.hpp"
#include "../discovery/InventoryCollector.hpp"
#include "../discovery/ServiceResolver.hpp"
#include "../discovery/TaskResolver.hpp"
#include "../suppression/Suppressor.hpp"
#include "../termination/TerminationEngine.hpp"

#include <algorithm>
#include <ctime>
#include <stdexcept>

#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace sfpurge
{

namespace
{

constexpr std::chrono::milliseconds kSleepSlice{ 100 };
const std::string kRule(60, '=');

std::string WallClock()
{
    std::time_t now = std::time(nullptr);
    std::tm tm_snapshot{};
#ifdef _WIN32
    localtime_s(&tm_snapshot, &now);
#else
    localtime_r(&now, &tm_snapshot);
#endif
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &tm_snapshot);
    return buffer;
}

} // namespace

const char* MonitorStateToString(MonitorState state)
{
    switch (state)
    {
    case MonitorState::Discovering:
        return "discovering";
    case MonitorState::Suppressing:
        return "suppressing";
    case MonitorState::Monitoring:
        return "monitoring";
    case MonitorState::Stopped:
        return "stopped";
    }
    return "unknown";
}

const char* MonitorOutcomeToString(MonitorOutcome outcome)
{
    switch (outcome)
    {
    case MonitorOutcome::Running:
        return "running";
    case MonitorOutcome::NoTargets:
        return "no targets";
    case MonitorOutcome::Completed:
        return "completed";
    case MonitorOutcome::Cancelled:
        return "cancelled";
    case MonitorOutcome::Interrupted:
        return "interrupted";
    case MonitorOutcome::Failed:
        return "failed";
    }
    return "unknown";
}

MonitorLoop::MonitorLoop(EngineContext& ctx, std::atomic<bool>& cancel_token)
    : ctx_(ctx)
    , cancel_token_(cancel_token)
{
}

MonitorOutcome MonitorLoop::Run()
{
    MonitorState state = MonitorState::Discovering;
    while (state != MonitorState::Stopped)
    {
        MonitorState next = Step(state);
        if (next != state)
            PLOG_DEBUG << "Monitor state " << MonitorStateToString(state) << " -> " << MonitorStateToString(next);
        state = next;
    }

    RenderSummary();
    PLOG_INFO << "Run finished: " << MonitorOutcomeToString(outcome_);
    return outcome_;
}

MonitorState MonitorLoop::Step(MonitorState state)
{
    switch (state)
    {
    case MonitorState::Discovering:
        return Discover();
    case MonitorState::Suppressing:
        return Suppress();
    case MonitorState::Monitoring:
        return Monitor();
    case MonitorState::Stopped:
        break;
    }
    return MonitorState::Stopped;
}

MonitorState MonitorLoop::Discover()
{
    // Checked between discovery steps; an interrupt here means nothing was suppressed yet
    auto interrupted = [this]
    {
        if (!cancel_token_.load())
            return false;
        PLOG_INFO << "Discovery interrupted by user";
        outcome_ = MonitorOutcome::Interrupted;
        return true;
    };

    if (cancel_token_.load())
    {
        outcome_ = MonitorOutcome::Interrupted;
        return MonitorState::Stopped;
    }

    try
    {
        DirectoryLocator locator(ctx_);
        ctx_.directories = locator.Locate();
        if (interrupted())
            return MonitorState::Stopped;

        if (ctx_.directories.empty())
        {
            ctx_.console->Warning("");
            ctx_.console->Warning("[*] No " + ctx_.settings.product_name + " directories found, nothing to do");
            PLOG_INFO << "No " << ctx_.settings.product_name << " directories found";
            outcome_ = MonitorOutcome::NoTargets;
            return MonitorState::Stopped;
        }

        InventoryCollector(ctx_).Collect(ctx_.directories);
        if (interrupted())
            return MonitorState::Stopped;
        if (ctx_.identities.empty())
        {
            ctx_.console->Warning("");
            ctx_.console->Warning("[*] No executables found");
            PLOG_INFO << "No executables found";
        }

        ServiceResolver(ctx_).Resolve(ctx_.directories);
        if (interrupted())
            return MonitorState::Stopped;

        DriverResolver(ctx_).Resolve();
        if (interrupted())
            return MonitorState::Stopped;

        TaskResolver(ctx_).Resolve();
        if (interrupted())
            return MonitorState::Stopped;

        RestartSourceAnalyzer(ctx_).Analyze();
    }
    catch (const std::exception& ex)
    {
        ++ctx_.stats.errors;
        ctx_.console->Error(std::string("[-] Discovery failed: ") + ex.what());
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Discovery, "Discovery failed", ex.what());
        outcome_ = MonitorOutcome::Failed;
        return MonitorState::Stopped;
    }

    if (interrupted())
        return MonitorState::Stopped;

    return ctx_.HasSuppressibleTargets() ? MonitorState::Suppressing : MonitorState::Monitoring;
}

MonitorState MonitorLoop::Suppress()
{
    Suppressor(ctx_).Run();

    if (cancel_token_.load())
    {
        outcome_ = MonitorOutcome::Cancelled;
        return MonitorState::Stopped;
    }
    return MonitorState::Monitoring;
}

MonitorState MonitorLoop::Monitor()
{
    if (cancel_token_.load())
    {
        ctx_.console->Warning("");
        ctx_.console->Warning("[!] Monitoring stopped by user");
        PLOG_INFO << "Monitoring stopped by user";
        outcome_ = MonitorOutcome::Cancelled;
        return MonitorState::Stopped;
    }

    if (!monitoring_announced_ && ctx_.settings.loop)
    {
        monitoring_announced_ = true;
        ctx_.console->Header("");
        ctx_.console->Header(kRule);
        ctx_.console->Header("[*] Monitoring started (Ctrl+C to stop)");
        ctx_.console->Header(kRule);
    }

    RunIteration();

    if (!ctx_.settings.loop)
    {
        outcome_ = MonitorOutcome::Completed;
        return MonitorState::Stopped;
    }

    SleepInterval();
    return MonitorState::Monitoring;
}

void MonitorLoop::RunIteration()
{
    ++ctx_.stats.iterations;
    ctx_.console->Info("");
    ctx_.console->Info("--- Pass " + std::to_string(ctx_.stats.iterations) + " (" + WallClock() + ") ---");

    // A failing pass is reported and the loop carries on
    try
    {
        if (!ctx_.identities.empty())
            TerminationEngine(ctx_).KillAll();

        if (!ctx_.services.empty())
            Suppressor(ctx_).RestopRunningServices();
    }
    catch (const std::exception& ex)
    {
        ++ctx_.stats.errors;
        ctx_.console->Error(std::string("[-] Pass failed: ") + ex.what());
        PLOG_ERROR << "Monitoring pass " << ctx_.stats.iterations << " failed: " << ex.what();
    }
}

void MonitorLoop::SleepInterval()
{
    if (!ctx_.sleep)
        return;

    auto remaining = ctx_.settings.timeouts.monitor_interval;
    while (remaining.count() > 0 && !cancel_token_.load())
    {
        auto slice = std::min(remaining, kSleepSlice);
        ctx_.sleep(slice);
        remaining -= slice;
    }
}

void MonitorLoop::RenderSummary()
{
    if (summary_rendered_)
        return;
    summary_rendered_ = true;

    const auto& stats = ctx_.stats;
    auto& console = *ctx_.console;

    console.Header("");
    console.Header(kRule);
    console.Header("[*] Summary");
    console.Header(kRule);
    console.Success("Processes killed:   " + std::to_string(stats.processes_killed));
    console.Success("Services stopped:   " + std::to_string(stats.services_stopped));
    if (stats.services_disabled > 0)
        console.Success("Services disabled:  " + std::to_string(stats.services_disabled));
    if (stats.drivers_disabled > 0)
        console.Success("Drivers disabled:   " + std::to_string(stats.drivers_disabled));
    if (stats.tasks_disabled > 0)
        console.Success("Tasks disabled:     " + std::to_string(stats.tasks_disabled));
    if (stats.iterations > 0)
        console.Info("Monitoring passes:  " + std::to_string(stats.iterations));
    if (stats.errors > 0)
        console.Warning("Errors:             " + std::to_string(stats.errors));

    PLOG_INFO << "Summary - killed: " << stats.processes_killed << ", stopped: " << stats.services_stopped
              << ", services disabled: " << stats.services_disabled << ", drivers disabled: " << stats.drivers_disabled
              << ", tasks disabled: " << stats.tasks_disabled << ", passes: " << stats.iterations
              << ", errors: " << stats.errors;
}

} // namespace sfpurge
