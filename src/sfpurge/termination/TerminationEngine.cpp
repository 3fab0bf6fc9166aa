#include "TerminationEngine.hpp"
#include "../control/IProcessControl.hpp"

#include <algorithm>

#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace sfpurge
{

TerminationEngine::TerminationEngine(EngineContext& ctx)
    : ctx_(ctx)
{
}

std::vector<KillCandidate> TerminationEngine::CollectCandidates()
{
    std::vector<KillCandidate> candidates;
    if (ctx_.identities.empty())
        return candidates;

    auto snapshot = Attempt([&] { return ctx_.process_control->Snapshot(); });
    if (!snapshot.ok())
    {
        ++ctx_.stats.errors;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::ProcessControl, "Process snapshot failed",
                                            std::string(ErrorKindToString(snapshot.kind)) + " - " + snapshot.detail);
        return candidates;
    }

    const ProcessId self = ctx_.process_control->CurrentProcessId();
    for (const auto& process : *snapshot)
    {
        if (process.pid == self)
            continue;

        std::string stem = FoldedStem(process.executable_name);
        auto it = ctx_.identities.find(stem);
        if (it == ctx_.identities.end())
            continue;

        candidates.push_back(KillCandidate{ process, std::move(stem), it->second.is_watchdog });
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const KillCandidate& a, const KillCandidate& b) { return a.process.pid < b.process.pid; });
    return candidates;
}

size_t TerminationEngine::KillAll()
{
    auto candidates = CollectCandidates();
    if (candidates.empty())
        return 0;

    const auto& timeouts = ctx_.settings.timeouts;
    size_t killed = 0;

    if (!ctx_.settings.kill_watchdog_first)
    {
        killed = KillPhase(candidates, timeouts.watchdog_kill_wait);
    }
    else
    {
        std::vector<KillCandidate> watchdogs;
        std::vector<KillCandidate> others;
        for (auto& candidate : candidates)
            (candidate.is_watchdog ? watchdogs : others).push_back(std::move(candidate));

        if (!watchdogs.empty())
        {
            ctx_.console->Warning("    [*] Killing watchdog processes first...");
            killed += KillPhase(watchdogs, timeouts.watchdog_kill_wait);
            if (ctx_.sleep)
                ctx_.sleep(timeouts.settle_pause);
        }

        if (!others.empty())
            killed += KillPhase(others, timeouts.process_kill_wait);
    }

    ctx_.stats.processes_killed += killed;
    if (killed > 0)
    {
        ctx_.console->Success("    [+] Killed " + std::to_string(killed) + " processes");
        PLOG_INFO << "Killed " << killed << " processes this pass";
    }
    return killed;
}

size_t TerminationEngine::KillPhase(const std::vector<KillCandidate>& candidates, std::chrono::milliseconds wait)
{
    size_t killed = 0;
    for (const auto& candidate : candidates)
    {
        if (KillOne(candidate, wait))
            ++killed;
    }
    return killed;
}

bool TerminationEngine::KillOne(const KillCandidate& candidate, std::chrono::milliseconds wait)
{
    const auto& process = candidate.process;
    const std::string label = process.executable_name + " (PID: " + std::to_string(process.pid) + ")";

    auto kill = Attempt([&] { return ctx_.process_control->Kill(process.pid); });
    if (!kill.ok())
    {
        if (kill.kind == ErrorKind::NotFound)
        {
            PLOG_DEBUG << "Process already gone: " << label;
            return false;
        }

        ++ctx_.stats.errors;
        ctx_.console->Error("    [-] Failed to kill " + label + " (" + ErrorKindToString(kill.kind) + ")");
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::ProcessControl, "Kill failed for " + label,
                                            std::string(ErrorKindToString(kill.kind)) + " - " + kill.detail);
        return false;
    }

    auto outcome = ctx_.process_control->WaitForExit(process.pid, wait);
    if (outcome == WaitOutcome::TimedOut)
    {
        PLOG_WARNING << "Process did not exit in time, escalating: " << label;
        auto terminate = Attempt([&] { return ctx_.process_control->Terminate(process.pid); });
        if (!terminate.ok() && terminate.kind != ErrorKind::NotFound)
            PLOG_WARNING << "Terminate failed for " << label << ": " << terminate.detail;
        outcome = ctx_.process_control->WaitForExit(process.pid, wait);
    }

    if (outcome != WaitOutcome::Exited)
    {
        ++ctx_.stats.errors;
        ctx_.console->Error("    [-] Could not confirm exit of " + label);
        PLOG_WARNING << "Exit not confirmed for " << label;
        return false;
    }

    ctx_.console->Success(std::string("    [+] Killed ") + (candidate.is_watchdog ? "watchdog " : "") + label);
    PLOG_INFO << "Killed " << label;
    return true;
}

} // namespace sfpurge
