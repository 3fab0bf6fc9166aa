#pragma once

#include "../core/EngineContext.hpp"

#include <chrono>
#include <vector>

namespace sfpurge
{

struct KillCandidate
{
    ProcessRecord process;
    std::string identity; // folded stem
    bool is_watchdog = false;
};

/**
 * @brief Kills every live process whose executable matches a known identity
 *
 * Watchdogs go first so they cannot relaunch the rest while it is being
 * killed, then a short pause lets respawns settle before the second phase.
 * Each kill is confirmed by waiting for exit; an unconfirmed kill is
 * escalated once, never retried.
 */
class TerminationEngine
{
public:
    explicit TerminationEngine(EngineContext& ctx);

    /// One pass. Returns the number of processes confirmed terminated.
    size_t KillAll();

    /// Matching live processes, sorted by pid. Never includes this process.
    std::vector<KillCandidate> CollectCandidates();

private:
    size_t KillPhase(const std::vector<KillCandidate>& candidates, std::chrono::milliseconds wait);
    bool KillOne(const KillCandidate& candidate, std::chrono::milliseconds wait);

    EngineContext& ctx_;
};

} // namespace sfpurge
