#pragma once

#include "../core/EngineContext.hpp"

#include <atomic>

namespace sfpurge
{

enum class MonitorState
{
    Discovering,
    Suppressing,
    Monitoring,
    Stopped
};

enum class MonitorOutcome
{
    Running,     // Stopped not reached yet
    NoTargets,   // no product directory on any volume
    Completed,   // single-pass mode finished its iteration
    Cancelled,   // operator stopped the loop after discovery
    Interrupted, // cancellation arrived before discovery completed
    Failed       // discovery raised an unanticipated error
};

const char* MonitorStateToString(MonitorState state);
const char* MonitorOutcomeToString(MonitorOutcome outcome);

/**
 * @brief Drives discovery, suppression and the convergence loop
 *
 * Discovery and suppression run once. Monitoring then repeats a kill pass and
 * a service re-stop pass every `monitor_interval` until `cancel_token` is set
 * (or once, when `settings.loop` is false). The cancel token is observed
 * between discovery steps and at state boundaries; the interval sleep is
 * cut into short slices so a cancellation is noticed promptly. Cancellation
 * before discovery completes ends as Interrupted.
 *
 * All sleeping goes through ctx.sleep, which tests replace.
 */
class MonitorLoop
{
public:
    MonitorLoop(EngineContext& ctx, std::atomic<bool>& cancel_token);

    MonitorOutcome Run();

    /// Executes the work of `state` and returns the next state.
    MonitorState Step(MonitorState state);

    /// One kill pass followed by one service re-stop pass.
    void RunIteration();

    /// Prints the closing statistics. Only the first call has an effect.
    void RenderSummary();

    MonitorOutcome Outcome() const { return outcome_; }

private:
    MonitorState Discover();
    MonitorState Suppress();
    MonitorState Monitor();
    void SleepInterval();

    EngineContext& ctx_;
    std::atomic<bool>& cancel_token_;
    MonitorOutcome outcome_ = MonitorOutcome::Running;
    bool monitoring_announced_ = false;
    bool summary_rendered_ = false;
};

} // namespace sfpurge
