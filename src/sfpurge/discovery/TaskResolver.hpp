#pragma once

#include "../core/EngineContext.hpp"
#include "../control/ITaskScheduler.hpp"

#include <optional>

namespace sfpurge
{

/// Matches scheduled tasks by name, by program path, then by a program that
/// references a known executable identity. First rule that fires wins.
class TaskResolver
{
public:
    explicit TaskResolver(EngineContext& ctx);

    size_t Resolve();

    /// Matching rule for a single entry, nullopt when the task is unrelated.
    std::optional<ScheduledTaskRecord> Match(const TaskEntry& entry) const;

private:
    EngineContext& ctx_;
};

} // namespace sfpurge
