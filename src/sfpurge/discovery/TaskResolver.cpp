#include "TaskResolver.hpp"

#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace sfpurge
{

TaskResolver::TaskResolver(EngineContext& ctx)
    : ctx_(ctx)
{
}

std::optional<ScheduledTaskRecord> TaskResolver::Match(const TaskEntry& entry) const
{
    ScheduledTaskRecord record;
    record.name = entry.name;
    record.program = entry.program;

    if (ctx_.vendor_keywords.Matches(entry.name))
    {
        record.matched_by = TaskMatch::Name;
        return record;
    }

    if (!entry.program)
        return std::nullopt;

    if (ctx_.vendor_keywords.Matches(*entry.program))
    {
        record.matched_by = TaskMatch::Path;
        return record;
    }

    const std::string folded_program = FoldCase(*entry.program);
    for (const auto& [name, identity] : ctx_.identities)
    {
        if (folded_program.find(name) != std::string::npos)
        {
            record.matched_by = TaskMatch::Program;
            record.matched_identity = name;
            return record;
        }
    }

    return std::nullopt;
}

size_t TaskResolver::Resolve()
{
    ctx_.console->Info("");
    ctx_.console->Info("[*] Looking for scheduled tasks...");

    auto entries = Attempt([&] { return ctx_.task_scheduler->QueryAllTasks(ctx_.settings.timeouts.task_query); });
    if (!entries.ok())
    {
        ++ctx_.stats.errors;
        if (entries.kind == ErrorKind::Timeout)
            ctx_.console->Error("[!] Scheduled task query timed out");
        else
            ctx_.console->Warning("[!] Unable to list scheduled tasks (" + std::string(ErrorKindToString(entries.kind)) + ")");
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Scheduler, "Scheduled task listing failed",
                                            std::string(ErrorKindToString(entries.kind)) + " - " + entries.detail);
        return 0;
    }

    size_t added = 0;
    for (const auto& entry : *entries)
    {
        std::string key = FoldCase(entry.name);
        if (ctx_.tasks.count(key) > 0)
            continue;

        auto record = Match(entry);
        if (!record)
            continue;

        switch (record->matched_by)
        {
        case TaskMatch::Name:
            ctx_.console->Success("    [name match] scheduled task: " + record->name);
            break;
        case TaskMatch::Path:
            ctx_.console->Success("    [path match] scheduled task: " + record->name);
            break;
        case TaskMatch::Program:
            ctx_.console->Success("    [program match] scheduled task: " + record->name + " -> " +
                                  record->matched_identity);
            break;
        }
        PLOG_INFO << "Found scheduled task (" << TaskMatchToString(record->matched_by) << " match): " << record->name;

        ctx_.tasks.emplace(std::move(key), std::move(*record));
        ++added;
    }

    ctx_.console->Success("[+] Found " + std::to_string(ctx_.tasks.size()) + " related scheduled tasks");
    return added;
}

} // namespace sfpurge
