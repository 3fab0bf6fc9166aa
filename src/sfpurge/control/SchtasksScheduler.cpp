#include "SchtasksScheduler.hpp"
#include "OutputParser.hpp"

#include <plog/Log.h>

namespace sfpurge
{

namespace parser = output_parser;

namespace
{
constexpr const char* kSchtasksProgram = "schtasks";
} // namespace

SchtasksScheduler::SchtasksScheduler(ICommandRunner& runner, MarkerTable markers)
    : runner_(runner)
    , markers_(std::move(markers))
{
}

Result<std::vector<TaskEntry>> SchtasksScheduler::QueryAllTasks(std::chrono::milliseconds timeout)
{
    using R = Result<std::vector<TaskEntry>>;

    auto result = runner_.Run(kSchtasksProgram, { "/query", "/fo", "LIST", "/v" }, timeout);
    PLOG_DEBUG << "schtasks /query -> " << parser::Describe(result);

    if (result.timed_out)
        return R::Failure(ErrorKind::Timeout, parser::Describe(result));
    if (result.raw_text.empty())
        return R::Failure(parser::ClassifyFailure(result, markers_), parser::Describe(result));

    // A non-zero exit with partial output still carries usable entries
    auto entries = parser::ParseTaskEntries(result.raw_text, markers_);
    if (entries.empty() && !result.succeeded)
        return R::Failure(parser::ClassifyFailure(result, markers_), parser::Describe(result));

    return R::Success(std::move(entries));
}

ActionResult SchtasksScheduler::Disable(const std::string& name, std::chrono::milliseconds timeout)
{
    auto result = runner_.Run(kSchtasksProgram, { "/change", "/tn", name, "/disable" }, timeout);
    PLOG_DEBUG << "schtasks /change " << name << " -> " << parser::Describe(result);

    if (result.timed_out)
        return ActionResult::Failure(ErrorKind::Timeout, parser::Describe(result));
    if (result.succeeded || parser::ContainsMarker(result.raw_text, markers_.success))
        return ActionResult::Success();

    return ActionResult::Failure(parser::ClassifyFailure(result, markers_), parser::Describe(result));
}

} // namespace sfpurge
