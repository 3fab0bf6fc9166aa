#include "ScServiceControl.hpp"
#include "OutputParser.hpp"

#include <plog/Log.h>

namespace sfpurge
{

namespace parser = output_parser;

namespace
{
constexpr const char* kScProgram = "sc";
} // namespace

ScServiceControl::ScServiceControl(ICommandRunner& runner, MarkerTable markers)
    : runner_(runner)
    , markers_(std::move(markers))
{
}

CommandResult ScServiceControl::RunSc(const std::vector<std::string>& args, std::chrono::milliseconds timeout)
{
    auto result = runner_.Run(kScProgram, args, timeout);
    PLOG_DEBUG << "sc " << (args.empty() ? std::string() : args.front()) << " -> " << parser::Describe(result);
    return result;
}

ErrorKind ScServiceControl::Classify(const CommandResult& result) const
{
    if (result.timed_out)
        return ErrorKind::Timeout;

    switch (result.exit_code)
    {
    case kErrorAccessDenied:
        return ErrorKind::Permission;
    case kErrorServiceDoesNotExist:
    case kErrorServiceNotActive:
        return ErrorKind::NotFound;
    default:
        break;
    }
    return parser::ClassifyFailure(result, markers_);
}

Result<std::vector<std::string>> ScServiceControl::QueryNames(const std::vector<std::string>& args,
                                                              std::chrono::milliseconds timeout)
{
    auto result = RunSc(args, timeout);

    // sc prints a usable listing even when a single entry fails to open, so any
    // output at all is parsed before the exit status is considered.
    if (result.raw_text.empty() || result.timed_out)
    {
        return Result<std::vector<std::string>>::Failure(result.timed_out ? ErrorKind::Timeout : Classify(result),
                                                         parser::Describe(result));
    }

    auto names = parser::ParseServiceNames(result.raw_text, markers_);
    if (names.empty() && !result.succeeded)
        return Result<std::vector<std::string>>::Failure(Classify(result), parser::Describe(result));

    return Result<std::vector<std::string>>::Success(std::move(names));
}

Result<std::vector<std::string>> ScServiceControl::QueryAllServices(std::chrono::milliseconds timeout)
{
    return QueryNames({ "query", "state=", "all" }, timeout);
}

Result<std::vector<std::string>> ScServiceControl::QueryDrivers(std::chrono::milliseconds timeout)
{
    return QueryNames({ "query", "type=", "driver", "state=", "all" }, timeout);
}

Result<std::optional<std::string>> ScServiceControl::QueryBinaryPath(const std::string& name,
                                                                     std::chrono::milliseconds timeout)
{
    using R = Result<std::optional<std::string>>;

    auto result = RunSc({ "qc", name }, timeout);
    if (result.timed_out || (!result.succeeded && result.raw_text.empty()))
        return R::Failure(Classify(result), parser::Describe(result));

    auto path = parser::ParseBinaryPath(result.raw_text, markers_);
    if (!path && !result.succeeded)
        return R::Failure(Classify(result), parser::Describe(result));

    return R::Success(std::move(path));
}

Result<bool> ScServiceControl::QueryIsRunning(const std::string& name, std::chrono::milliseconds timeout)
{
    auto result = RunSc({ "query", name }, timeout);
    if (result.timed_out || result.raw_text.empty())
        return Result<bool>::Failure(Classify(result), parser::Describe(result));

    if (!result.succeeded && !parser::ContainsMarker(result.raw_text, markers_.service_name))
        return Result<bool>::Failure(Classify(result), parser::Describe(result));

    return Result<bool>::Success(parser::ContainsMarker(result.raw_text, markers_.running_state));
}

ActionResult ScServiceControl::Stop(const std::string& name, std::chrono::milliseconds timeout)
{
    auto result = RunSc({ "stop", name }, timeout);
    if (result.timed_out)
        return ActionResult::Failure(ErrorKind::Timeout, parser::Describe(result));

    if (parser::ContainsMarker(result.raw_text, markers_.stop_confirm))
        return ActionResult::Success();

    if (result.succeeded)
        return ActionResult::Failure(ErrorKind::Unexpected,
                                     "stop accepted without a stop-pending marker: " + parser::Describe(result));

    return ActionResult::Failure(Classify(result), parser::Describe(result));
}

ActionResult ScServiceControl::DisableStartup(const std::string& name, std::chrono::milliseconds timeout)
{
    auto result = RunSc({ "config", name, "start=", "disabled" }, timeout);
    if (result.timed_out)
        return ActionResult::Failure(ErrorKind::Timeout, parser::Describe(result));

    if (result.succeeded || parser::ContainsMarker(result.raw_text, markers_.success))
        return ActionResult::Success();

    return ActionResult::Failure(Classify(result), parser::Describe(result));
}

} // namespace sfpurge
