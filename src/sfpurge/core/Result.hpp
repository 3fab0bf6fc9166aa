#pragma once

#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace sfpurge
{

enum class ErrorKind
{
    None,
    Permission, // insufficient rights, never retried
    NotFound,   // target vanished or does not exist
    Timeout,    // collaborator exceeded its budget
    Unexpected
};

inline const char* ErrorKindToString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Permission:
        return "permission denied";
    case ErrorKind::NotFound:
        return "not found";
    case ErrorKind::Timeout:
        return "timeout";
    case ErrorKind::Unexpected:
        return "unexpected";
    }
    return "unknown";
}

/// Outcome of an action with no payload (stop a service, kill a process...)
struct ActionResult
{
    ErrorKind kind = ErrorKind::None;
    std::string detail;

    bool ok() const { return kind == ErrorKind::None; }

    static ActionResult Success(std::string detail = {})
    {
        return ActionResult{ ErrorKind::None, std::move(detail) };
    }

    static ActionResult Failure(ErrorKind kind, std::string detail)
    {
        return ActionResult{ kind, std::move(detail) };
    }
};

/// Outcome of a query. `value` is engaged only when `kind == ErrorKind::None`.
template <typename T>
struct Result
{
    std::optional<T> value;
    ErrorKind kind = ErrorKind::None;
    std::string detail;

    bool ok() const { return kind == ErrorKind::None && value.has_value(); }

    const T& operator*() const { return *value; }
    T& operator*() { return *value; }
    const T* operator->() const { return &*value; }
    T* operator->() { return &*value; }

    static Result Success(T v)
    {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result Failure(ErrorKind kind, std::string detail)
    {
        Result r;
        r.kind = kind;
        r.detail = std::move(detail);
        return r;
    }
};

inline ErrorKind ClassifyErrorCode(const std::error_code& ec)
{
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
        return ErrorKind::Permission;
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::no_such_process)
        return ErrorKind::NotFound;
    if (ec == std::errc::timed_out)
        return ErrorKind::Timeout;
    return ErrorKind::Unexpected;
}

/// Runs `op` and converts an escaping exception into a failed result.
/// `op` must return Result<T> or ActionResult.
template <typename Op>
auto Attempt(Op&& op) -> decltype(op())
{
    using R = decltype(op());
    try
    {
        return op();
    }
    catch (const std::filesystem::filesystem_error& ex)
    {
        return R::Failure(ClassifyErrorCode(ex.code()), ex.what());
    }
    catch (const std::system_error& ex)
    {
        return R::Failure(ClassifyErrorCode(ex.code()), ex.what());
    }
    catch (const std::exception& ex)
    {
        return R::Failure(ErrorKind::Unexpected, ex.what());
    }
}

} // namespace sfpurge
