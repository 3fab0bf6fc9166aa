#include "CrashHandler.hpp"
#include <plog/Log.h>
#include <cpptrace/cpptrace.hpp>
#include <sstream>
#include <string>
#include <exception>
#include <atomic>
#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#endif

static std::atomic<void (*)()> g_fatal_cleanup{ nullptr };
static std::atomic<bool> g_crash_in_progress{ false };
static std::terminate_handler g_prev_terminate = nullptr;

static thread_local const char* g_current_operation = nullptr;

static void RunFatalCleanup()
{
    if (auto fn = g_fatal_cleanup.exchange(nullptr, std::memory_order_acq_rel))
    {
        fn();
    }
}

static void LogStackTrace()
{
    PLOG_FATAL << "Stack trace (most recent call first):";

    std::ostringstream trace_ss;
    cpptrace::generate_trace(1).print(trace_ss, false);

    std::istringstream iss(trace_ss.str());
    std::string line;
    bool any = false;
    while (std::getline(iss, line))
    {
        if (line.empty())
            continue;
        PLOG_FATAL << line;
        any = true;
    }

    if (!any)
    {
        PLOG_FATAL << "No stack trace available (cpptrace returned empty).";
    }
}

static void LogCrashHeader(const std::string& reason)
{
    PLOG_FATAL << "=== APPLICATION CRASHED ===";
    PLOG_FATAL << reason;
    if (g_current_operation)
    {
        PLOG_FATAL << "Operation: " << g_current_operation;
    }
}

static void CrashTerminateHandler()
{
    if (!g_crash_in_progress.exchange(true))
    {
        std::string reason = "std::terminate called";
        if (auto current = std::current_exception())
        {
            try
            {
                std::rethrow_exception(current);
            }
            catch (const std::exception& ex)
            {
                reason += " after uncaught exception: " + std::string(ex.what());
            }
            catch (...)
            {
                reason += " after uncaught non-standard exception";
            }
        }

        LogCrashHeader(reason);
        LogStackTrace();
        RunFatalCleanup();
    }

    if (g_prev_terminate)
    {
        g_prev_terminate();
        return;
    }
    std::abort();
}

#ifdef _WIN32
static LONG WINAPI CrashHandlerFunction(EXCEPTION_POINTERS* ex)
{
    if (g_crash_in_progress.exchange(true))
        return EXCEPTION_EXECUTE_HANDLER;

    std::ostringstream reason;
    reason << "Exception: 0x" << std::hex << ex->ExceptionRecord->ExceptionCode << " at 0x"
           << ex->ExceptionRecord->ExceptionAddress;

    LogCrashHeader(reason.str());
    if (ex->ExceptionRecord->ExceptionCode != EXCEPTION_STACK_OVERFLOW)
    {
        LogStackTrace();
    }
    RunFatalCleanup();

    return EXCEPTION_EXECUTE_HANDLER;
}
#endif

void utils::CrashHandler::Initialize()
{
#ifdef _WIN32
    SetUnhandledExceptionFilter(CrashHandlerFunction);
#endif
    g_prev_terminate = std::set_terminate(CrashTerminateHandler);
    PLOG_INFO << "Crash handler installed";
}

void utils::CrashHandler::SetContext(const char* operation)
{
    g_current_operation = operation;
}

void utils::CrashHandler::RegisterFatalCleanup(void (*fn)())
{
    g_fatal_cleanup.store(fn, std::memory_order_release);
}
