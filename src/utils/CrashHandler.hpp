#pragma once

namespace utils
{

/**
 * Crash handler for unhandled exceptions and fatal errors.
 *
 * Intercepts std::terminate() (and, on Windows, unhandled SEH exceptions),
 * logs a stack trace via cpptrace and runs the registered cleanup so the
 * run summary still reaches the log.
 */
class CrashHandler
{
public:
    /// Installs exception handlers
    static void Initialize();

    /// Sets thread-local context string to be included in crash reports
    static void SetContext(const char* operation);

    /// Registers a cleanup function to be called before crash termination (e.g., flush the summary)
    static void RegisterFatalCleanup(void (*fn)());
};

} // namespace utils
