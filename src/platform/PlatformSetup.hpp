#pragma once

#include <atomic>
#include <chrono>

namespace platform {

/// Platform-specific initialization and utilities
class PlatformSetup
{
public:
    /// UTF-8 console and ANSI escape processing on Windows.
    /// Returns false when the console cannot render colors.
    static bool InitializeConsole();

    /// Administrator (Windows) or root (POSIX).
    static bool IsElevated();

    /// Routes Ctrl+C / SIGINT (and SIGTERM, console close) to `flag`.
    /// The flag must outlive the process.
    static void InstallInterruptHandler(std::atomic<bool>* flag);

    /// Called once the summary and the final log line are written.
    static void NotifyShutdownComplete();

    /// Blocks until NotifyShutdownComplete or the timeout. The console close
    /// handler waits here, since Windows ends the process when it returns.
    static bool WaitForShutdownComplete(std::chrono::milliseconds timeout);
};

} // namespace platform
