#include "PlatformSetup.hpp"

#include <plog/Log.h>

#include <thread>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <clocale>
#else
#include <csignal>
#include <unistd.h>
#endif

namespace platform {

static std::atomic<bool>* g_interrupt_flag = nullptr;
static std::atomic<bool> g_shutdown_complete{ false };

#ifdef _WIN32
static BOOL WINAPI ConsoleCtrlHandler(DWORD type)
{
    switch (type)
    {
    case CTRL_C_EVENT:
    case CTRL_BREAK_EVENT:
        if (g_interrupt_flag)
            g_interrupt_flag->store(true);
        return TRUE;
    case CTRL_CLOSE_EVENT:
        // The process is terminated about 5 s after this handler is entered
        if (g_interrupt_flag)
            g_interrupt_flag->store(true);
        PlatformSetup::WaitForShutdownComplete(std::chrono::milliseconds(4500));
        return TRUE;
    default:
        return FALSE;
    }
}
#else
static void SignalHandler(int)
{
    if (g_interrupt_flag)
        g_interrupt_flag->store(true);
}
#endif

bool PlatformSetup::InitializeConsole()
{
#ifdef _WIN32
    // Chinese service names and marker text are printed as UTF-8
    SetConsoleOutputCP(CP_UTF8);
    SetConsoleCP(CP_UTF8);
    std::setlocale(LC_ALL, ".UTF-8");

    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (!hOut || hOut == INVALID_HANDLE_VALUE)
        return false;

    DWORD mode = 0;
    if (!GetConsoleMode(hOut, &mode))
        return false;

    if (!SetConsoleMode(hOut, mode | ENABLE_PROCESSED_OUTPUT | ENABLE_VIRTUAL_TERMINAL_PROCESSING))
    {
        PLOG_WARNING << "Virtual terminal processing unavailable: " << GetLastError();
        return false;
    }
    return true;
#else
    return isatty(STDOUT_FILENO) != 0;
#endif
}

bool PlatformSetup::IsElevated()
{
#ifdef _WIN32
    BOOL is_admin = FALSE;
    PSID admin_group = nullptr;
    SID_IDENTIFIER_AUTHORITY nt_authority = SECURITY_NT_AUTHORITY;
    if (AllocateAndInitializeSid(&nt_authority, 2, SECURITY_BUILTIN_DOMAIN_RID, DOMAIN_ALIAS_RID_ADMINS, 0, 0, 0, 0, 0,
                                 0, &admin_group))
    {
        if (!CheckTokenMembership(nullptr, admin_group, &is_admin))
        {
            PLOG_WARNING << "CheckTokenMembership failed: " << GetLastError();
            is_admin = FALSE;
        }
        FreeSid(admin_group);
    }
    return is_admin != FALSE;
#else
    return geteuid() == 0;
#endif
}

void PlatformSetup::InstallInterruptHandler(std::atomic<bool>* flag)
{
    g_interrupt_flag = flag;
#ifdef _WIN32
    if (!SetConsoleCtrlHandler(ConsoleCtrlHandler, TRUE))
        PLOG_WARNING << "SetConsoleCtrlHandler failed: " << GetLastError();
#else
    struct sigaction action{};
    action.sa_handler = SignalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
#endif
}

void PlatformSetup::NotifyShutdownComplete()
{
    g_shutdown_complete.store(true);
}

bool PlatformSetup::WaitForShutdownComplete(std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!g_shutdown_complete.load())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}

} // namespace platform
