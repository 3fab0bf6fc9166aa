#include "../CommandRunner.hpp"

#include <windows.h>

#include <plog/Log.h>

namespace sfpurge
{

namespace
{

std::wstring Widen(const std::string& text)
{
    if (text.empty())
        return {};
    int size = MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), nullptr, 0);
    std::wstring wide(static_cast<size_t>(size), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), wide.data(), size);
    return wide;
}

// sc.exe and schtasks.exe write in the console OEM code page (936 on Chinese systems)
std::string OemToUtf8(const std::string& text)
{
    if (text.empty())
        return {};
    int wide_size = MultiByteToWideChar(CP_OEMCP, 0, text.data(), static_cast<int>(text.size()), nullptr, 0);
    if (wide_size <= 0)
        return text;
    std::wstring wide(static_cast<size_t>(wide_size), L'\0');
    MultiByteToWideChar(CP_OEMCP, 0, text.data(), static_cast<int>(text.size()), wide.data(), wide_size);

    int size = WideCharToMultiByte(CP_UTF8, 0, wide.data(), wide_size, nullptr, 0, nullptr, nullptr);
    std::string utf8(static_cast<size_t>(size), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide.data(), wide_size, utf8.data(), size, nullptr, nullptr);
    return utf8;
}

std::wstring QuoteArgument(const std::wstring& arg)
{
    if (!arg.empty() && arg.find_first_of(L" \t\"") == std::wstring::npos)
        return arg;

    std::wstring quoted = L"\"";
    for (wchar_t c : arg)
    {
        if (c == L'"')
            quoted += L'\\';
        quoted += c;
    }
    quoted += L'"';
    return quoted;
}

void DrainPipe(HANDLE pipe, std::string& out)
{
    char buffer[4096];
    DWORD available = 0;
    while (PeekNamedPipe(pipe, nullptr, 0, nullptr, &available, nullptr) && available > 0)
    {
        DWORD read = 0;
        if (!ReadFile(pipe, buffer, sizeof(buffer), &read, nullptr) || read == 0)
            break;
        out.append(buffer, read);
    }
}

} // namespace

CommandResult CommandRunner::Run(const std::string& program, const std::vector<std::string>& args,
                                 std::chrono::milliseconds timeout)
{
    CommandResult result;

    HANDLE read_pipe = nullptr;
    HANDLE write_pipe = nullptr;
    SECURITY_ATTRIBUTES sa = { sizeof(SECURITY_ATTRIBUTES), nullptr, TRUE };

    if (!CreatePipe(&read_pipe, &write_pipe, &sa, 0))
    {
        result.error = "CreatePipe failed: " + std::to_string(GetLastError());
        PLOG_ERROR << result.error;
        return result;
    }

    if (!SetHandleInformation(read_pipe, HANDLE_FLAG_INHERIT, 0))
    {
        result.error = "SetHandleInformation failed: " + std::to_string(GetLastError());
        PLOG_ERROR << result.error;
        CloseHandle(read_pipe);
        CloseHandle(write_pipe);
        return result;
    }

    std::wstring cmd_line = QuoteArgument(Widen(program));
    for (const auto& arg : args)
        cmd_line += L" " + QuoteArgument(Widen(arg));

    STARTUPINFOW si = { sizeof(si) };
    PROCESS_INFORMATION pi = {};
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    si.hStdOutput = write_pipe;
    si.hStdError = write_pipe;

    if (!CreateProcessW(nullptr, cmd_line.data(), nullptr, nullptr, TRUE, CREATE_NO_WINDOW, nullptr, nullptr, &si,
                        &pi))
    {
        DWORD err = GetLastError();
        result.error = "CreateProcessW failed for " + program + ": " + std::to_string(err);
        PLOG_ERROR << result.error;
        CloseHandle(read_pipe);
        CloseHandle(write_pipe);
        return result;
    }

    // Only the child keeps a write end, so ReadFile sees EOF when it exits
    CloseHandle(write_pipe);
    CloseHandle(pi.hThread);

    std::string raw;
    const ULONGLONG deadline = GetTickCount64() + static_cast<ULONGLONG>(timeout.count());
    bool exited = false;

    while (true)
    {
        DrainPipe(read_pipe, raw);

        if (WaitForSingleObject(pi.hProcess, 10) == WAIT_OBJECT_0)
        {
            exited = true;
            break;
        }
        if (GetTickCount64() >= deadline)
            break;
    }
    DrainPipe(read_pipe, raw);

    if (!exited)
    {
        result.timed_out = true;
        TerminateProcess(pi.hProcess, 1);
        WaitForSingleObject(pi.hProcess, 1000);
        PLOG_WARNING << "Command timed out after " << timeout.count() << " ms: " << program;
    }
    else
    {
        DWORD exit_code = 0;
        if (GetExitCodeProcess(pi.hProcess, &exit_code))
            result.exit_code = static_cast<int>(exit_code);
        else
            result.error = "GetExitCodeProcess failed: " + std::to_string(GetLastError());
    }

    CloseHandle(pi.hProcess);
    CloseHandle(read_pipe);

    result.raw_text = OemToUtf8(raw);
    result.succeeded = exited && result.error.empty() && result.exit_code == 0;
    return result;
}

} // namespace sfpurge
