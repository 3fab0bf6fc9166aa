#include <catch2/catch_test_macros.hpp>
#include "sfpurge/platform/ProcessControl.hpp"

#include <chrono>

#ifdef _WIN32
#include <windows.h>
#else
#include <csignal>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

using namespace sfpurge;
using namespace std::chrono_literals;

#ifdef _WIN32

TEST_CASE("ProcessControl - Killing an exited process reports not found", "[platform][process]") {
    STARTUPINFOW startup{};
    startup.cb = sizeof(startup);
    PROCESS_INFORMATION info{};
    wchar_t command[] = L"cmd.exe /c exit 0";

    REQUIRE(CreateProcessW(nullptr, command, nullptr, nullptr, FALSE, CREATE_NO_WINDOW, nullptr, nullptr,
                           &startup, &info));
    CloseHandle(info.hThread);

    // Holding the handle keeps the exited process object, and its pid, alive
    REQUIRE(WaitForSingleObject(info.hProcess, 5000) == WAIT_OBJECT_0);

    ProcessControl control;
    auto result = control.Kill(info.dwProcessId);

    REQUIRE_FALSE(result.ok());
    REQUIRE(result.kind == ErrorKind::NotFound);

    CloseHandle(info.hProcess);
}

#else

TEST_CASE("ProcessControl - Kill, wait, then kill again", "[platform][process]") {
    pid_t child = fork();
    REQUIRE(child >= 0);
    if (child == 0) {
        pause();
        _exit(0);
    }

    ProcessControl control;

    SECTION("The second kill reports not found") {
        REQUIRE(control.Kill(child).ok());
        REQUIRE(control.WaitForExit(child, 5000ms) == WaitOutcome::Exited);

        auto again = control.Kill(child);
        REQUIRE_FALSE(again.ok());
        REQUIRE(again.kind == ErrorKind::NotFound);
    }

    int status = 0;
    waitpid(child, &status, WNOHANG);
}

#endif

TEST_CASE("ProcessControl - Snapshot includes the current process", "[platform][process]") {
    ProcessControl control;

    auto snapshot = control.Snapshot();

    REQUIRE(snapshot.ok());
    bool found = false;
    for (const auto& record : *snapshot) {
        if (record.pid == control.CurrentProcessId())
            found = true;
    }
    REQUIRE(found);
}
