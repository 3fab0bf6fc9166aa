#pragma once

#include "sfpurge/console/IConsoleSink.hpp"
#include "sfpurge/control/ICommandRunner.hpp"
#include "sfpurge/control/IProcessControl.hpp"
#include "sfpurge/control/IServiceControl.hpp"
#include "sfpurge/control/ITaskScheduler.hpp"
#include "sfpurge/core/EngineContext.hpp"
#include "sfpurge/discovery/IVolumeEnumerator.hpp"

#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace test_utils {

// Scripted command runner keyed by the full command line ("sc query Foo")
class FakeCommandRunner : public sfpurge::ICommandRunner {
public:
    sfpurge::CommandResult Run(const std::string& program, const std::vector<std::string>& args,
                               std::chrono::milliseconds timeout) override;

    void setResponse(const std::string& command_line, const sfpurge::CommandResult& result);
    void setDefault(const sfpurge::CommandResult& result) { default_ = result; }

    const std::vector<std::string>& calls() const { return calls_; }
    std::chrono::milliseconds lastTimeout() const { return last_timeout_; }

    static sfpurge::CommandResult ok(const std::string& text);
    static sfpurge::CommandResult failed(int exit_code, const std::string& text);
    static sfpurge::CommandResult timedOut(const std::string& partial = "");

private:
    std::map<std::string, sfpurge::CommandResult> responses_;
    sfpurge::CommandResult default_ = failed(1, "");
    std::vector<std::string> calls_;
    std::chrono::milliseconds last_timeout_{ 0 };
};

// In-memory service manager. Every call is recorded as "<op>:<name>".
class FakeServiceControl : public sfpurge::IServiceControl {
public:
    std::vector<std::string> services;
    std::vector<std::string> drivers;
    std::map<std::string, std::string> binary_paths;
    std::map<std::string, bool> running;
    std::map<std::string, sfpurge::ActionResult> stop_results;
    std::map<std::string, sfpurge::ActionResult> disable_results;
    std::optional<sfpurge::ErrorKind> list_failure;
    std::optional<sfpurge::ErrorKind> driver_list_failure;
    std::vector<std::string> calls;

    sfpurge::Result<std::vector<std::string>> QueryAllServices(std::chrono::milliseconds timeout) override;
    sfpurge::Result<std::vector<std::string>> QueryDrivers(std::chrono::milliseconds timeout) override;
    sfpurge::Result<std::optional<std::string>> QueryBinaryPath(const std::string& name,
                                                                std::chrono::milliseconds timeout) override;
    sfpurge::Result<bool> QueryIsRunning(const std::string& name, std::chrono::milliseconds timeout) override;
    sfpurge::ActionResult Stop(const std::string& name, std::chrono::milliseconds timeout) override;
    sfpurge::ActionResult DisableStartup(const std::string& name, std::chrono::milliseconds timeout) override;

    size_t count(const std::string& call) const;
    // Position of the first matching call, or calls.size() when absent
    size_t indexOf(const std::string& call) const;
};

class FakeTaskScheduler : public sfpurge::ITaskScheduler {
public:
    std::vector<sfpurge::TaskEntry> tasks;
    std::map<std::string, sfpurge::ActionResult> disable_results;
    std::optional<sfpurge::ErrorKind> list_failure;
    std::vector<std::string> calls;

    sfpurge::Result<std::vector<sfpurge::TaskEntry>> QueryAllTasks(std::chrono::milliseconds timeout) override;
    sfpurge::ActionResult Disable(const std::string& name, std::chrono::milliseconds timeout) override;
};

// Process table. A confirmed kill removes the process from later snapshots.
// Calls are recorded as "kill:<pid>", "terminate:<pid>" and "wait:<pid>".
class FakeProcessControl : public sfpurge::IProcessControl {
public:
    std::vector<sfpurge::ProcessRecord> processes;
    sfpurge::ProcessId self_pid = 1;
    std::map<sfpurge::ProcessId, sfpurge::ActionResult> kill_results;
    std::map<sfpurge::ProcessId, std::deque<sfpurge::WaitOutcome>> wait_outcomes;
    std::optional<sfpurge::ErrorKind> snapshot_failure;
    std::vector<std::string> calls;
    std::vector<std::chrono::milliseconds> wait_timeouts;
    // Runs at the start of every WaitForExit; may throw
    std::function<void(sfpurge::ProcessId)> on_wait;

    void addProcess(sfpurge::ProcessId pid, const std::string& name, sfpurge::ProcessId parent = 0);

    sfpurge::Result<std::vector<sfpurge::ProcessRecord>> Snapshot() override;
    sfpurge::ProcessId CurrentProcessId() const override { return self_pid; }
    sfpurge::ActionResult Kill(sfpurge::ProcessId pid) override;
    sfpurge::ActionResult Terminate(sfpurge::ProcessId pid) override;
    sfpurge::WaitOutcome WaitForExit(sfpurge::ProcessId pid, std::chrono::milliseconds timeout) override;

    std::vector<std::string> callsStartingWith(const std::string& prefix) const;

private:
    void remove(sfpurge::ProcessId pid);
};

class FakeVolumeEnumerator : public sfpurge::IVolumeEnumerator {
public:
    std::vector<std::filesystem::path> volumes;
    std::optional<sfpurge::ErrorKind> failure;
    std::function<void()> on_list;

    sfpurge::Result<std::vector<std::filesystem::path>> ListFixedVolumes() override;
};

class RecordingConsole : public sfpurge::IConsoleSink {
public:
    struct Line {
        std::string kind;
        std::string text;
    };

    void Header(const std::string& line) override { lines.push_back({ "header", line }); }
    void Info(const std::string& line) override { lines.push_back({ "info", line }); }
    void Success(const std::string& line) override { lines.push_back({ "success", line }); }
    void Warning(const std::string& line) override { lines.push_back({ "warning", line }); }
    void Error(const std::string& line) override { lines.push_back({ "error", line }); }
    void Item(const std::string& line) override { lines.push_back({ "item", line }); }

    bool contains(const std::string& fragment) const;
    size_t countContaining(const std::string& fragment) const;

    std::vector<Line> lines;
};

// Engine context wired to fresh fakes. Sleeps are recorded, never slept.
struct FakeSystem {
    FakeSystem();
    FakeSystem(const FakeSystem&) = delete;
    FakeSystem& operator=(const FakeSystem&) = delete;

    FakeVolumeEnumerator volumes;
    FakeServiceControl services;
    FakeTaskScheduler tasks;
    FakeProcessControl processes;
    std::shared_ptr<RecordingConsole> console;
    std::vector<std::chrono::milliseconds> sleeps;
    sfpurge::EngineContext ctx;

    void addIdentity(const std::string& file_name, bool is_watchdog);
};

// Temporary directory removed on destruction
class TempDir {
public:
    TempDir();
    ~TempDir();
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    // Creates parent directories as needed
    void touch(const std::filesystem::path& relative) const;

private:
    std::filesystem::path path_;
};

}  // namespace test_utils
