#pragma once

#include "CommandLine.hpp"

#include <atomic>
#include <memory>

class ConfigManager;

namespace sfpurge
{
struct EngineContext;
struct PlatformServices;
class MonitorLoop;
class IConsoleSink;
} // namespace sfpurge

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    enum class InitStatus
    {
        Ready,
        ExitSuccess, // --help / --version
        ExitFailure
    };

    InitStatus initialize();
    bool initializeLogging();
    void initializeConsole();
    void applyCommandLineOverrides();
    void printBanner();
    void checkPrivileges();
    void setupEngine();
    void cleanup();

    static void onFatalCleanup();

    CommandLineOptions options_;
    std::unique_ptr<ConfigManager> config_;
    std::shared_ptr<sfpurge::IConsoleSink> console_;
    std::unique_ptr<sfpurge::PlatformServices> platform_;
    std::unique_ptr<sfpurge::EngineContext> engine_;
    std::unique_ptr<sfpurge::MonitorLoop> loop_;
    std::string log_path_;
    bool cleaned_up_ = false;

    int argc_ = 0;
    char** argv_ = nullptr;

    static std::atomic<bool> s_cancel_requested;
    static Application* s_instance;
};
