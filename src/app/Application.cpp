#include "Application.hpp"
#include "Version.hpp"
#include "config/ConfigManager.hpp"
#include "platform/PlatformSetup.hpp"
#include "sfpurge/console/ConsoleFactory.hpp"
#include "sfpurge/core/EngineContext.hpp"
#include "sfpurge/monitor/MonitorLoop.hpp"
#include "sfpurge/platform/PlatformFactory.hpp"
#include "utils/CrashHandler.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <iostream>
#include <thread>

#include <plog/Log.h>

std::atomic<bool> Application::s_cancel_requested{ false };
Application* Application::s_instance = nullptr;

namespace
{

const std::string kRule(60, '=');

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
    s_instance = this;
}

Application::~Application()
{
    cleanup();
    s_instance = nullptr;
}

int Application::run()
{
    switch (initialize())
    {
    case InitStatus::ExitSuccess:
        return 0;
    case InitStatus::ExitFailure:
        return 1;
    case InitStatus::Ready:
        break;
    }

    printBanner();
    checkPrivileges();
    setupEngine();

    platform::PlatformSetup::InstallInterruptHandler(&s_cancel_requested);
    utils::CrashHandler::RegisterFatalCleanup(&Application::onFatalCleanup);
    utils::CrashHandler::SetContext("monitor loop");

    sfpurge::MonitorOutcome outcome = loop_->Run();

    utils::CrashHandler::SetContext(nullptr);

    int exit_code = 0;
    switch (outcome)
    {
    case sfpurge::MonitorOutcome::NoTargets:
    case sfpurge::MonitorOutcome::Completed:
    case sfpurge::MonitorOutcome::Cancelled:
        exit_code = 0;
        break;
    case sfpurge::MonitorOutcome::Interrupted:
        console_->Warning("[!] Interrupted before discovery completed");
        exit_code = 1;
        break;
    case sfpurge::MonitorOutcome::Failed:
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Discovery, "Discovery failed, nothing was changed");
        exit_code = 1;
        break;
    case sfpurge::MonitorOutcome::Running:
        exit_code = 1;
        break;
    }

    console_->Header("");
    console_->Header(kRule);
    console_->Header(outcome == sfpurge::MonitorOutcome::Failed ? "[-] Finished with errors" : "[*] All done");
    console_->Header(kRule);
    if (!log_path_.empty())
        console_->Info("Log file: " + log_path_);

    PLOG_INFO << "=== " << SFPURGE_APP_NAME << " finished (" << sfpurge::MonitorOutcomeToString(outcome)
              << ", exit " << exit_code << ", reported errors: "
              << utils::ErrorReporter::CountAtLeast(utils::ErrorSeverity::Error) << ") ===";
    cleanup();
    platform::PlatformSetup::NotifyShutdownComplete();
    return exit_code;
}

Application::InitStatus Application::initialize()
{
    auto parsed = CommandLine::parse(argc_, argv_);
    const std::string program = argc_ > 0 ? argv_[0] : SFPURGE_APP_NAME;
    if (!parsed.ok())
    {
        std::cerr << program << ": " << parsed.error << "\n\n" << CommandLine::usage(program);
        return InitStatus::ExitFailure;
    }
    options_ = parsed.options;

    if (options_.show_help)
    {
        std::cout << CommandLine::usage(program);
        return InitStatus::ExitSuccess;
    }
    if (options_.show_version)
    {
        std::cout << SFPURGE_APP_NAME << " " << SFPURGE_VERSION_STRING << "\n";
        return InitStatus::ExitSuccess;
    }

    utils::CrashHandler::Initialize();
    utils::CrashHandler::SetContext("startup");

    initializeConsole();

    config_ = std::make_unique<ConfigManager>(options_.config_path);
    if (!config_->load())
    {
        console_->Error(std::string("[-] ") + config_->lastError());
        console_->Error("[-] Fix " + config_->path() + " or pass --config with another file");
        return InitStatus::ExitFailure;
    }
    applyCommandLineOverrides();

    if (!initializeLogging())
    {
        console_->Warning("[!] Logging disabled: unable to create " + config_->loggingSettings().directory);
    }

    PLOG_INFO << "=== " << SFPURGE_APP_NAME << " " << SFPURGE_VERSION_STRING << " started ===";
    if (config_->fileFound())
        PLOG_INFO << "Configuration loaded from " << config_->path();

    return InitStatus::Ready;
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(config_->loggingSettings()))
        return false;

    log_path_ = utils::LogManager::MakeRunLogPath(SFPURGE_APP_NAME);
    if (!utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                .filepath = log_path_,
                                                .append_override = std::nullopt,
                                                .level_override = std::nullopt,
                                                .max_file_size = 10 * 1024 * 1024,
                                                .backup_count = 3 }))
    {
        log_path_.clear();
        return false;
    }
    return true;
}

void Application::initializeConsole()
{
    bool color_capable = platform::PlatformSetup::InitializeConsole();

    sfpurge::ConsoleMode mode = sfpurge::ConsoleMode::Color;
    if (options_.quiet)
        mode = sfpurge::ConsoleMode::Silent;
    else if (options_.no_color || !color_capable)
        mode = sfpurge::ConsoleMode::Plain;

    console_ = sfpurge::ConsoleFactory::Create(mode);
}

void Application::applyCommandLineOverrides()
{
    auto& settings = config_->engineSettings();
    if (options_.once)
        settings.loop = false;
    if (options_.keep_startup)
        settings.disable_startup = false;
    if (options_.interval)
        settings.timeouts.monitor_interval = *options_.interval;
    if (options_.log_level)
        config_->loggingSettings().level = static_cast<plog::Severity>(*options_.log_level);
}

void Application::printBanner()
{
    const auto& settings = config_->engineSettings();

    console_->Header(kRule);
    console_->Header(std::string(SFPURGE_APP_NAME) + " " + SFPURGE_VERSION_STRING + " - terminate " +
                     settings.product_name + " processes and services");
    console_->Header(kRule);

    if (!log_path_.empty())
        console_->Success("[+] Logging to " + log_path_);
    console_->Success(settings.loop ? "[+] Monitoring mode enabled (Ctrl+C to stop)" : "[+] Single pass mode");
    if (settings.disable_startup)
        console_->Success("[+] Service startup and scheduled tasks will be disabled");
    else
        console_->Warning("[!] Service startup will be left unchanged");
}

void Application::checkPrivileges()
{
    if (platform::PlatformSetup::IsElevated())
    {
        console_->Success("[+] Running with administrator privileges");
        PLOG_INFO << "Running elevated";
        return;
    }

    console_->Warning("");
    console_->Warning("[!] Not running as administrator, some processes or services may not be stoppable");
    console_->Warning("[!] Re-run from an elevated prompt for full effect");
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Not running elevated");
}

void Application::setupEngine()
{
    const auto& settings = config_->engineSettings();

    platform_ = std::make_unique<sfpurge::PlatformServices>(sfpurge::PlatformFactory::Create(settings.markers));

    engine_ = std::make_unique<sfpurge::EngineContext>();
    engine_->settings = settings;
    engine_->ApplySettings();
    engine_->console = console_;
    engine_->sleep = [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
    platform_->Attach(*engine_);

    loop_ = std::make_unique<sfpurge::MonitorLoop>(*engine_, s_cancel_requested);
}

void Application::onFatalCleanup()
{
    if (s_instance && s_instance->loop_)
        s_instance->loop_->RenderSummary();
}

void Application::cleanup()
{
    if (cleaned_up_)
        return;
    cleaned_up_ = true;

    utils::CrashHandler::RegisterFatalCleanup(nullptr);
    loop_.reset();
    engine_.reset();
    platform_.reset();
    utils::LogManager::Shutdown();
}
