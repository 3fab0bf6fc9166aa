#pragma once

#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

class LogManager
{
public:
    struct Settings
    {
        std::string directory = "logs";
        plog::Severity level = plog::info;
        bool append = true;
    };

    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
    };

    static bool Initialize(const Settings& settings);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static bool IsInitialized();
    static plog::Severity GetDefaultLogLevel();
    static const std::string& GetLogDirectory();

    /// "<directory>/<prefix>_YYYYmmdd_HHMMSS.log"
    static std::string MakeRunLogPath(const std::string& prefix);

private:
    LogManager() = default;

    static bool PrepareLogDirectory();

    static bool s_initialized;
    static Settings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
