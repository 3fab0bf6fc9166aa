#pragma once

#include "sfpurge/core/EngineSettings.hpp"
#include "utils/LogManager.hpp"

#include <string>
#include <string_view>

#include <toml++/toml.h>

// Loads sfpurge.toml into engine and logging settings. A missing file keeps
// the defaults; a parse error or a value of the wrong type fails the load.
class ConfigManager
{
public:
    explicit ConfigManager(std::string path = "sfpurge.toml");

    bool load();
    bool loadFromString(std::string_view text);

    const sfpurge::EngineSettings& engineSettings() const { return engine_; }
    sfpurge::EngineSettings& engineSettings() { return engine_; }
    const utils::LogManager::Settings& loggingSettings() const { return logging_; }
    utils::LogManager::Settings& loggingSettings() { return logging_; }

    const std::string& path() const { return config_path_; }
    bool fileFound() const { return file_found_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    bool apply(const toml::table& root);
    bool applyTarget(const toml::table& section);
    bool applyTimeouts(const toml::table& section);
    bool applyBehavior(const toml::table& section);
    bool applyMarkers(const toml::table& section);
    bool applyLogging(const toml::table& section);

    bool readStringList(const toml::table& section, const char* key, std::vector<std::string>& out);
    bool readMilliseconds(const toml::table& section, const char* key, std::chrono::milliseconds& out);
    bool readBool(const toml::table& section, const char* key, bool& out);
    bool validateInterval();
    bool fail(const std::string& message);

    std::string config_path_;
    std::string last_error_;
    bool file_found_ = false;

    sfpurge::EngineSettings engine_;
    utils::LogManager::Settings logging_;
};
