#include "ConfigManager.hpp"
#include "utils/ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace
{

std::string describeParseError(const toml::parse_error& pe)
{
    if (pe.source().begin.line > 0)
        return "Error at line " + std::to_string(pe.source().begin.line) + ": " + std::string(pe.description());
    return std::string(pe.description());
}

} // namespace

ConfigManager::ConfigManager(std::string path)
    : config_path_(std::move(path))
{
}

bool ConfigManager::load()
{
    last_error_.clear();
    file_found_ = false;

    std::error_code ec;
    if (!fs::exists(config_path_, ec))
    {
        PLOG_INFO << "No config file at " << config_path_ << ", using defaults";
        return true;
    }

    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
        return fail("Unable to open " + config_path_);
    file_found_ = true;

    try
    {
        return apply(toml::parse(ifs, config_path_));
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = "config parse error: " + describeParseError(pe);
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Configuration file has errors",
                                          describeParseError(pe) + "\nFile: " + config_path_);
        return false;
    }
}

bool ConfigManager::loadFromString(std::string_view text)
{
    last_error_.clear();
    try
    {
        return apply(toml::parse(text));
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = "config parse error: " + describeParseError(pe);
        PLOG_WARNING << last_error_;
        return false;
    }
}

bool ConfigManager::apply(const toml::table& root)
{
    using Applier = bool (ConfigManager::*)(const toml::table&);
    static const std::pair<const char*, Applier> sections[] = {
        { "target", &ConfigManager::applyTarget },   { "timeouts", &ConfigManager::applyTimeouts },
        { "behavior", &ConfigManager::applyBehavior }, { "markers", &ConfigManager::applyMarkers },
        { "logging", &ConfigManager::applyLogging },
    };

    for (const auto& [name, applier] : sections)
    {
        const auto* node = root.get(name);
        if (!node)
            continue;
        const auto* section = node->as_table();
        if (!section)
            return fail(std::string("[") + name + "] must be a table");
        if (!(this->*applier)(*section))
            return false;
    }
    return true;
}

bool ConfigManager::applyTarget(const toml::table& section)
{
    if (const auto* node = section.get("vendor_keyword"))
    {
        auto value = node->value<std::string>();
        if (!value || value->empty())
            return fail("target.vendor_keyword must be a non-empty string");
        engine_.vendor_keyword = *value;
    }
    if (auto value = section["product_name"].value<std::string>())
        engine_.product_name = *value;

    return readStringList(section, "candidate_paths", engine_.candidate_paths) &&
           readStringList(section, "executable_extensions", engine_.executable_extensions) &&
           readStringList(section, "watchdog_keywords", engine_.watchdog_keywords);
}

bool ConfigManager::applyTimeouts(const toml::table& section)
{
    auto& t = engine_.timeouts;
    return readMilliseconds(section, "service_query", t.service_query) &&
           readMilliseconds(section, "service_config_query", t.service_config_query) &&
           readMilliseconds(section, "driver_query", t.driver_query) &&
           readMilliseconds(section, "task_query", t.task_query) &&
           readMilliseconds(section, "status_query", t.status_query) &&
           readMilliseconds(section, "action", t.action) &&
           readMilliseconds(section, "watchdog_kill_wait", t.watchdog_kill_wait) &&
           readMilliseconds(section, "process_kill_wait", t.process_kill_wait) &&
           readMilliseconds(section, "settle_pause", t.settle_pause) &&
           readMilliseconds(section, "monitor_interval", t.monitor_interval) && validateInterval();
}

bool ConfigManager::validateInterval()
{
    // Zero would make the monitoring loop spin without sleeping
    if (engine_.timeouts.monitor_interval.count() <= 0)
        return fail("timeouts.monitor_interval must be at least 1 millisecond");
    return true;
}

bool ConfigManager::applyBehavior(const toml::table& section)
{
    return readBool(section, "loop", engine_.loop) && readBool(section, "disable_startup", engine_.disable_startup) &&
           readBool(section, "kill_watchdog_first", engine_.kill_watchdog_first);
}

bool ConfigManager::applyMarkers(const toml::table& section)
{
    auto& m = engine_.markers;
    return readStringList(section, "service_name", m.service_name) &&
           readStringList(section, "binary_path", m.binary_path) &&
           readStringList(section, "running_state", m.running_state) &&
           readStringList(section, "stop_confirm", m.stop_confirm) && readStringList(section, "success", m.success) &&
           readStringList(section, "task_name", m.task_name) &&
           readStringList(section, "task_program", m.task_program) &&
           readStringList(section, "access_denied", m.access_denied) &&
           readStringList(section, "not_found", m.not_found);
}

bool ConfigManager::applyLogging(const toml::table& section)
{
    if (const auto* node = section.get("directory"))
    {
        auto value = node->value<std::string>();
        if (!value || value->empty())
            return fail("logging.directory must be a non-empty string");
        logging_.directory = *value;
    }

    if (const auto* node = section.get("level"))
    {
        auto level = node->value<int64_t>();
        if (!level || *level < 0 || *level > 6)
            return fail("logging.level must be an integer between 0 and 6");
        logging_.level = static_cast<plog::Severity>(*level);
    }

    return readBool(section, "append", logging_.append);
}

bool ConfigManager::readStringList(const toml::table& section, const char* key, std::vector<std::string>& out)
{
    const auto* node = section.get(key);
    if (!node)
        return true;

    const auto* array = node->as_array();
    if (!array)
        return fail(std::string(key) + " must be an array of strings");

    std::vector<std::string> values;
    for (const auto& element : *array)
    {
        auto value = element.value<std::string>();
        if (!value)
            return fail(std::string(key) + " must be an array of strings");
        values.push_back(*value);
    }
    out = std::move(values);
    return true;
}

bool ConfigManager::readMilliseconds(const toml::table& section, const char* key, std::chrono::milliseconds& out)
{
    const auto* node = section.get(key);
    if (!node)
        return true;

    auto value = node->value<int64_t>();
    if (!value || *value < 0)
        return fail(std::string("timeouts.") + key + " must be a non-negative integer (milliseconds)");
    out = std::chrono::milliseconds(*value);
    return true;
}

bool ConfigManager::readBool(const toml::table& section, const char* key, bool& out)
{
    const auto* node = section.get(key);
    if (!node)
        return true;

    auto value = node->value<bool>();
    if (!value)
        return fail(std::string(key) + " must be a boolean");
    out = *value;
    return true;
}

bool ConfigManager::fail(const std::string& message)
{
    last_error_ = message;
    utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Invalid configuration value",
                                      message + " (" + config_path_ + ")");
    return false;
}
