#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct CommandLineOptions
{
    std::string config_path = "sfpurge.toml";
    bool once = false;
    bool keep_startup = false;
    bool no_color = false;
    bool quiet = false;
    bool show_help = false;
    bool show_version = false;
    std::optional<std::chrono::milliseconds> interval;
    std::optional<int> log_level;
};

// Result of parsing argv. On failure `error` names the offending argument.
struct CommandLineParseResult
{
    CommandLineOptions options;
    std::string error;

    bool ok() const { return error.empty(); }
};

class CommandLine
{
public:
    static CommandLineParseResult parse(const std::vector<std::string>& args);
    static CommandLineParseResult parse(int argc, char** argv);

    static std::string usage(const std::string& program);
};
