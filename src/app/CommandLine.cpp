#include "CommandLine.hpp"
#include "Version.hpp"

#include <charconv>
#include <sstream>

namespace
{

bool parseInteger(const std::string& text, long long& out)
{
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc() && ptr == end && !text.empty();
}

} // namespace

CommandLineParseResult CommandLine::parse(int argc, char** argv)
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);
    return parse(args);
}

CommandLineParseResult CommandLine::parse(const std::vector<std::string>& args)
{
    CommandLineParseResult result;
    auto& opts = result.options;

    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];

        auto nextValue = [&](std::string& out) -> bool
        {
            if (i + 1 >= args.size())
            {
                result.error = "missing value for " + arg;
                return false;
            }
            out = args[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h")
        {
            opts.show_help = true;
        }
        else if (arg == "--version" || arg == "-v")
        {
            opts.show_version = true;
        }
        else if (arg == "--once")
        {
            opts.once = true;
        }
        else if (arg == "--keep-startup")
        {
            opts.keep_startup = true;
        }
        else if (arg == "--no-color")
        {
            opts.no_color = true;
        }
        else if (arg == "--quiet" || arg == "-q")
        {
            opts.quiet = true;
        }
        else if (arg == "--config" || arg == "-c")
        {
            if (!nextValue(opts.config_path))
                return result;
        }
        else if (arg == "--interval")
        {
            std::string value;
            if (!nextValue(value))
                return result;
            long long ms = 0;
            if (!parseInteger(value, ms) || ms <= 0)
            {
                result.error = "invalid --interval value: " + value;
                return result;
            }
            opts.interval = std::chrono::milliseconds(ms);
        }
        else if (arg == "--log-level")
        {
            std::string value;
            if (!nextValue(value))
                return result;
            long long level = 0;
            if (!parseInteger(value, level) || level < 0 || level > 6)
            {
                result.error = "invalid --log-level value (expected 0-6): " + value;
                return result;
            }
            opts.log_level = static_cast<int>(level);
        }
        else
        {
            result.error = "unknown argument: " + arg;
            return result;
        }
    }

    return result;
}

std::string CommandLine::usage(const std::string& program)
{
    std::ostringstream out;
    out << SFPURGE_APP_NAME << " " << SFPURGE_VERSION_STRING << "\n"
        << "Finds Sangfor installations, disables their restart vectors and keeps their processes dead.\n\n"
        << "Usage: " << program << " [options]\n\n"
        << "Options:\n"
        << "  -c, --config <path>   configuration file (default: sfpurge.toml)\n"
        << "      --once            run a single kill pass instead of monitoring\n"
        << "      --keep-startup    stop services without disabling their startup\n"
        << "      --interval <ms>   monitoring interval in milliseconds (at least 1)\n"
        << "      --log-level <n>   plog severity 0 (none) to 6 (verbose)\n"
        << "      --no-color        plain console output\n"
        << "  -q, --quiet           no console output, log file only\n"
        << "  -v, --version         print the version and exit\n"
        << "  -h, --help            print this help and exit\n";
    return out.str();
}
