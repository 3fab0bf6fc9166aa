#include "AnsiConsole.hpp"

namespace sfpurge
{

namespace
{
constexpr const char* kRed = "\033[91m";
constexpr const char* kGreen = "\033[92m";
constexpr const char* kYellow = "\033[93m";
constexpr const char* kBlue = "\033[94m";
constexpr const char* kCyan = "\033[96m";
constexpr const char* kBold = "\033[1m";
constexpr const char* kReset = "\033[0m";
} // namespace

AnsiConsole::AnsiConsole(std::ostream& out, bool use_color)
    : out_(out)
    , use_color_(use_color)
{
}

void AnsiConsole::Header(const std::string& line) { Write(kCyan, true, line); }

void AnsiConsole::Info(const std::string& line) { Write(kBlue, false, line); }

void AnsiConsole::Success(const std::string& line) { Write(kGreen, false, line); }

void AnsiConsole::Warning(const std::string& line) { Write(kYellow, false, line); }

void AnsiConsole::Error(const std::string& line) { Write(kRed, false, line); }

void AnsiConsole::Item(const std::string& line) { Write(nullptr, false, "     - " + line); }

void AnsiConsole::Write(const char* color, bool bold, const std::string& line)
{
    if (!use_color_ || (!color && !bold))
    {
        out_ << line << '\n';
    }
    else
    {
        if (bold)
            out_ << kBold;
        if (color)
            out_ << color;
        out_ << line << kReset << '\n';
    }
    out_.flush();
}

} // namespace sfpurge
