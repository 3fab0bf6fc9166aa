#include "OutputParser.hpp"
#include "../core/MatchPolicy.hpp"

#include <algorithm>

namespace sfpurge
{
namespace output_parser
{

namespace
{
constexpr std::string_view kFullWidthColon = "\xEF\xBC\x9A"; // U+FF1A
constexpr size_t kDescribeLimit = 160;
} // namespace

std::vector<std::string> SplitLines(std::string_view text)
{
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size())
    {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos)
            end = text.size();

        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        lines.emplace_back(line);

        if (end == text.size())
            break;
        start = end + 1;
    }
    return lines;
}

std::string Trim(std::string_view text)
{
    const auto is_space = [](char c)
    {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    };

    size_t begin = 0;
    while (begin < text.size() && is_space(text[begin]))
        ++begin;
    size_t end = text.size();
    while (end > begin && is_space(text[end - 1]))
        --end;
    return std::string(text.substr(begin, end - begin));
}

std::optional<std::string> ExtractMarkerValue(std::string_view line, const MarkerList& markers)
{
    for (const auto& marker : markers)
    {
        if (marker.empty())
            continue;

        size_t pos = line.find(marker);
        if (pos == std::string_view::npos)
            continue;

        size_t ascii = line.find(':', pos);
        size_t wide = line.find(kFullWidthColon, pos);
        size_t value_start = std::string_view::npos;
        if (ascii != std::string_view::npos && (wide == std::string_view::npos || ascii < wide))
            value_start = ascii + 1;
        else if (wide != std::string_view::npos)
            value_start = wide + kFullWidthColon.size();

        if (value_start == std::string_view::npos)
            continue;

        return Trim(line.substr(value_start));
    }
    return std::nullopt;
}

bool ContainsMarker(std::string_view text, const MarkerList& markers)
{
    return std::any_of(markers.begin(), markers.end(),
                       [text](const std::string& marker)
                       {
                           return !marker.empty() && text.find(marker) != std::string_view::npos;
                       });
}

bool ContainsMarkerFolded(std::string_view text, const MarkerList& markers)
{
    const std::string folded = FoldCase(text);
    return std::any_of(markers.begin(), markers.end(),
                       [&folded](const std::string& marker)
                       {
                           return !marker.empty() && folded.find(FoldCase(marker)) != std::string::npos;
                       });
}

std::vector<std::string> ParseServiceNames(std::string_view text, const MarkerTable& markers)
{
    std::vector<std::string> names;
    for (const auto& line : SplitLines(text))
    {
        auto value = ExtractMarkerValue(line, markers.service_name);
        if (value && !value->empty())
            names.push_back(std::move(*value));
    }
    return names;
}

std::optional<std::string> ParseBinaryPath(std::string_view text, const MarkerTable& markers)
{
    for (const auto& line : SplitLines(text))
    {
        if (auto value = ExtractMarkerValue(line, markers.binary_path))
            return value;
    }
    return std::nullopt;
}

std::vector<TaskEntry> ParseTaskEntries(std::string_view text, const MarkerTable& markers)
{
    std::vector<TaskEntry> entries;
    bool in_task = false;

    for (const auto& line : SplitLines(text))
    {
        if (auto name = ExtractMarkerValue(line, markers.task_name))
        {
            entries.push_back(TaskEntry{ std::move(*name), std::nullopt });
            in_task = true;
            continue;
        }

        if (!in_task)
            continue;

        if (auto program = ExtractMarkerValue(line, markers.task_program))
        {
            auto& current = entries.back();
            if (!current.program)
                current.program = std::move(*program);
        }
    }
    return entries;
}

ErrorKind ClassifyFailure(const CommandResult& result, const MarkerTable& markers)
{
    if (result.timed_out)
        return ErrorKind::Timeout;

    const std::string combined = result.raw_text + "\n" + result.error;
    if (ContainsMarkerFolded(combined, markers.access_denied))
        return ErrorKind::Permission;
    if (ContainsMarkerFolded(combined, markers.not_found))
        return ErrorKind::NotFound;
    return ErrorKind::Unexpected;
}

std::string Describe(const CommandResult& result)
{
    std::string text;
    if (result.timed_out)
        text = "timed out";
    else if (!result.error.empty())
        text = result.error;
    else
        text = "exit code " + std::to_string(result.exit_code);

    std::string output = Trim(result.raw_text);
    std::replace(output.begin(), output.end(), '\n', ' ');
    std::replace(output.begin(), output.end(), '\r', ' ');
    if (!output.empty())
    {
        if (output.size() > kDescribeLimit)
            output = output.substr(0, kDescribeLimit) + "...";
        text += ": " + output;
    }
    return text;
}

} // namespace output_parser
} // namespace sfpurge
