#pragma once

#include "ICommandRunner.hpp"
#include "ITaskScheduler.hpp"
#include "MarkerTable.hpp"
#include "../core/Result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sfpurge
{

// Line-oriented parsing of sc.exe / schtasks.exe text output. Every function
// takes the marker alternatives explicitly; no wording is hardcoded here.
namespace output_parser
{

std::vector<std::string> SplitLines(std::string_view text);

std::string Trim(std::string_view text);

/// Value after the first marker found in `line`: the text following the
/// first colon (ASCII or full-width) at or after the marker, trimmed.
std::optional<std::string> ExtractMarkerValue(std::string_view line, const MarkerList& markers);

/// Case-sensitive test for any marker anywhere in `text`.
bool ContainsMarker(std::string_view text, const MarkerList& markers);

/// Case-insensitive variant, used for free-form error wording.
bool ContainsMarkerFolded(std::string_view text, const MarkerList& markers);

std::vector<std::string> ParseServiceNames(std::string_view text, const MarkerTable& markers);

/// Binary path from `sc qc` output. nullopt when no path line is present.
std::optional<std::string> ParseBinaryPath(std::string_view text, const MarkerTable& markers);

/// Task entries from `schtasks /query /fo LIST /v` output, in output order.
std::vector<TaskEntry> ParseTaskEntries(std::string_view text, const MarkerTable& markers);

/// Classifies a failed command by timeout flag and error wording.
ErrorKind ClassifyFailure(const CommandResult& result, const MarkerTable& markers);

/// Short single-line description of a command result for logs.
std::string Describe(const CommandResult& result);

} // namespace output_parser

} // namespace sfpurge
