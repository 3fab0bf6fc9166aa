#pragma once

#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace sfpurge
{

/// ASCII case folding. Non-ASCII bytes (UTF-8 sequences) pass through untouched.
std::string FoldCase(std::string_view text);

/// Case-insensitive substring test. An empty needle never matches.
bool ContainsFolded(std::string_view haystack, std::string_view needle);

/// Path as UTF-8 text. Process names and decoded command output are UTF-8,
/// so every path that is matched or printed goes through here rather than
/// path::string(), which uses the ANSI code page on Windows.
std::string PathToUtf8(const std::filesystem::path& path);

/// Inverse of PathToUtf8, for paths that come from configuration.
std::filesystem::path PathFromUtf8(std::string_view text);

/// Folded filename stem: "AgentUI.EXE" -> "agentui", "C:\\x\\a.b.exe" -> "a.b"
std::string FoldedStem(std::string_view file_name);

/// A set of lowercase substrings. Used for the watchdog heuristic and the
/// vendor keyword so the policy can be swapped from configuration.
class KeywordSet
{
public:
    KeywordSet() = default;
    KeywordSet(std::initializer_list<std::string> keywords);
    explicit KeywordSet(const std::vector<std::string>& keywords);

    void Add(std::string_view keyword);

    /// True when any keyword is a substring of the folded text.
    bool Matches(std::string_view text) const;

    /// First keyword found in the text, empty when none.
    std::string FirstMatch(std::string_view text) const;

    bool Empty() const { return keywords_.empty(); }
    const std::vector<std::string>& Keywords() const { return keywords_; }

private:
    std::vector<std::string> keywords_;
};

} // namespace sfpurge
