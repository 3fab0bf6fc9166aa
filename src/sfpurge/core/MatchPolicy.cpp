#include "MatchPolicy.hpp"

#include <algorithm>
#include <cctype>

namespace sfpurge
{

std::string FoldCase(std::string_view text)
{
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c)
                   {
                       return static_cast<char>(std::tolower(c));
                   });
    return result;
}

bool ContainsFolded(std::string_view haystack, std::string_view needle)
{
    if (needle.empty())
        return false;
    return FoldCase(haystack).find(FoldCase(needle)) != std::string::npos;
}

std::string PathToUtf8(const std::filesystem::path& path)
{
    const std::u8string text = path.u8string();
    return std::string(text.begin(), text.end());
}

std::filesystem::path PathFromUtf8(std::string_view text)
{
    return std::filesystem::path(std::u8string(text.begin(), text.end()));
}

std::string FoldedStem(std::string_view file_name)
{
    size_t start = file_name.find_last_of("/\\");
    start = (start == std::string_view::npos) ? 0 : start + 1;
    std::string_view base = file_name.substr(start);

    // Same rule as std::filesystem::path::stem: a leading dot is part of the name
    size_t dot = base.find_last_of('.');
    if (dot != std::string_view::npos && dot != 0)
        base = base.substr(0, dot);

    return FoldCase(base);
}

KeywordSet::KeywordSet(std::initializer_list<std::string> keywords)
{
    for (const auto& keyword : keywords)
        Add(keyword);
}

KeywordSet::KeywordSet(const std::vector<std::string>& keywords)
{
    for (const auto& keyword : keywords)
        Add(keyword);
}

void KeywordSet::Add(std::string_view keyword)
{
    if (keyword.empty())
        return;

    std::string folded = FoldCase(keyword);
    if (std::find(keywords_.begin(), keywords_.end(), folded) == keywords_.end())
        keywords_.push_back(std::move(folded));
}

bool KeywordSet::Matches(std::string_view text) const
{
    return !FirstMatch(text).empty();
}

std::string KeywordSet::FirstMatch(std::string_view text) const
{
    const std::string folded = FoldCase(text);
    for (const auto& keyword : keywords_)
    {
        if (folded.find(keyword) != std::string::npos)
            return keyword;
    }
    return {};
}

} // namespace sfpurge
