#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace fenrom {

const char* to_string(ExcludeScope scope)
{
    return scope == ExcludeScope::FullFen ? "fen" : "board";
}

const char* to_string(ThemeMatch match)
{
    return match == ThemeMatch::Exact ? "exact" : "substring";
}

const char* to_string(HeaderCounts counts)
{
    return counts == HeaderCounts::Emitted ? "emitted" : "packed";
}

ExcludeScope parseExcludeScope(const std::string& text)
{
    if (text == "fen") return ExcludeScope::FullFen;
    if (text == "board") return ExcludeScope::Board;
    throw std::invalid_argument("Invalid exclude scope '" + text + "' (expected fen or board)");
}

ThemeMatch parseThemeMatch(const std::string& text)
{
    if (text == "exact") return ThemeMatch::Exact;
    if (text == "substring") return ThemeMatch::Substring;
    throw std::invalid_argument("Invalid theme match '" + text + "' (expected exact or substring)");
}

HeaderCounts parseHeaderCounts(const std::string& text)
{
    if (text == "emitted") return HeaderCounts::Emitted;
    if (text == "packed") return HeaderCounts::Packed;
    throw std::invalid_argument("Invalid header count source '" + text + "' (expected emitted or packed)");
}

std::string lowercase(const std::string& text)
{
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

} // namespace fenrom
