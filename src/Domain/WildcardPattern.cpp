#include "WildcardPattern.h"

#include <algorithm>

namespace Domain
{

namespace
{

// ASCII only; multibyte sequences are compared byte-for-byte
[[nodiscard]] constexpr char toLowerAscii(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

} // namespace

WildcardPattern::WildcardPattern(std::string_view pattern) : m_Pattern(pattern)
{
    std::string current;
    for (const char c : pattern)
    {
        if (c == '*')
        {
            if (!current.empty())
            {
                m_Segments.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(toLowerAscii(c));
    }

    if (!current.empty())
    {
        m_Segments.push_back(std::move(current));
    }
}

bool WildcardPattern::matches(std::string_view text) const
{
    // Leftmost placement of each segment is optimal for an unanchored match
    auto cursor = text.begin();
    for (const auto& segment : m_Segments)
    {
        const auto found = std::search(cursor, text.end(), segment.begin(), segment.end(), [](char lhs, char rhs) {
            return toLowerAscii(lhs) == rhs;
        });
        if (found == text.end())
        {
            return false;
        }
        cursor = found + static_cast<std::ptrdiff_t>(segment.size());
    }
    return true;
}

bool recordMatches(const WildcardPattern& pattern, const Record& record)
{
    if (pattern.matchesEverything())
    {
        return true;
    }

    return pattern.matches(record.id) || pattern.matches(record.name) || pattern.matches(record.owner) ||
           std::ranges::any_of(record.ports, [&pattern](const std::string& port) { return pattern.matches(port); });
}

} // namespace Domain
