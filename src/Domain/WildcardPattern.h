#pragma once

#include "Domain/Record.h"

#include <string>
#include <string_view>
#include <vector>

namespace Domain
{

/// Case-insensitive, unanchored keyword matcher.
/// Every character is literal except '*', which matches any sequence (including empty).
/// "ch*exe" matches "chrome.exe"; "eb" matches anything containing "eb".
class WildcardPattern
{
  public:
    explicit WildcardPattern(std::string_view pattern);

    /// True if the pattern occurs anywhere in text.
    [[nodiscard]] bool matches(std::string_view text) const;

    /// True for an empty pattern or one made only of '*'.
    [[nodiscard]] bool matchesEverything() const noexcept
    {
        return m_Segments.empty();
    }

    [[nodiscard]] const std::string& pattern() const noexcept
    {
        return m_Pattern;
    }

  private:
    std::string m_Pattern;
    std::vector<std::string> m_Segments; // Lowercased literal runs between '*', empties dropped
};

/// True if the pattern matches the record's id, name, owner or any port (never detail).
[[nodiscard]] bool recordMatches(const WildcardPattern& pattern, const Record& record);

} // namespace Domain
