#pragma once

#include <charconv>
#include <concepts>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

namespace Domain::Numeric
{

/// Safe narrowing conversion with fallback value.
/// Returns fallback if value is out of range for target type.
template<std::integral To, std::integral From> [[nodiscard]] constexpr auto narrowOr(From value, To fallback) noexcept -> To
{
    if (!std::in_range<To>(value))
    {
        return fallback;
    }
    return static_cast<To>(value);
}

/// Parse a whole string as a base-10 integer. Rejects empty input, signs on unsigned
/// types, surrounding whitespace, trailing characters and out-of-range values.
template<std::integral T> [[nodiscard]] auto parseInteger(std::string_view text) noexcept -> std::optional<T>
{
    if (text.empty())
    {
        return std::nullopt;
    }

    T value{};
    const char* end = text.data() + text.size();
    const auto result = std::from_chars(text.data(), end, value);
    if (result.ec != std::errc{} || result.ptr != end)
    {
        return std::nullopt;
    }
    return value;
}

} // namespace Domain::Numeric
