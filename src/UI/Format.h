#pragma once

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <chrono>
#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace UI::Format
{

/// Comma-joined port list, or "-" when the record has none.
[[nodiscard]] inline auto formatPorts(const std::vector<std::string>& ports) -> std::string
{
    if (ports.empty())
    {
        return "-";
    }
    return fmt::format("{}", fmt::join(ports, ", "));
}

template<std::integral T> [[nodiscard]] inline auto formatCountWithLabel(T value, std::string_view label) -> std::string
{
    return fmt::format("{} {}", value, label);
}

/// Compact age of a snapshot: "850 ms", "12.3 s", "4m 10s", "2h 05m".
[[nodiscard]] inline auto formatAge(std::chrono::milliseconds age) -> std::string
{
    using namespace std::chrono;

    if (age < milliseconds::zero())
    {
        age = milliseconds::zero();
    }

    if (age < seconds(1))
    {
        return fmt::format("{} ms", age.count());
    }
    if (age < minutes(1))
    {
        return fmt::format("{:.1f} s", duration<double>(age).count());
    }
    if (age < hours(1))
    {
        const auto mins = duration_cast<minutes>(age);
        const auto secs = duration_cast<seconds>(age - mins);
        return fmt::format("{}m {}s", mins.count(), secs.count());
    }

    const auto hrs = duration_cast<hours>(age);
    const auto mins = duration_cast<minutes>(age - hrs);
    return fmt::format("{}h {:02}m", hrs.count(), mins.count());
}

} // namespace UI::Format
