#pragma once

#include "Domain/Numeric.h"
#include "Domain/Record.h"
#include "UI/Format.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace App
{

/// All columns of the listeners table.
/// Order here defines the default column order.
enum class ListenerColumn : std::uint8_t
{
    PID = 0,
    Name,
    User,
    Ports,
    Command,
    Action,
    Count // Must be last
};

[[nodiscard]] constexpr auto allListenerColumns() -> std::array<ListenerColumn, 6>
{
    // Keep in sync with ListenerColumn enum (excluding Count).
    return {
        ListenerColumn::PID,
        ListenerColumn::Name,
        ListenerColumn::User,
        ListenerColumn::Ports,
        ListenerColumn::Command,
        ListenerColumn::Action,
    };
}

[[nodiscard]] constexpr auto listenerColumnCount() -> std::size_t
{
    return allListenerColumns().size();
}

[[nodiscard]] constexpr auto toIndex(ListenerColumn col) -> std::size_t
{
    return static_cast<std::size_t>(std::to_underlying(col));
}

/// Column metadata for display
struct ListenerColumnInfo
{
    std::string_view name;        // Display name in header
    float defaultWidth;           // Default column width (0 = stretch)
    bool defaultVisible;          // Visible by default
    bool canHide;                 // Whether user can hide this column
    bool sortable;                // Whether clicking the header sorts
    std::string_view description; // Tooltip description
};

/// Get metadata for a column
constexpr auto getColumnInfo(ListenerColumn col) -> ListenerColumnInfo
{
    // clang-format off
    constexpr std::array<ListenerColumnInfo, listenerColumnCount()> infos = {{
        {.name="PID", .defaultWidth=70.0F, .defaultVisible=true, .canHide=false, .sortable=true, .description="Process ID"},
        {.name="Name", .defaultWidth=160.0F, .defaultVisible=true, .canHide=false, .sortable=true, .description="Process name"},
        {.name="User", .defaultWidth=100.0F, .defaultVisible=true, .canHide=true, .sortable=true, .description="Process owner"},
        {.name="Listening Ports", .defaultWidth=0.0F, .defaultVisible=true, .canHide=true, .sortable=true, .description="TCP ports in LISTEN state"},
        {.name="Command", .defaultWidth=0.0F, .defaultVisible=false, .canHide=true, .sortable=true, .description="Full command line"},
        {.name="Action", .defaultWidth=90.0F, .defaultVisible=true, .canHide=true, .sortable=false, .description="Process actions"},
    }};
    // clang-format on

    return infos[toIndex(col)];
}

[[nodiscard]] constexpr auto listenerColumnFromIndex(std::size_t index) -> std::optional<ListenerColumn>
{
    if (index >= listenerColumnCount())
    {
        return std::nullopt;
    }
    return allListenerColumns()[index];
}

/// Numeric value of a decimal id, or nullopt when the id is not a plain number.
[[nodiscard]] inline auto numericId(std::string_view id) -> std::optional<std::int64_t>
{
    return Domain::Numeric::parseInteger<std::int64_t>(id);
}

/// Text shown in a cell (Action renders a button and has no text).
[[nodiscard]] inline auto cellText(const Domain::Record& record, ListenerColumn col) -> std::string
{
    switch (col)
    {
    case ListenerColumn::PID:
        return record.id;
    case ListenerColumn::Name:
        return record.name;
    case ListenerColumn::User:
        return record.owner;
    case ListenerColumn::Ports:
        return UI::Format::formatPorts(record.ports);
    case ListenerColumn::Command:
        return record.detail;
    case ListenerColumn::Action:
    case ListenerColumn::Count:
        break;
    }
    return {};
}

/// Strict ordering of two records by a column; ids and ports compare numerically when they can.
[[nodiscard]] inline bool recordLess(const Domain::Record& lhs, const Domain::Record& rhs, ListenerColumn col)
{
    switch (col)
    {
    case ListenerColumn::PID:
    {
        const auto a = numericId(lhs.id);
        const auto b = numericId(rhs.id);
        if (a && b)
        {
            return *a < *b;
        }
        return lhs.id < rhs.id;
    }
    case ListenerColumn::Name:
        return lhs.name < rhs.name;
    case ListenerColumn::User:
        return lhs.owner < rhs.owner;
    case ListenerColumn::Ports:
    {
        // Records without ports sort last in ascending order
        if (lhs.ports.empty() || rhs.ports.empty())
        {
            return !lhs.ports.empty() && rhs.ports.empty();
        }
        const auto a = numericId(lhs.ports.front());
        const auto b = numericId(rhs.ports.front());
        if (a && b && *a != *b)
        {
            return *a < *b;
        }
        return lhs.ports < rhs.ports;
    }
    case ListenerColumn::Command:
        return lhs.detail < rhs.detail;
    case ListenerColumn::Action:
    case ListenerColumn::Count:
        break;
    }
    return false;
}

/// Stable sort so equal keys keep their query order.
inline void sortRecords(std::vector<Domain::Record>& records, ListenerColumn col, bool ascending)
{
    if (!getColumnInfo(col).sortable)
    {
        return;
    }

    std::ranges::stable_sort(records,
                             [col, ascending](const Domain::Record& a, const Domain::Record& b)
                             { return ascending ? recordLess(a, b, col) : recordLess(b, a, col); });
}

} // namespace App
