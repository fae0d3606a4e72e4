#pragma once

#include <string>
#include <vector>

namespace Domain
{

/// One entity in a snapshot: a process annotated with its listening ports.
/// Immutable once produced by a record source.
struct Record
{
    std::string id;                 // Unique within a snapshot (decimal PID)
    std::string name;               // Process name
    std::string owner;              // User name
    std::vector<std::string> ports; // Listening ports, may be empty
    std::string detail;             // Full command line, never indexed

    bool operator==(const Record&) const = default;
};

} // namespace Domain
