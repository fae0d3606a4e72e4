#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace Platform
{

/// Raw process data from the OS - no derived values.
/// Probes populate this; the domain layer turns it into records.
struct ProcessInfo
{
    std::int32_t pid = 0;
    std::string name;
    std::string user;    // Username (owner) of the process
    std::string command; // Full command line

    // Local ports of listening sockets owned by this process (unsorted, may repeat)
    std::vector<std::uint16_t> listeningPorts;
};

/// Result of a full enumeration pass.
/// A failed pass means the whole batch is unusable; unreadable individual
/// processes are skipped by the probe and never reported here.
struct EnumerationResult
{
    bool success = false;
    std::string errorMessage;
    std::vector<ProcessInfo> processes;

    static EnumerationResult ok(std::vector<ProcessInfo> processes)
    {
        return {.success = true, .errorMessage = {}, .processes = std::move(processes)};
    }
    static EnumerationResult error(std::string msg)
    {
        return {.success = false, .errorMessage = std::move(msg), .processes = {}};
    }
};

/// Reports what this platform's probe supports.
struct ProcessCapabilities
{
    bool hasUser = false;           // Whether process owner/user is available
    bool hasCommand = false;        // Whether full command line is available
    bool hasListeningPorts = false; // Whether sockets can be attributed to processes
};

} // namespace Platform
