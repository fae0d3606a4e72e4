#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace Platform
{

/// Outcome of signalling a listening process.
struct ProcessActionResult
{
    bool success = false;
    std::string errorMessage;

    static ProcessActionResult ok()
    {
        return {.success = true, .errorMessage = {}};
    }
    static ProcessActionResult error(std::string msg)
    {
        return {.success = false, .errorMessage = std::move(msg)};
    }
};

struct ProcessActionCapabilities
{
    bool canTerminate = false; // graceful stop request
    bool canKill = false;      // forced stop
};

/// Stops processes that own listening ports.
/// Implementations refuse to signal PID 1 and the calling process.
class IProcessActions
{
  public:
    virtual ~IProcessActions() = default;

    IProcessActions() = default;
    IProcessActions(const IProcessActions&) = default;
    IProcessActions& operator=(const IProcessActions&) = default;
    IProcessActions(IProcessActions&&) = default;
    IProcessActions& operator=(IProcessActions&&) = default;

    [[nodiscard]] virtual ProcessActionCapabilities actionCapabilities() const = 0;

    /// Ask the process to exit (SIGTERM on Linux).
    [[nodiscard]] virtual ProcessActionResult terminate(std::int32_t pid) = 0;

    /// Force the process to exit (SIGKILL on Linux).
    [[nodiscard]] virtual ProcessActionResult kill(std::int32_t pid) = 0;

    /// True if the PID exists, including processes this user may not signal.
    [[nodiscard]] virtual bool isRunning(std::int32_t pid) const = 0;

    /// PIDs that are never signalled.
    [[nodiscard]] virtual bool isProtected(std::int32_t pid) const = 0;
};

} // namespace Platform
