#include "LinuxProcessActions.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <string>
#include <system_error>

#include <unistd.h>

namespace Platform
{

namespace
{
constexpr std::int32_t INIT_PID = 1;

[[nodiscard]] std::string describeSignalError(int err)
{
    switch (err)
    {
    case EPERM:
        return "Permission denied - process belongs to another user";
    case ESRCH:
        return "Process not found - may have already exited";
    case EINVAL:
        return "Invalid signal";
    default:
        return std::system_category().message(err);
    }
}
} // namespace

LinuxProcessActions::LinuxProcessActions() : m_SelfPid(static_cast<std::int32_t>(::getpid()))
{
}

ProcessActionCapabilities LinuxProcessActions::actionCapabilities() const
{
    return {
        .canTerminate = true,
        .canKill = true,
    };
}

ProcessActionResult LinuxProcessActions::terminate(std::int32_t pid)
{
    return sendSignal(pid, SIGTERM, "SIGTERM");
}

ProcessActionResult LinuxProcessActions::kill(std::int32_t pid)
{
    return sendSignal(pid, SIGKILL, "SIGKILL");
}

bool LinuxProcessActions::isRunning(std::int32_t pid) const
{
    if (pid <= 0)
    {
        return false;
    }

    // Signal 0 performs the permission and existence checks without delivering anything
    if (::kill(pid, 0) == 0)
    {
        return true;
    }
    return errno == EPERM;
}

bool LinuxProcessActions::isProtected(std::int32_t pid) const
{
    return pid == INIT_PID || pid == m_SelfPid;
}

ProcessActionResult LinuxProcessActions::sendSignal(std::int32_t pid, int signal, std::string_view signalName) const
{
    if (pid <= 0)
    {
        return ProcessActionResult::error("Invalid PID");
    }

    if (isProtected(pid))
    {
        spdlog::warn("LinuxProcessActions: refusing to send {} to protected PID {}", signalName, pid);
        return ProcessActionResult::error(pid == INIT_PID ? "Refusing to signal init (PID 1)" : "Refusing to signal PortScope itself");
    }

    spdlog::debug("LinuxProcessActions: sending {} to PID {}", signalName, pid);

    if (::kill(pid, signal) == 0)
    {
        spdlog::info("LinuxProcessActions: sent {} to PID {}", signalName, pid);
        return ProcessActionResult::ok();
    }

    const std::string errorMsg = describeSignalError(errno);
    spdlog::warn("LinuxProcessActions: failed to send {} to PID {}: {}", signalName, pid, errorMsg);
    return ProcessActionResult::error(errorMsg);
}

} // namespace Platform
