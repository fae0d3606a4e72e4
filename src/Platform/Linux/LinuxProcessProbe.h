#pragma once

#include "Platform/IProcessProbe.h"

#include <cstdint>
#include <memory>

namespace Platform
{

class ListeningSocketTable;

/// Linux implementation of IProcessProbe.
/// Reads processes from the /proc filesystem and attributes listening TCP
/// sockets (from Netlink SOCK_DIAG) to their owners via /proc/[pid]/fd.
class LinuxProcessProbe : public IProcessProbe
{
  public:
    LinuxProcessProbe();
    ~LinuxProcessProbe() override;

    LinuxProcessProbe(const LinuxProcessProbe&) = delete;
    LinuxProcessProbe& operator=(const LinuxProcessProbe&) = delete;
    LinuxProcessProbe(LinuxProcessProbe&&) = delete;
    LinuxProcessProbe& operator=(LinuxProcessProbe&&) = delete;

    [[nodiscard]] EnumerationResult enumerate() override;
    [[nodiscard]] ProcessCapabilities capabilities() const override;

  private:
    std::unique_ptr<ListeningSocketTable> m_SocketTable;

    /// Parse /proc/[pid]/stat for the process name
    [[nodiscard]] static bool parseProcessStat(std::int32_t pid, ProcessInfo& info);

    /// Parse /proc/[pid]/status for owner (UID) info
    static void parseProcessStatus(std::int32_t pid, ProcessInfo& info);

    /// Parse /proc/[pid]/cmdline for full command line
    static void parseProcessCmdline(std::int32_t pid, ProcessInfo& info);
};

} // namespace Platform
