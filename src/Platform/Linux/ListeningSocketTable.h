#pragma once

// Only compile on Linux with required headers
#if defined(__linux__) && __has_include(<linux/inet_diag.h>) && __has_include(<linux/sock_diag.h>)

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace Platform
{

/// A listening socket as reported by Netlink INET_DIAG
struct ListeningSocket
{
    std::uint64_t inode = 0; // Socket inode (for PID mapping)
    std::uint16_t port = 0;  // Local port, host byte order
};

/// Queries listening TCP sockets (IPv4 and IPv6) via Netlink SOCK_DIAG.
/// The kernel filters by state, so only sockets in TCP_LISTEN are returned.
class ListeningSocketTable
{
  public:
    ListeningSocketTable();
    ~ListeningSocketTable() noexcept;

    ListeningSocketTable(const ListeningSocketTable&) = delete;
    ListeningSocketTable& operator=(const ListeningSocketTable&) = delete;
    ListeningSocketTable(ListeningSocketTable&&) = delete;
    ListeningSocketTable& operator=(ListeningSocketTable&&) = delete;

    /// Query all listening TCP sockets.
    /// Returns an empty vector when Netlink is unavailable.
    [[nodiscard]] std::vector<ListeningSocket> queryListeningSockets();

    /// Check if Netlink INET_DIAG is available and functional
    [[nodiscard]] bool isAvailable() const noexcept
    {
        return m_Available;
    }

  private:
    int m_Socket = -1;                // Netlink socket file descriptor
    bool m_Available = false;         // Whether INET_DIAG is functional
    mutable std::mutex m_SocketMutex; // Protects socket operations for thread safety
    std::uint32_t m_Sequence = 0;     // Netlink request sequence number
};

/// Socket inode -> every PID holding an fd to it, in /proc scan order.
/// A listener inherited across fork() has several owners.
using InodeOwnerMap = std::unordered_map<std::uint64_t, std::vector<std::int32_t>>;

/// Build the inode-to-owners mapping by scanning /proc/[pid]/fd/*
[[nodiscard]] InodeOwnerMap buildInodeToPidMap();

/// Group listening ports by owning PID. A shared socket credits its port to every owner.
/// Sockets whose inode is not owned by any visible process are dropped.
[[nodiscard]] std::unordered_map<std::int32_t, std::vector<std::uint16_t>>
groupPortsByPid(const std::vector<ListeningSocket>& sockets, const InodeOwnerMap& inodeToPid);

} // namespace Platform

#endif // __linux__ && headers available
