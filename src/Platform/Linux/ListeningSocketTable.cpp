// Only compile on Linux with required headers
#if defined(__linux__) && __has_include(<linux/inet_diag.h>) && __has_include(<linux/sock_diag.h>)

#include "ListeningSocketTable.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <filesystem>
#include <string_view>
#include <system_error>

#include <arpa/inet.h>
#include <dirent.h>
#include <linux/inet_diag.h>
#include <linux/netlink.h>
#include <linux/sock_diag.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace Platform
{

namespace
{

// Buffer size for netlink messages (should be large enough for typical response)
constexpr std::size_t NETLINK_BUFFER_SIZE = 65536;

// Request structure for inet_diag.
// nlmsghdr and inet_diag_req_v2 have kernel-defined layouts that are contiguous without packing.
struct InetDiagRequest
{
    nlmsghdr nlh;
    inet_diag_req_v2 req;
};

static_assert(sizeof(InetDiagRequest) == sizeof(nlmsghdr) + sizeof(inet_diag_req_v2),
              "InetDiagRequest must be tightly packed for netlink protocol");

[[nodiscard]] std::string errnoMessage(int err)
{
    return std::system_category().message(err);
}

void parseSocketMessage(const void* msg, std::size_t len, std::vector<ListeningSocket>& results)
{
    if (len < sizeof(inet_diag_msg))
    {
        return;
    }

    const auto* diagMsg = static_cast<const inet_diag_msg*>(msg);

    ListeningSocket socket;
    socket.inode = diagMsg->idiag_inode;
    socket.port = ntohs(diagMsg->id.idiag_sport);

    if (socket.inode != 0 && socket.port != 0)
    {
        results.push_back(socket);
    }
}

/// Query listening sockets for one address family (AF_INET or AF_INET6)
void querySocketsForFamily(int socket, int family, std::uint32_t sequence, std::vector<ListeningSocket>& results)
{
    InetDiagRequest req{};
    req.nlh.nlmsg_len = sizeof(req);
    req.nlh.nlmsg_type = SOCK_DIAG_BY_FAMILY;
    req.nlh.nlmsg_flags = NLM_F_REQUEST | NLM_F_DUMP;
    req.nlh.nlmsg_seq = sequence;

    req.req.sdiag_family = static_cast<std::uint8_t>(family);
    req.req.sdiag_protocol = IPPROTO_TCP;
    req.req.idiag_states = 1U << TCP_LISTEN;

    if (send(socket, &req, sizeof(req), 0) < 0)
    {
        spdlog::debug("ListeningSocketTable: failed to send inet_diag request for family {}: {}", family, errnoMessage(errno));
        return;
    }

    // Netlink messages require 4-byte alignment (nlmsghdr has __u32 fields)
    alignas(alignof(nlmsghdr)) std::array<char, NETLINK_BUFFER_SIZE> buffer{};
    bool done = false;

    while (!done)
    {
        const ssize_t len = recv(socket, buffer.data(), buffer.size(), 0);
        if (len < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            spdlog::debug("ListeningSocketTable: failed to receive inet_diag response for family {}: {}", family, errnoMessage(errno));
            break;
        }
        if (len == 0)
        {
            break;
        }

        // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast) - kernel netlink macros
        auto remainingLen = static_cast<std::size_t>(len);
        for (auto* nlh = reinterpret_cast<nlmsghdr*>(buffer.data()); NLMSG_OK(nlh, remainingLen); nlh = NLMSG_NEXT(nlh, remainingLen))
        {
            if (nlh->nlmsg_type == NLMSG_DONE)
            {
                done = true;
                break;
            }

            if (nlh->nlmsg_type == NLMSG_ERROR)
            {
                const auto* err = static_cast<nlmsgerr*>(NLMSG_DATA(nlh));
                if (err->error != 0)
                {
                    spdlog::debug("ListeningSocketTable: netlink error for family {}: {}", family, errnoMessage(-err->error));
                }
                done = true;
                break;
            }

            if (nlh->nlmsg_type == SOCK_DIAG_BY_FAMILY)
            {
                parseSocketMessage(NLMSG_DATA(nlh), NLMSG_PAYLOAD(nlh, 0), results);
            }
        }
        // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)
    }
}

} // namespace

ListeningSocketTable::ListeningSocketTable()
{
    // NOLINTNEXTLINE(cppcoreguidelines-prefer-member-initializer) - conditional initialization
    m_Socket = socket(AF_NETLINK, SOCK_DGRAM | SOCK_CLOEXEC, NETLINK_SOCK_DIAG);
    if (m_Socket < 0)
    {
        spdlog::warn("ListeningSocketTable: failed to create NETLINK_SOCK_DIAG socket: {}", errnoMessage(errno));
        return;
    }

    sockaddr_nl addr{};
    addr.nl_family = AF_NETLINK;
    addr.nl_pid = 0;    // Let kernel assign PID
    addr.nl_groups = 0; // No multicast groups

    if (bind(m_Socket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
    {
        spdlog::warn("ListeningSocketTable: failed to bind netlink socket: {}", errnoMessage(errno));
        const int oldSocket = m_Socket;
        m_Socket = -1;
        close(oldSocket);
        return;
    }

    m_Available = true;
    spdlog::debug("ListeningSocketTable: Netlink INET_DIAG available");
}

ListeningSocketTable::~ListeningSocketTable() noexcept
{
    if (m_Socket >= 0)
    {
        const int oldSocket = m_Socket;
        m_Socket = -1;
        close(oldSocket);
    }
}

std::vector<ListeningSocket> ListeningSocketTable::queryListeningSockets()
{
    if (!m_Available || m_Socket < 0)
    {
        return {};
    }

    const std::scoped_lock lock(m_SocketMutex);

    std::vector<ListeningSocket> results;
    results.reserve(64);

    querySocketsForFamily(m_Socket, AF_INET, ++m_Sequence, results);
    querySocketsForFamily(m_Socket, AF_INET6, ++m_Sequence, results);

    return results;
}

InodeOwnerMap buildInodeToPidMap()
{
    InodeOwnerMap inodeToPid;
    inodeToPid.reserve(1024);

    const std::filesystem::path procPath("/proc");
    std::error_code errorCode;

    for (const auto& procEntry : std::filesystem::directory_iterator(procPath, errorCode))
    {
        if (!procEntry.is_directory(errorCode))
        {
            continue;
        }

        const std::string pidStr = procEntry.path().filename().string();
        std::int32_t pid = 0;
        auto result = std::from_chars(pidStr.data(), (pidStr.data() + pidStr.size()), pid);
        if (result.ec != std::errc{} || pid <= 0)
        {
            continue;
        }

        const std::filesystem::path fdPath = procEntry.path() / "fd";

        // opendir/readdir avoids exception overhead for the common EACCES case
        DIR* fdDir = opendir(fdPath.c_str());
        if (fdDir == nullptr)
        {
            continue; // Permission denied or process exited
        }

        std::array<char, 256> linkTarget{};

        // NOLINTNEXTLINE(concurrency-mt-unsafe) - single DIR* per thread
        while (const struct dirent* entry = readdir(fdDir))
        {
            if (entry->d_name[0] == '.')
            {
                continue;
            }

            const std::filesystem::path fdFilePath = fdPath / entry->d_name;
            const ssize_t linkLen = readlink(fdFilePath.c_str(), linkTarget.data(), linkTarget.size() - 1);
            if (linkLen <= 0)
            {
                continue;
            }

            // Socket links look like "socket:[inode]"
            const std::string_view target(linkTarget.data(), static_cast<std::size_t>(linkLen));
            if (!target.starts_with("socket:["))
            {
                continue;
            }

            const std::size_t start = 8; // Length of "socket:["
            const std::size_t end = target.find(']', start);
            if (end == std::string_view::npos)
            {
                continue;
            }

            std::uint64_t inode = 0;
            auto parseResult = std::from_chars((target.data() + start), (target.data() + end), inode);
            if (parseResult.ec != std::errc{} || inode == 0)
            {
                continue;
            }

            // A process may hold several fds to one socket (dup)
            auto& owners = inodeToPid[inode];
            if (owners.empty() || owners.back() != pid)
            {
                owners.push_back(pid);
            }
        }

        closedir(fdDir);
    }

    if (errorCode)
    {
        spdlog::debug("ListeningSocketTable: error iterating /proc for fd scan: {}", errorCode.message());
    }

    return inodeToPid;
}

std::unordered_map<std::int32_t, std::vector<std::uint16_t>>
groupPortsByPid(const std::vector<ListeningSocket>& sockets, const InodeOwnerMap& inodeToPid)
{
    std::unordered_map<std::int32_t, std::vector<std::uint16_t>> portsByPid;

    for (const auto& socket : sockets)
    {
        auto it = inodeToPid.find(socket.inode);
        if (it == inodeToPid.end())
        {
            continue; // Owned by a process we cannot see
        }

        for (const std::int32_t pid : it->second)
        {
            auto& ports = portsByPid[pid];
            if (std::ranges::find(ports, socket.port) == ports.end())
            {
                ports.push_back(socket.port);
            }
        }
    }

    return portsByPid;
}

} // namespace Platform

#endif // __linux__ && headers available
