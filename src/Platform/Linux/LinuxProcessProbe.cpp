// Keep this translation unit parseable on non-Linux platforms (e.g. Windows clangd)
// by compiling the implementation only when targeting Linux and required headers exist.
#if defined(__linux__) && __has_include(<dirent.h>) && __has_include(<pwd.h>) && __has_include(<unistd.h>)

#include "LinuxProcessProbe.h"

#include "ListeningSocketTable.h"

#include <spdlog/spdlog.h>

#include <charconv>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>
#include <system_error>
#include <unordered_map>

#include <pwd.h>
#include <unistd.h>

namespace Platform
{

namespace
{

/// Cache UID to username mappings to avoid repeated getpwuid calls
std::unordered_map<uid_t, std::string>& getUsernameCache()
{
    static std::unordered_map<uid_t, std::string> cache;
    return cache;
}

/// Mutex to protect the username cache
std::mutex& getUsernameCacheMutex()
{
    static std::mutex mutex;
    return mutex;
}

/// Get username from UID, with caching
[[nodiscard]] std::string getUsername(uid_t uid)
{
    std::lock_guard<std::mutex> lock(getUsernameCacheMutex());
    auto& cache = getUsernameCache();
    auto it = cache.find(uid);
    if (it != cache.end())
    {
        return it->second;
    }

    // Look up username from passwd database
    struct passwd* pwd = getpwuid(uid); // NOLINT(concurrency-mt-unsafe) - guarded by cache mutex
    std::string username;
    if (pwd != nullptr && pwd->pw_name != nullptr)
    {
        username = pwd->pw_name;
    }
    else
    {
        // Fall back to UID as string
        username = std::to_string(uid);
    }

    cache[uid] = username;
    return username;
}

} // namespace

LinuxProcessProbe::LinuxProcessProbe() : m_SocketTable(std::make_unique<ListeningSocketTable>())
{
    if (!m_SocketTable->isAvailable())
    {
        spdlog::warn("LinuxProcessProbe: listening socket table unavailable, ports will be empty");
    }
}

LinuxProcessProbe::~LinuxProcessProbe() = default;

EnumerationResult LinuxProcessProbe::enumerate()
{
    const std::filesystem::path procPath("/proc");
    std::error_code errorCode;

    std::filesystem::directory_iterator procIt(procPath, errorCode);
    if (errorCode)
    {
        spdlog::error("LinuxProcessProbe: cannot open /proc: {}", errorCode.message());
        return EnumerationResult::error("cannot open /proc: " + errorCode.message());
    }

    // Snapshot sockets first so short-lived listeners are attributed consistently
    std::unordered_map<std::int32_t, std::vector<std::uint16_t>> portsByPid;
    if (m_SocketTable && m_SocketTable->isAvailable())
    {
        portsByPid = groupPortsByPid(m_SocketTable->queryListeningSockets(), buildInodeToPidMap());
    }

    std::vector<ProcessInfo> processes;
    processes.reserve(500); // Reasonable initial size

    for (const auto& entry : procIt)
    {
        if (!entry.is_directory(errorCode))
        {
            continue;
        }

        const auto& filename = entry.path().filename().string();
        std::int32_t pid = 0;

        // Check if directory name is a number (process ID)
        auto result = std::from_chars(filename.data(), filename.data() + filename.size(), pid);
        if (result.ec != std::errc{} || pid <= 0)
        {
            continue;
        }

        ProcessInfo info{};
        if (!parseProcessStat(pid, info))
        {
            spdlog::debug("LinuxProcessProbe: failed to parse /proc/{}/stat", pid);
            continue;
        }

        parseProcessStatus(pid, info);
        parseProcessCmdline(pid, info);

        if (auto it = portsByPid.find(pid); it != portsByPid.end())
        {
            info.listeningPorts = std::move(it->second);
        }

        processes.push_back(std::move(info));
    }

    if (errorCode)
    {
        spdlog::warn("LinuxProcessProbe: error iterating /proc: {}", errorCode.message());
    }

    spdlog::debug("LinuxProcessProbe: enumerated {} processes, {} with listeners", processes.size(), portsByPid.size());
    return EnumerationResult::ok(std::move(processes));
}

ProcessCapabilities LinuxProcessProbe::capabilities() const
{
    return ProcessCapabilities{.hasUser = true,    // From /proc/[pid]/status Uid field
                               .hasCommand = true, // From /proc/[pid]/cmdline
                               .hasListeningPorts = m_SocketTable && m_SocketTable->isAvailable()};
}

bool LinuxProcessProbe::parseProcessStat(std::int32_t pid, ProcessInfo& info)
{
    // Format: /proc/[pid]/stat
    // Fields: pid (comm) state ppid ...

    const std::filesystem::path statPath = std::filesystem::path("/proc") / std::to_string(pid) / "stat";
    std::ifstream statFile(statPath);
    if (!statFile.is_open())
    {
        return false;
    }

    std::string line;
    if (!std::getline(statFile, line))
    {
        return false;
    }

    // Process name is in parentheses and may contain spaces or parentheses
    // Find the last ')' to handle names like "process (name)"
    const auto nameStart = line.find('(');
    const auto nameEnd = line.rfind(')');

    if (nameStart == std::string::npos || nameEnd == std::string::npos || nameEnd <= nameStart)
    {
        return false;
    }

    info.pid = pid;
    info.name = line.substr(nameStart + 1, nameEnd - nameStart - 1);
    return true;
}

void LinuxProcessProbe::parseProcessStatus(std::int32_t pid, ProcessInfo& info)
{
    // Read /proc/[pid]/status for UID (owner) information
    // We need: Uid: <real> <effective> <saved> <filesystem>

    const std::filesystem::path statusPath = std::filesystem::path("/proc") / std::to_string(pid) / "status";
    std::ifstream statusFile(statusPath);
    if (!statusFile.is_open())
    {
        return;
    }

    std::string line;
    while (std::getline(statusFile, line))
    {
        if (line.starts_with("Uid:"))
        {
            std::istringstream iss(line.substr(4)); // Skip "Uid:"
            uid_t realUid = 0;
            iss >> realUid;
            if (!iss.fail())
            {
                info.user = getUsername(realUid);
            }
            break;
        }
    }
}

void LinuxProcessProbe::parseProcessCmdline(std::int32_t pid, ProcessInfo& info)
{
    // Format: /proc/[pid]/cmdline
    // Arguments are separated by null bytes

    const std::filesystem::path cmdlinePath = std::filesystem::path("/proc") / std::to_string(pid) / "cmdline";
    std::ifstream cmdlineFile(cmdlinePath, std::ios::binary);
    if (!cmdlineFile.is_open())
    {
        return;
    }

    std::string cmdline;
    std::getline(cmdlineFile, cmdline, '\0');

    std::string arg;
    while (std::getline(cmdlineFile, arg, '\0') && !arg.empty())
    {
        cmdline += ' ';
        cmdline += arg;
    }

    // Kernel threads have an empty cmdline
    if (cmdline.empty())
    {
        info.command = "[" + info.name + "]";
    }
    else
    {
        info.command = std::move(cmdline);
    }
}

} // namespace Platform

#endif
