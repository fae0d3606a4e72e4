#include "ProbeRecordSource.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <string>

namespace Domain
{

ProbeRecordSource::ProbeRecordSource(std::unique_ptr<Platform::IProcessProbe> probe)
    : m_Probe(std::move(probe)), m_Capabilities(m_Probe->capabilities())
{
    spdlog::debug("ProbeRecordSource: created (user={}, command={}, ports={})",
                  m_Capabilities.hasUser,
                  m_Capabilities.hasCommand,
                  m_Capabilities.hasListeningPorts);
}

FetchResult ProbeRecordSource::fetchAll()
{
    const auto startTime = std::chrono::steady_clock::now();

    auto result = m_Probe->enumerate();
    if (!result.success)
    {
        spdlog::warn("ProbeRecordSource: enumeration failed: {}", result.errorMessage);
        return FetchResult::error(std::move(result.errorMessage));
    }

    std::vector<Record> records;
    records.reserve(result.processes.size());

    for (const auto& info : result.processes)
    {
        if (info.pid <= 0)
        {
            spdlog::debug("ProbeRecordSource: skipping process '{}' without a valid PID", info.name);
            continue;
        }
        records.push_back(toRecord(info));
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
    spdlog::debug("ProbeRecordSource: fetched {} records in {}ms", records.size(), elapsed.count());

    return FetchResult::ok(std::move(records));
}

Record ProbeRecordSource::toRecord(const Platform::ProcessInfo& info)
{
    auto ports = info.listeningPorts;
    std::ranges::sort(ports);
    const auto [first, last] = std::ranges::unique(ports);
    ports.erase(first, last);

    Record record;
    record.id = std::to_string(info.pid);
    record.name = info.name;
    record.owner = info.user;
    record.ports.reserve(ports.size());
    for (const auto port : ports)
    {
        record.ports.push_back(std::to_string(port));
    }
    record.detail = info.command;
    return record;
}

} // namespace Domain
