#pragma once

#include "Domain/IRecordSource.h"
#include "Platform/IProcessProbe.h"

#include <memory>

namespace Domain
{

/// Adapts a platform process probe to the record source contract.
/// id is the decimal PID; ports are deduplicated and sorted numerically.
class ProbeRecordSource : public IRecordSource
{
  public:
    explicit ProbeRecordSource(std::unique_ptr<Platform::IProcessProbe> probe);
    ~ProbeRecordSource() override = default;

    ProbeRecordSource(const ProbeRecordSource&) = delete;
    ProbeRecordSource& operator=(const ProbeRecordSource&) = delete;
    ProbeRecordSource(ProbeRecordSource&&) = delete;
    ProbeRecordSource& operator=(ProbeRecordSource&&) = delete;

    [[nodiscard]] FetchResult fetchAll() override;

    [[nodiscard]] const Platform::ProcessCapabilities& capabilities() const
    {
        return m_Capabilities;
    }

    /// Convert one probe entry; exposed for tests.
    [[nodiscard]] static Record toRecord(const Platform::ProcessInfo& info);

  private:
    std::unique_ptr<Platform::IProcessProbe> m_Probe;
    Platform::ProcessCapabilities m_Capabilities;
};

} // namespace Domain
