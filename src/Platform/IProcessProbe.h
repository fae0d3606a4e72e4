#pragma once

#include "ProcessTypes.h"

namespace Platform
{

/// Reads the process table and the listening sockets attributed to it.
class IProcessProbe
{
  public:
    IProcessProbe() = default;
    virtual ~IProcessProbe() = default;

    IProcessProbe(const IProcessProbe&) = delete;
    IProcessProbe& operator=(const IProcessProbe&) = delete;
    IProcessProbe(IProcessProbe&&) = delete;
    IProcessProbe& operator=(IProcessProbe&&) = delete;

    /// One full pass over /proc. Processes that exit or deny access mid-pass are skipped;
    /// only a failure to read the process table itself fails the pass.
    [[nodiscard]] virtual EnumerationResult enumerate() = 0;

    [[nodiscard]] virtual ProcessCapabilities capabilities() const = 0;
};

} // namespace Platform
