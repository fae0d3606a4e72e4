#pragma once

#include "Domain/Record.h"

#include <string>
#include <utility>
#include <vector>

namespace Domain
{

/// Result of a full fetch. A failure covers the whole batch.
struct FetchResult
{
    bool success = false;
    std::string errorMessage;
    std::vector<Record> records;

    static FetchResult ok(std::vector<Record> records)
    {
        return {.success = true, .errorMessage = {}, .records = std::move(records)};
    }
    static FetchResult error(std::string msg)
    {
        return {.success = false, .errorMessage = std::move(msg), .records = {}};
    }
};

/// Produces the complete current list of records on demand.
/// Calls are synchronous; unreadable individual records are omitted, not reported.
class IRecordSource
{
  public:
    virtual ~IRecordSource() = default;

    IRecordSource() = default;
    IRecordSource(const IRecordSource&) = default;
    IRecordSource& operator=(const IRecordSource&) = default;
    IRecordSource(IRecordSource&&) = default;
    IRecordSource& operator=(IRecordSource&&) = default;

    [[nodiscard]] virtual FetchResult fetchAll() = 0;
};

} // namespace Domain
