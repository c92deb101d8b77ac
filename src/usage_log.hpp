#pragma once

#include <cstdint>
#include <vector>

#include "common.hpp"

// Durable append-only log of flushed usage intervals.
class UsageLog {
  public:
    virtual ~UsageLog() = default;

    // All records or none. Returns false when nothing was committed.
    virtual bool AppendBatch(const std::vector<UsageRecord> &records) = 0;

    // Records with timestamp >= since_unix, newest first, at most `limit`.
    virtual std::vector<UsageRecord> FetchRecent(std::int64_t since_unix, int limit) = 0;

    // Returns the number of rows removed, or -1 on failure.
    virtual int PruneOlderThan(std::int64_t cutoff_unix) = 0;
};
