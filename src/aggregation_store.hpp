#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common.hpp"

struct AggregationEntry {
    ActivityTarget target;
    std::uint64_t accumulated_seconds = 0; // unflushed, reset by DrainForFlush
    std::uint64_t session_seconds = 0;     // credited since start, never reset
    std::uint64_t last_seen_tick = 0;
};

struct ActiveTarget {
    std::string identifier;
    std::uint64_t seconds = 0;          // session total
    std::uint64_t unflushed_seconds = 0;
};

struct StoreSnapshot {
    std::optional<ActivityTarget> current_target;
    std::vector<ActiveTarget> active_targets;
    std::size_t total_distinct_targets = 0;
};

// In-memory accumulator shared by the sampler, the flusher and the dashboard.
// Every public call holds m_Mutex for its whole duration and nothing leaves
// the store by reference.
class AggregationStore {
  public:
    static constexpr std::uint64_t kTickCredit = 1;

    void RecordSample(const ActivityTarget &target, std::uint64_t tick);
    std::vector<std::pair<ActivityTarget, std::uint64_t>> DrainForFlush();
    StoreSnapshot Snapshot() const;

    std::optional<std::uint64_t> AccumulatedSeconds(const std::string &identifier) const;
    std::size_t Size() const;

  private:
    mutable std::mutex m_Mutex;
    std::map<std::string, AggregationEntry> m_Entries;
};
