#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "aggregation_store.hpp"
#include "clock.hpp"
#include "usage_log.hpp"

struct DashboardSnapshot {
    std::optional<std::string> current_app;
    std::optional<std::string> current_window;
    std::optional<std::string> current_url;
    std::int64_t uptime_seconds = 0;
    std::size_t total_distinct_targets = 0;
    std::vector<ActiveTarget> active_targets;
    std::vector<UsageRecord> recent_activity;

    // Shape polled by web/static/script.js.
    nlohmann::json ToJson() const;
};

nlohmann::json UsageRecordToJson(const UsageRecord &record);

class SnapshotReader {
  public:
    SnapshotReader(const AggregationStore &store, UsageLog &log, const Clock &clock,
                   std::int64_t start_unix, std::chrono::hours recent_window, int recent_limit);

    DashboardSnapshot Read() const;

  private:
    const AggregationStore &m_Store;
    UsageLog &m_Log;
    const Clock &m_Clock;
    const std::int64_t m_StartUnix;
    const std::chrono::hours m_RecentWindow;
    const int m_RecentLimit;
};
