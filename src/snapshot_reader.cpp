#include "snapshot_reader.hpp"

#include <algorithm>

// ─────────────────────────────────────
static nlohmann::json OptionalString(const std::optional<std::string> &value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

// ─────────────────────────────────────
nlohmann::json UsageRecordToJson(const UsageRecord &record) {
    return {{"app_name", record.app_name},
            {"window_title", record.window_title},
            {"url", OptionalString(record.url)},
            {"timestamp", record.timestamp},
            {"duration", record.duration}};
}

// ─────────────────────────────────────
nlohmann::json DashboardSnapshot::ToJson() const {
    nlohmann::json active = nlohmann::json::array();
    for (const auto &a : active_targets) {
        active.push_back(nlohmann::json::array({a.identifier, a.seconds}));
    }

    nlohmann::json recent = nlohmann::json::array();
    for (const auto &r : recent_activity) {
        recent.push_back(UsageRecordToJson(r));
    }

    return {{"uptime", uptime_seconds},
            {"total_apps", total_distinct_targets},
            {"active_apps", active},
            {"recent_activity", recent},
            {"current_app", OptionalString(current_app)},
            {"current_window", OptionalString(current_window)},
            {"current_url", OptionalString(current_url)}};
}

// ─────────────────────────────────────
SnapshotReader::SnapshotReader(const AggregationStore &store, UsageLog &log, const Clock &clock,
                               std::int64_t start_unix, std::chrono::hours recent_window,
                               int recent_limit)
    : m_Store(store), m_Log(log), m_Clock(clock), m_StartUnix(start_unix),
      m_RecentWindow(recent_window), m_RecentLimit(recent_limit) {}

// ─────────────────────────────────────
DashboardSnapshot SnapshotReader::Read() const {
    DashboardSnapshot view;
    const std::int64_t now = m_Clock.NowUnix();

    StoreSnapshot snap = m_Store.Snapshot();
    if (snap.current_target) {
        view.current_app = snap.current_target->app_name;
        view.current_window = snap.current_target->window_title;
        view.current_url = snap.current_target->url;
    }
    view.total_distinct_targets = snap.total_distinct_targets;
    view.active_targets = std::move(snap.active_targets);
    view.uptime_seconds = std::max<std::int64_t>(0, now - m_StartUnix);

    const auto window = std::chrono::duration_cast<std::chrono::seconds>(m_RecentWindow).count();
    view.recent_activity = m_Log.FetchRecent(now - window, m_RecentLimit);

    return view;
}
