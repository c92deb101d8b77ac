#include "aggregation_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <stdexcept>

// ─────────────────────────────────────
static std::uint64_t AddCredit(std::uint64_t value, const std::string &identifier) {
    if (value > std::numeric_limits<std::uint64_t>::max() - AggregationStore::kTickCredit) {
        spdlog::critical("Accumulator overflow for '{}'", identifier);
        throw std::logic_error("aggregation accumulator overflow for " + identifier);
    }
    return value + AggregationStore::kTickCredit;
}

// ─────────────────────────────────────
void AggregationStore::RecordSample(const ActivityTarget &target, std::uint64_t tick) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    auto it = m_Entries.find(target.identifier);
    if (it == m_Entries.end()) {
        AggregationEntry entry;
        entry.target = target;
        entry.accumulated_seconds = kTickCredit;
        entry.session_seconds = kTickCredit;
        entry.last_seen_tick = tick;
        m_Entries.emplace(target.identifier, std::move(entry));
        spdlog::debug("New target tracked: {}", target.identifier);
        return;
    }

    AggregationEntry &entry = it->second;
    entry.accumulated_seconds = AddCredit(entry.accumulated_seconds, target.identifier);
    entry.session_seconds = AddCredit(entry.session_seconds, target.identifier);
    entry.target.window_title = target.window_title;
    entry.target.url = target.url;
    entry.last_seen_tick = tick;
}

// ─────────────────────────────────────
std::vector<std::pair<ActivityTarget, std::uint64_t>> AggregationStore::DrainForFlush() {
    std::lock_guard<std::mutex> lock(m_Mutex);

    std::vector<std::pair<ActivityTarget, std::uint64_t>> drained;
    drained.reserve(m_Entries.size());
    for (auto &[identifier, entry] : m_Entries) {
        drained.emplace_back(entry.target, entry.accumulated_seconds);
        entry.accumulated_seconds = 0;
    }
    return drained;
}

// ─────────────────────────────────────
StoreSnapshot AggregationStore::Snapshot() const {
    std::lock_guard<std::mutex> lock(m_Mutex);

    StoreSnapshot snap;
    snap.total_distinct_targets = m_Entries.size();
    snap.active_targets.reserve(m_Entries.size());

    const AggregationEntry *current = nullptr;
    for (const auto &[identifier, entry] : m_Entries) {
        if (current == nullptr || entry.last_seen_tick > current->last_seen_tick) {
            current = &entry;
        }
        snap.active_targets.push_back({identifier, entry.session_seconds, entry.accumulated_seconds});
    }
    if (current != nullptr) {
        snap.current_target = current->target;
    }

    std::sort(snap.active_targets.begin(), snap.active_targets.end(),
              [](const ActiveTarget &a, const ActiveTarget &b) {
                  if (a.seconds != b.seconds) {
                      return a.seconds > b.seconds;
                  }
                  return a.identifier < b.identifier;
              });
    return snap;
}

// ─────────────────────────────────────
std::optional<std::uint64_t>
AggregationStore::AccumulatedSeconds(const std::string &identifier) const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    auto it = m_Entries.find(identifier);
    if (it == m_Entries.end()) {
        return std::nullopt;
    }
    return it->second.accumulated_seconds;
}

// ─────────────────────────────────────
std::size_t AggregationStore::Size() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_Entries.size();
}
