#include "flusher.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
Flusher::Flusher(AggregationStore &store, UsageLog &log, const Clock &clock,
                 std::chrono::seconds period, int prune_after_days)
    : m_Store(store), m_Log(log), m_Clock(clock), m_Period(period),
      m_PruneAfterDays(prune_after_days) {}

// ─────────────────────────────────────
Flusher::~Flusher() {
    Stop();
}

// ─────────────────────────────────────
FlushResult Flusher::FlushOnce() {
    // Serializes the periodic flush with the final one issued by Stop().
    std::lock_guard<std::mutex> flushLock(m_FlushMutex);

    FlushResult result;
    const std::int64_t now = m_Clock.NowUnix();

    // The store lock is only held inside DrainForFlush; the disk write below runs without it.
    const auto drained = m_Store.DrainForFlush();

    std::vector<UsageRecord> records;
    records.reserve(drained.size());
    for (const auto &[target, seconds] : drained) {
        if (seconds == 0) {
            continue;
        }
        UsageRecord r;
        r.identifier = target.identifier;
        r.app_name = target.app_name;
        r.window_title = target.window_title;
        r.url = target.url;
        r.timestamp = now;
        r.duration = static_cast<std::int64_t>(seconds);
        records.push_back(std::move(r));
        result.seconds += seconds;
    }

    if (records.empty()) {
        spdlog::debug("Flush: nothing to persist");
        return result;
    }

    if (!m_Log.AppendBatch(records)) {
        m_FailedFlushes.fetch_add(1);
        spdlog::error("Flush failed: dropped {} records ({} s) for this interval", records.size(),
                      result.seconds);
        result.failed = true;
        result.seconds = 0;
        return result;
    }

    result.records = records.size();
    spdlog::debug("Flushed {} records ({} s)", result.records, result.seconds);

    PruneIfEnabled(now);
    return result;
}

// ─────────────────────────────────────
void Flusher::PruneIfEnabled(std::int64_t now) {
    if (m_PruneAfterDays <= 0) {
        return;
    }
    const std::int64_t cutoff = now - static_cast<std::int64_t>(m_PruneAfterDays) * 24 * 3600;
    if (m_Log.PruneOlderThan(cutoff) < 0) {
        spdlog::warn("Retention pruning failed, history kept");
    }
}

// ─────────────────────────────────────
void Flusher::Start() {
    if (m_Thread.joinable()) {
        return;
    }
    m_ShutdownRequested.store(false);
    m_Thread = std::thread([this] { Run(); });
    spdlog::info("Flusher started (every {} s)", m_Period.count());
}

// ─────────────────────────────────────
void Flusher::Stop() {
    {
        std::lock_guard<std::mutex> lk(m_SchedulerMutex);
        m_ShutdownRequested.store(true);
    }
    m_SchedulerCv.notify_all();

    if (!m_Thread.joinable()) {
        return;
    }
    m_Thread.join();

    const FlushResult last = FlushOnce();
    if (last.failed) {
        spdlog::error("Final flush failed");
    } else {
        spdlog::info("Final flush: {} records ({} s)", last.records, last.seconds);
    }
}

// ─────────────────────────────────────
void Flusher::Run() {
    auto next = std::chrono::steady_clock::now() + m_Period;

    while (true) {
        {
            std::unique_lock<std::mutex> lk(m_SchedulerMutex);
            m_SchedulerCv.wait_until(lk, next, [this] { return m_ShutdownRequested.load(); });
        }
        if (m_ShutdownRequested.load()) {
            break;
        }

        FlushOnce();

        next += m_Period;
        const auto now = std::chrono::steady_clock::now();
        if (next <= now) {
            next = now + m_Period;
        }
    }
}

// ─────────────────────────────────────
std::uint64_t Flusher::FailedFlushes() const {
    return m_FailedFlushes.load();
}
