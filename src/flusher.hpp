#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include "aggregation_store.hpp"
#include "clock.hpp"
#include "usage_log.hpp"

struct FlushResult {
    std::size_t records = 0;
    std::uint64_t seconds = 0;
    bool failed = false;
};

// Moves accumulated seconds from the store into the usage log, one
// transaction per period. A failed transaction drops that interval.
class Flusher {
  public:
    Flusher(AggregationStore &store, UsageLog &log, const Clock &clock,
            std::chrono::seconds period, int prune_after_days = 0);
    ~Flusher();

    Flusher(const Flusher &) = delete;
    Flusher &operator=(const Flusher &) = delete;

    FlushResult FlushOnce();

    void Start();
    // Joins the worker and attempts a last flush.
    void Stop();

    std::uint64_t FailedFlushes() const;

  private:
    void Run();
    void PruneIfEnabled(std::int64_t now);

  private:
    AggregationStore &m_Store;
    UsageLog &m_Log;
    const Clock &m_Clock;
    const std::chrono::seconds m_Period;
    const int m_PruneAfterDays;

    std::mutex m_FlushMutex;
    std::atomic<std::uint64_t> m_FailedFlushes{0};

    std::thread m_Thread;
    std::mutex m_SchedulerMutex;
    std::condition_variable m_SchedulerCv;
    std::atomic<bool> m_ShutdownRequested{false};
};
