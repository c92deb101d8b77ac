#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include "aggregation_store.hpp"
#include "foreground_probe.hpp"

// Polls the foreground probe once per tick and credits the observed target.
class Sampler {
  public:
    Sampler(ForegroundProbe &probe, AggregationStore &store, std::chrono::milliseconds tick);
    ~Sampler();

    Sampler(const Sampler &) = delete;
    Sampler &operator=(const Sampler &) = delete;

    // One Probing -> Updating cycle. Returns true when a sample was recorded.
    bool Tick();

    void Start();
    void Stop();

    std::uint64_t TickCount() const;
    std::uint64_t SkippedSlots() const;

  private:
    void Run();

  private:
    ForegroundProbe &m_Probe;
    AggregationStore &m_Store;
    const std::chrono::milliseconds m_Tick;

    std::atomic<std::uint64_t> m_TickSeq{0};
    std::atomic<std::uint64_t> m_SkippedSlots{0};

    std::thread m_Thread;
    std::mutex m_SchedulerMutex;
    std::condition_variable m_SchedulerCv;
    std::atomic<bool> m_ShutdownRequested{false};
};
