#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>

// parts
#include "aggregation_store.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "flusher.hpp"
#include "foreground_probe.hpp"
#include "sampler.hpp"
#include "server.hpp"
#include "snapshot_reader.hpp"
#include "sqlite.hpp"

class Foretime {
  public:
    // Throws std::runtime_error when the database or the port cannot be opened.
    Foretime(const Config &config, std::unique_ptr<ForegroundProbe> probe = nullptr);
    ~Foretime();

    // Blocks until RequestShutdown(), logging status periodically.
    void Run();
    void RequestShutdown();
    void Shutdown();

    void LogStatus();
    const SnapshotReader &Reader() const;
    int Port() const;

  private:
    static std::filesystem::path GetBinaryPath();
    static std::filesystem::path ResolveWebRoot(const std::filesystem::path &configured);

  private:
    const Config m_Config;
    SystemClock m_Clock;
    const std::int64_t m_StartUnix;

    // Scheduler
    std::mutex m_SchedulerMutex;
    std::condition_variable m_SchedulerCv;
    std::atomic<bool> m_ShutdownRequested{false};
    std::once_flag m_ShutdownOnce;

    // Parts
    std::unique_ptr<SQLite> m_SQLite;
    AggregationStore m_Store;
    std::unique_ptr<ForegroundProbe> m_Probe;
    std::unique_ptr<Sampler> m_Sampler;
    std::unique_ptr<Flusher> m_Flusher;
    std::unique_ptr<SnapshotReader> m_Reader;
    std::unique_ptr<Server> m_Server;
};
