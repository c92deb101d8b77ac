#include "sampler.hpp"

#include "browser_url.hpp"

#include <spdlog/spdlog.h>

#include <exception>

// ─────────────────────────────────────
Sampler::Sampler(ForegroundProbe &probe, AggregationStore &store, std::chrono::milliseconds tick)
    : m_Probe(probe), m_Store(store), m_Tick(tick) {}

// ─────────────────────────────────────
Sampler::~Sampler() {
    Stop();
}

// ─────────────────────────────────────
bool Sampler::Tick() {
    const std::uint64_t tick = ++m_TickSeq;

    // The probe may block on compositor IPC; it never runs under the store lock.
    std::optional<ProbeResult> result;
    try {
        result = m_Probe.Probe();
    } catch (const std::exception &e) {
        spdlog::warn("Foreground probe failed on tick {}: {}", tick, e.what());
        return false;
    }

    if (!result) {
        spdlog::debug("Tick {}: no identifiable foreground target", tick);
        return false;
    }

    const ActivityTarget target = MakeTarget(*result);
    m_Store.RecordSample(target, tick);
    spdlog::debug("Tick {}: {}", tick, target.identifier);
    return true;
}

// ─────────────────────────────────────
void Sampler::Start() {
    if (m_Thread.joinable()) {
        return;
    }
    m_ShutdownRequested.store(false);
    m_Thread = std::thread([this] { Run(); });
    spdlog::info("Sampler started (tick {} ms)", m_Tick.count());
}

// ─────────────────────────────────────
void Sampler::Stop() {
    {
        std::lock_guard<std::mutex> lk(m_SchedulerMutex);
        m_ShutdownRequested.store(true);
    }
    m_SchedulerCv.notify_all();

    if (m_Thread.joinable()) {
        m_Thread.join();
        spdlog::info("Sampler stopped after {} ticks", m_TickSeq.load());
    }
}

// ─────────────────────────────────────
void Sampler::Run() {
    auto next = std::chrono::steady_clock::now();

    while (!m_ShutdownRequested.load()) {
        Tick();

        // Fixed cadence: slot n is due at start + n * tick. Slots that passed
        // entirely while probing are skipped, not replayed.
        next += m_Tick;
        const auto now = std::chrono::steady_clock::now();
        if (now > next) {
            const auto missed = (now - next) / m_Tick;
            if (missed > 0) {
                next += m_Tick * missed;
                m_SkippedSlots.fetch_add(static_cast<std::uint64_t>(missed));
                spdlog::debug("Sampler overran, skipped {} tick(s)", missed);
            }
        }

        std::unique_lock<std::mutex> lk(m_SchedulerMutex);
        m_SchedulerCv.wait_until(lk, next, [this] { return m_ShutdownRequested.load(); });
    }
}

// ─────────────────────────────────────
std::uint64_t Sampler::TickCount() const {
    return m_TickSeq.load();
}

// ─────────────────────────────────────
std::uint64_t Sampler::SkippedSlots() const {
    return m_SkippedSlots.load();
}
