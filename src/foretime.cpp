#include "foretime.hpp"

#include "window.hpp"

#include <spdlog/spdlog.h>

#include <limits.h>
#include <stdexcept>
#include <unistd.h>
#include <vector>

// ─────────────────────────────────────
Foretime::Foretime(const Config &config, std::unique_ptr<ForegroundProbe> probe)
    : m_Config(config), m_StartUnix(m_Clock.NowUnix()), m_Probe(std::move(probe)) {

    ApplyLogLevel(m_Config.log_level);

    std::error_code ec;
    if (!m_Config.db_path.parent_path().empty()) {
        std::filesystem::create_directories(m_Config.db_path.parent_path(), ec);
    }
    if (ec) {
        throw std::runtime_error("unable to create " + m_Config.db_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const std::filesystem::path root = ResolveWebRoot(m_Config.web_root);
    if (!std::filesystem::exists(root / "index.html", ec)) {
        spdlog::warn("index.html not found under {}; only the JSON API will work", root.string());
    }
    spdlog::info("Static WebSite Root: {}", root.string());
    spdlog::info("DataBase path: {}", m_Config.db_path.string());

    // SQlite
    m_SQLite = std::make_unique<SQLite>(m_Config.db_path.string());
    const int known = m_SQLite->CountKnownIdentifiers();
    if (known >= 0) {
        spdlog::info("SQLite database initialized ({} targets in history)", known);
    }

    // Foreground probe (compositor IPC)
    if (!m_Probe) {
        auto window = std::make_unique<Window>();
        if (!window->IsAvailable()) {
            spdlog::warn("No supported compositor found (NIRI_SOCKET / HYPRLAND_INSTANCE_SIGNATURE); "
                         "no foreground time will be attributed");
        }
        m_Probe = std::move(window);
    }

    m_Sampler = std::make_unique<Sampler>(*m_Probe, m_Store, m_Config.tick);
    m_Flusher = std::make_unique<Flusher>(m_Store, *m_SQLite, m_Clock, m_Config.flush_period,
                                          m_Config.prune_after_days);
    m_Reader = std::make_unique<SnapshotReader>(m_Store, *m_SQLite, m_Clock, m_StartUnix,
                                                m_Config.recent_window, m_Config.recent_limit);

    // Server
    m_Server = std::make_unique<Server>(*m_Reader, root);
    if (!m_Server->Start("127.0.0.1", static_cast<int>(m_Config.port))) {
        throw std::runtime_error("unable to listen on port " + std::to_string(m_Config.port));
    }

    m_Sampler->Start();
    m_Flusher->Start();
}

// ─────────────────────────────────────
Foretime::~Foretime() {
    Shutdown();
}

// ─────────────────────────────────────
void Foretime::Run() {
    auto next = std::chrono::steady_clock::now() + m_Config.status_period;

    std::unique_lock<std::mutex> lk(m_SchedulerMutex);
    while (!m_ShutdownRequested.load()) {
        if (m_Config.status_period.count() == 0) {
            m_SchedulerCv.wait(lk, [this] { return m_ShutdownRequested.load(); });
            break;
        }

        if (m_SchedulerCv.wait_until(lk, next, [this] { return m_ShutdownRequested.load(); })) {
            break;
        }

        lk.unlock();
        LogStatus();
        lk.lock();
        next += m_Config.status_period;
    }
    spdlog::info("Shutdown requested");
}

// ─────────────────────────────────────
void Foretime::RequestShutdown() {
    {
        std::lock_guard<std::mutex> lk(m_SchedulerMutex);
        m_ShutdownRequested.store(true);
    }
    m_SchedulerCv.notify_all();
}

// ─────────────────────────────────────
void Foretime::Shutdown() {
    std::call_once(m_ShutdownOnce, [this] {
        RequestShutdown();
        // Stop producing samples before the last flush so nothing lands after it.
        if (m_Sampler) {
            m_Sampler->Stop();
        }
        if (m_Flusher) {
            m_Flusher->Stop();
        }
        if (m_Server) {
            m_Server->Stop();
        }
    });
}

// ─────────────────────────────────────
void Foretime::LogStatus() {
    const DashboardSnapshot snap = m_Reader->Read();

    spdlog::info("Uptime: {} s, tracked targets: {}", snap.uptime_seconds,
                 snap.total_distinct_targets);
    if (snap.current_app) {
        spdlog::info("Current: {} | {}{}", *snap.current_app, snap.current_window.value_or(""),
                     snap.current_url ? " | " + *snap.current_url : "");
    }
    for (const auto &a : snap.active_targets) {
        spdlog::debug("  {} ({} s)", a.identifier, a.seconds);
    }
}

// ─────────────────────────────────────
const SnapshotReader &Foretime::Reader() const {
    return *m_Reader;
}

// ─────────────────────────────────────
int Foretime::Port() const {
    return m_Server ? m_Server->Port() : -1;
}

// ─────────────────────────────────────
std::filesystem::path Foretime::GetBinaryPath() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len == -1) {
        spdlog::warn("Unable to resolve /proc/self/exe, using the working directory");
        return std::filesystem::current_path();
    }
    buf[len] = '\0';
    return std::filesystem::path(buf).parent_path();
}

// ─────────────────────────────────────
std::filesystem::path Foretime::ResolveWebRoot(const std::filesystem::path &configured) {
    if (!configured.empty()) {
        return configured;
    }

    std::filesystem::path binDir = GetBinaryPath();
    std::vector<std::filesystem::path> candidates = {binDir / "web"};
    if (binDir.filename() == "bin") {
        candidates.push_back(binDir.parent_path() / "share" / "foretime");
    }
    candidates.emplace_back("/usr/local/share/foretime");
    candidates.emplace_back("/usr/share/foretime");

    std::error_code ec;
    for (const auto &p : candidates) {
        if (std::filesystem::exists(p / "index.html", ec)) {
            return p;
        }
    }
    return candidates.front();
}
