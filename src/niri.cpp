#include "niri.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>

// ─────────────────────────────────────
NiriIPC::NiriIPC() {
    if (const char *env = std::getenv("NIRI_SOCKET"); env != nullptr) {
        m_SocketPath = env;
    }
}

// ─────────────────────────────────────
bool NiriIPC::IsAvailable() const {
    return !m_SocketPath.empty();
}

// ─────────────────────────────────────
void NiriIPC::Reset() {
    m_Socket.Close();
    m_Pending.clear();
}

// ─────────────────────────────────────
std::optional<std::string> NiriIPC::ReadLine(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (auto pos = m_Pending.find('\n'); pos != std::string::npos) {
            std::string line = m_Pending.substr(0, pos);
            m_Pending.erase(0, pos + 1);
            return line;
        }
        if (m_Socket.ReadSome(m_Pending, deadline) != UnixSocket::READ_DATA) {
            return std::nullopt;
        }
    }
}

// ─────────────────────────────────────
std::optional<nlohmann::json> NiriIPC::Exchange(const std::string &request,
                                                std::chrono::milliseconds timeout) {
    if (!m_Socket.IsOpen()) {
        m_Pending.clear();
        if (!m_Socket.Connect(m_SocketPath)) {
            return std::nullopt;
        }
    }

    if (!m_Socket.SendAll(request)) {
        spdlog::debug("niri IPC: send failed");
        Reset();
        return std::nullopt;
    }

    const auto line = ReadLine(timeout);
    if (!line) {
        spdlog::debug("niri IPC: no reply (timeout or disconnect)");
        Reset();
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(*line);
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::warn("niri IPC: malformed reply: {}", e.what());
        Reset();
        return std::nullopt;
    }
}

// ─────────────────────────────────────
std::optional<nlohmann::json> NiriIPC::SendEnumRequest(const std::string &enum_name,
                                                       std::chrono::milliseconds timeout) {
    if (!IsAvailable()) {
        return std::nullopt;
    }

    const std::string request = "\"" + enum_name + "\"\n";
    const bool reused = m_Socket.IsOpen();

    auto reply = Exchange(request, timeout);
    if (!reply && reused) {
        // niri may have closed the idle connection.
        reply = Exchange(request, timeout);
    }
    return reply;
}
