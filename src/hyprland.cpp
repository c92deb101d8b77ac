#include "hyprland.hpp"

#include "unix_socket.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>

// ─────────────────────────────────────
static bool HasNonEmptyString(const nlohmann::json &j, const char *key) {
    return j.contains(key) && j[key].is_string() && !j[key].get<std::string>().empty();
}

// ─────────────────────────────────────
HyprlandIPC::HyprlandIPC() {
    if (const char *env = std::getenv("HYPRLAND_INSTANCE_SIGNATURE"); env != nullptr && *env) {
        m_Instance = env;
        m_RequestSocket = SocketDirFor(m_Instance) / ".socket.sock";
    }
}

// ─────────────────────────────────────
std::filesystem::path HyprlandIPC::SocketDirFor(const std::string &instance) {
    std::error_code ec;
    if (const char *runtime = std::getenv("XDG_RUNTIME_DIR"); runtime != nullptr && *runtime) {
        const std::filesystem::path dir = std::filesystem::path(runtime) / "hypr";
        if (std::filesystem::exists(dir, ec)) {
            return dir / instance;
        }
    }
    // Hyprland < 0.40 kept its sockets under /tmp.
    spdlog::debug("$XDG_RUNTIME_DIR/hypr missing, using /tmp/hypr");
    return std::filesystem::path("/tmp/hypr") / instance;
}

// ─────────────────────────────────────
bool HyprlandIPC::IsAvailable() const {
    std::error_code ec;
    return !m_RequestSocket.empty() && std::filesystem::exists(m_RequestSocket, ec);
}

// ─────────────────────────────────────
std::optional<nlohmann::json>
HyprlandIPC::SendJsonRequest(const std::string &rq, std::chrono::milliseconds timeout) const {
    if (m_RequestSocket.empty()) {
        return std::nullopt;
    }

    UnixSocket socket;
    if (!socket.Connect(m_RequestSocket.string())) {
        return std::nullopt;
    }
    if (!socket.SendAll("j/" + rq)) {
        spdlog::debug("Hyprland IPC: send '{}' failed", rq);
        return std::nullopt;
    }

    // The reply ends when Hyprland closes its side.
    std::string reply;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    UnixSocket::ReadStatus status;
    while ((status = socket.ReadSome(reply, deadline)) == UnixSocket::READ_DATA) {
    }
    if (status == UnixSocket::READ_TIMEOUT) {
        spdlog::debug("Hyprland IPC: '{}' timed out after {} bytes", rq, reply.size());
    }
    if (reply.empty()) {
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(reply);
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::debug("Hyprland IPC: bad JSON for '{}': {}", rq, e.what());
        return std::nullopt;
    }
}

// ─────────────────────────────────────
std::optional<nlohmann::json>
HyprlandIPC::GetActiveWindow(std::chrono::milliseconds timeout) const {
    if (auto active = SendJsonRequest("activewindow", timeout);
        active && active->is_object() &&
        (HasNonEmptyString(*active, "class") || HasNonEmptyString(*active, "title"))) {
        return active;
    }

    const auto workspace = SendJsonRequest("activeworkspace", timeout);
    if (!workspace || !workspace->is_object() || !HasNonEmptyString(*workspace, "lastwindow")) {
        return std::nullopt;
    }
    const std::string address = (*workspace)["lastwindow"].get<std::string>();

    const auto clients = SendJsonRequest("clients", timeout);
    if (!clients || !clients->is_array()) {
        return std::nullopt;
    }
    for (const auto &client : *clients) {
        if (client.is_object() && HasNonEmptyString(client, "address") &&
            client["address"].get<std::string>() == address) {
            return client;
        }
    }
    return std::nullopt;
}
