#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

// hyprctl-style client for Hyprland's request socket (.socket.sock).
// Hyprland closes the connection after each reply, so every request opens a new one.
class HyprlandIPC {
  public:
    HyprlandIPC();

    bool IsAvailable() const;

    // Example: "activewindow". Sent as "j/activewindow" for a JSON reply.
    std::optional<nlohmann::json> SendJsonRequest(
        const std::string &rq,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(500)) const;

    // The focused client object ({class, title, pid, address, ...}).
    // Falls back to `activeworkspace` + `clients` when `activewindow` is empty.
    std::optional<nlohmann::json> GetActiveWindow(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(500)) const;

  private:
    static std::filesystem::path SocketDirFor(const std::string &instance);

  private:
    std::string m_Instance;
    std::filesystem::path m_RequestSocket;
};
