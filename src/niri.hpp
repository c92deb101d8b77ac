#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>

#include "unix_socket.hpp"

// Request/response client for the niri IPC socket ($NIRI_SOCKET).
// The connection is kept open between ticks.
class NiriIPC {
  public:
    NiriIPC();

    NiriIPC(const NiriIPC &) = delete;
    NiriIPC &operator=(const NiriIPC &) = delete;

    bool IsAvailable() const;

    // Sends a serde-enum style request like "\"FocusedWindow\"\n" and parses one JSON line.
    // A stale connection is reopened once before giving up.
    std::optional<nlohmann::json> SendEnumRequest(const std::string &enum_name,
                                                  std::chrono::milliseconds timeout =
                                                      std::chrono::milliseconds(500));

  private:
    std::optional<std::string> ReadLine(std::chrono::milliseconds timeout);
    std::optional<nlohmann::json> Exchange(const std::string &request,
                                           std::chrono::milliseconds timeout);
    void Reset();

  private:
    std::string m_SocketPath;
    UnixSocket m_Socket;
    std::string m_Pending;
};
