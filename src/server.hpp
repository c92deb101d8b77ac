#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "snapshot_reader.hpp"

// Local HTTP server for the dashboard page and its JSON API.
class Server {
  public:
    Server(const SnapshotReader &reader, std::filesystem::path root);
    ~Server();

    Server(const Server &) = delete;
    Server &operator=(const Server &) = delete;

    // port 0 binds an ephemeral port. Returns false when the port cannot be bound.
    bool Start(const std::string &host, int port);
    void Stop();
    int Port() const;

    // {"success": ..., "data": ..., "error": ...}
    static nlohmann::json Envelope(const nlohmann::json &data,
                                   const std::optional<std::string> &error = std::nullopt);
    // Invalid UTF-8 is replaced with U+FFFD instead of throwing.
    static std::string Serialize(const nlohmann::json &j);
    static std::string ContentTypeFor(const std::filesystem::path &path);

  private:
    void InitRoutes();
    void ServeFile(const std::filesystem::path &path, httplib::Response &res) const;

  private:
    const SnapshotReader &m_Reader;
    std::filesystem::path m_Root;
    httplib::Server m_Server;
    std::thread m_Thread;
    int m_Port = -1;
};
