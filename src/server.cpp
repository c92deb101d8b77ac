#include "server.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>

// ─────────────────────────────────────
Server::Server(const SnapshotReader &reader, std::filesystem::path root)
    : m_Reader(reader), m_Root(std::move(root)) {
    InitRoutes();
}

// ─────────────────────────────────────
Server::~Server() {
    Stop();
}

// ─────────────────────────────────────
nlohmann::json Server::Envelope(const nlohmann::json &data,
                                const std::optional<std::string> &error) {
    nlohmann::json j;
    j["success"] = !error.has_value();
    j["data"] = error ? nlohmann::json(nullptr) : data;
    j["error"] = error ? nlohmann::json(*error) : nlohmann::json(nullptr);
    return j;
}

// ─────────────────────────────────────
std::string Server::Serialize(const nlohmann::json &j) {
    // Window titles and /proc names are not guaranteed to be UTF-8.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ─────────────────────────────────────
std::string Server::ContentTypeFor(const std::filesystem::path &path) {
    const auto ext = path.extension().string();
    if (ext == ".js") {
        return "application/javascript";
    } else if (ext == ".css") {
        return "text/css";
    } else if (ext == ".svg") {
        return "image/svg+xml";
    } else if (ext == ".html") {
        return "text/html";
    } else if (ext == ".png") {
        return "image/png";
    } else if (ext == ".ico") {
        return "image/x-icon";
    }
    return "application/octet-stream";
}

// ─────────────────────────────────────
void Server::ServeFile(const std::filesystem::path &path, httplib::Response &res) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        res.status = 404;
        res.set_content(Serialize(Envelope(nullptr, path.filename().string() + " not found")),
                        "application/json");
        return;
    }
    std::string body((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    res.set_content(body, ContentTypeFor(path));
}

// ─────────────────────────────────────
void Server::InitRoutes() {
    m_Server.set_keep_alive_max_count(4);
    m_Server.set_keep_alive_timeout(2);
    m_Server.set_payload_max_length(64 * 1024);
    m_Server.set_read_timeout(5, 0);
    m_Server.set_write_timeout(5, 0);

    // static files
    {
        auto index = [this](const httplib::Request &, httplib::Response &res) {
            ServeFile(m_Root / "index.html", res);
        };
        m_Server.Get("/", index);
        m_Server.Get("/index.html", index);

        m_Server.Get(R"(/static/(.+))", [this](const httplib::Request &req, httplib::Response &res) {
            const std::string rel = req.matches[1];
            if (rel.find("..") != std::string::npos || rel.find('\\') != std::string::npos) {
                res.status = 400;
                res.set_content(Serialize(Envelope(nullptr, "invalid path")), "application/json");
                return;
            }
            ServeFile(m_Root / "static" / rel, res);
        });
    }

    // API
    {
        m_Server.Get("/api/dashboard", [this](const httplib::Request &, httplib::Response &res) {
            try {
                const nlohmann::json data = m_Reader.Read().ToJson();
                res.status = 200;
                res.set_content(Serialize(Envelope(data)), "application/json");
            } catch (const std::exception &e) {
                spdlog::error("/api/dashboard failed: {}", e.what());
                res.status = 500;
                res.set_content(Serialize(Envelope(nullptr, std::string(e.what()))),
                                "application/json");
            }
        });

        m_Server.Get("/api/health", [](const httplib::Request &, httplib::Response &res) {
            res.status = 200;
            res.set_content(Serialize(Envelope({{"status", "healthy"}})), "application/json");
        });
    }

    m_Server.set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }
        spdlog::debug("HTTP {} for {}", res.status, req.path);
        res.set_content(Serialize(Envelope(nullptr, "HTTP " + std::to_string(res.status))),
                        "application/json");
    });
}

// ─────────────────────────────────────
bool Server::Start(const std::string &host, int port) {
    if (port == 0) {
        m_Port = m_Server.bind_to_any_port(host);
    } else if (m_Server.bind_to_port(host, port)) {
        m_Port = port;
    } else {
        m_Port = -1;
    }

    if (m_Port <= 0) {
        spdlog::error("Unable to bind {}:{}", host, port);
        return false;
    }

    m_Thread = std::thread([this] {
        if (!m_Server.listen_after_bind()) {
            spdlog::error("Dashboard server stopped unexpectedly");
        }
    });
    spdlog::info("Serving on: http://{}:{}", host, m_Port);
    return true;
}

// ─────────────────────────────────────
void Server::Stop() {
    if (m_Thread.joinable()) {
        m_Server.stop();
        m_Thread.join();
        spdlog::debug("Dashboard server stopped");
    }
}

// ─────────────────────────────────────
int Server::Port() const {
    return m_Port;
}
