#include "unix_socket.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

// ─────────────────────────────────────
UnixSocket::~UnixSocket() {
    Close();
}

// ─────────────────────────────────────
bool UnixSocket::Connect(const std::string &path) {
    Close();

    sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        spdlog::error("Invalid unix socket path '{}'", path);
        return false;
    }
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        spdlog::error("socket() failed: {}", std::strerror(errno));
        return false;
    }

    if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        const int err = errno;
        if (err == ENOENT || err == ECONNREFUSED) {
            spdlog::debug("connect({}) failed: {}", path, std::strerror(err));
        } else {
            spdlog::warn("connect({}) failed: {}", path, std::strerror(err));
        }
        ::close(fd);
        return false;
    }

    m_Fd = fd;
    return true;
}

// ─────────────────────────────────────
void UnixSocket::Close() {
    if (m_Fd >= 0) {
        ::close(m_Fd);
        m_Fd = -1;
    }
}

// ─────────────────────────────────────
bool UnixSocket::IsOpen() const {
    return m_Fd >= 0;
}

// ─────────────────────────────────────
bool UnixSocket::SendAll(const std::string &data) {
    const char *ptr = data.data();
    std::size_t remaining = data.size();

    while (remaining > 0) {
        const ssize_t sent = ::send(m_Fd, ptr, remaining, MSG_NOSIGNAL);
        if (sent < 0 && errno == EINTR) {
            continue;
        }
        if (sent <= 0) {
            return false;
        }
        ptr += sent;
        remaining -= static_cast<std::size_t>(sent);
    }
    return true;
}

// ─────────────────────────────────────
UnixSocket::ReadStatus UnixSocket::ReadSome(std::string &out,
                                            std::chrono::steady_clock::time_point deadline) {
    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return READ_TIMEOUT;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        pollfd pfd{};
        pfd.fd = m_Fd;
        pfd.events = POLLIN;

        const int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        if (rc < 0) {
            return READ_ERROR;
        }
        if (rc == 0) {
            return READ_TIMEOUT;
        }

        // POLLIN and POLLHUP usually arrive together on the last chunk.
        if ((pfd.revents & POLLIN) == 0) {
            return (pfd.revents & POLLHUP) != 0 ? READ_CLOSED : READ_ERROR;
        }

        char buffer[8192];
        const ssize_t n = ::recv(m_Fd, buffer, sizeof(buffer), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0) {
            return READ_ERROR;
        }
        if (n == 0) {
            return READ_CLOSED;
        }
        out.append(buffer, static_cast<std::size_t>(n));
        return READ_DATA;
    }
}
