#pragma once

#include <chrono>
#include <cstddef>
#include <string>

// Owning wrapper around a connected AF_UNIX stream socket.
class UnixSocket {
  public:
    enum ReadStatus { READ_DATA, READ_CLOSED, READ_TIMEOUT, READ_ERROR };

    UnixSocket() = default;
    ~UnixSocket();

    UnixSocket(const UnixSocket &) = delete;
    UnixSocket &operator=(const UnixSocket &) = delete;

    // Closes any previous connection first. ENOENT/ECONNREFUSED are logged at debug level only.
    bool Connect(const std::string &path);
    void Close();
    bool IsOpen() const;

    bool SendAll(const std::string &data);

    // Appends whatever arrives before the deadline to `out`.
    ReadStatus ReadSome(std::string &out, std::chrono::steady_clock::time_point deadline);

  private:
    int m_Fd = -1;
};
