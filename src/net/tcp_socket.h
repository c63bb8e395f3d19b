#pragma once
#include <string>

// Owns a connected POSIX stream socket. Send/receive use the timeout given at
// connect time (SO_RCVTIMEO / SO_SNDTIMEO).
class TcpSocket {
public:
    TcpSocket() = default;
    explicit TcpSocket(int fd) : fd_(fd) {}
    ~TcpSocket();

    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Resolves host and connects to the first address that accepts within
    // timeoutSeconds. Throws NetworkError.
    static TcpSocket connect(const std::string& host, int port, int timeoutSeconds);

    int fd() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    void sendAll(const std::string& data);

    // Reads until the peer closes, or maxBytes is reached.
    std::string readToEnd(size_t maxBytes = 4 * 1024 * 1024);

    void close();

private:
    int fd_ = -1;
};
