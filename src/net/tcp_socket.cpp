#include "net/tcp_socket.h"
#include "core/errors.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void TcpSocket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

static void setIoTimeout(int fd, int timeoutSeconds) {
    timeval tv{};
    tv.tv_sec = timeoutSeconds;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

// Non-blocking connect bounded by poll(), then back to blocking mode.
static bool connectWithTimeout(int fd, const sockaddr* addr, socklen_t len,
                               int timeoutSeconds, std::string& err) {
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(fd, addr, len);
    if (rc != 0 && errno != EINPROGRESS) {
        err = std::strerror(errno);
        return false;
    }

    if (rc != 0) {
        pollfd pfd{fd, POLLOUT, 0};
        rc = poll(&pfd, 1, timeoutSeconds * 1000);
        if (rc == 0) {
            err = "connect timed out";
            return false;
        }
        if (rc < 0) {
            err = std::strerror(errno);
            return false;
        }
        int soErr = 0;
        socklen_t soLen = sizeof(soErr);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, &soErr, &soLen);
        if (soErr != 0) {
            err = std::strerror(soErr);
            return false;
        }
    }

    fcntl(fd, F_SETFL, flags);
    return true;
}

TcpSocket TcpSocket::connect(const std::string& host, int port, int timeoutSeconds) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* addrInfo = nullptr;
    int res = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &addrInfo);
    if (res != 0 || !addrInfo)
        throw NetworkError("DNS resolution failed for " + host + ": " + gai_strerror(res));

    std::string lastErr = "no usable address";
    for (addrinfo* ai = addrInfo; ai; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            lastErr = std::strerror(errno);
            continue;
        }
        TcpSocket sock(fd);
        if (connectWithTimeout(fd, ai->ai_addr, ai->ai_addrlen, timeoutSeconds, lastErr)) {
            freeaddrinfo(addrInfo);
            setIoTimeout(fd, timeoutSeconds);
            return sock;
        }
    }

    freeaddrinfo(addrInfo);
    throw NetworkError("Connection failed to " + host + ":" + std::to_string(port) + ": " + lastErr);
}

void TcpSocket::sendAll(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw NetworkError(std::string("send failed: ") + std::strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }
}

std::string TcpSocket::readToEnd(size_t maxBytes) {
    std::string out;
    char buffer[4096];
    while (out.size() < maxBytes) {
        ssize_t n = ::recv(fd_, buffer, sizeof(buffer), 0);
        if (n == 0)
            break;
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                throw NetworkError("read timed out");
            throw NetworkError(std::string("recv failed: ") + std::strerror(errno));
        }
        out.append(buffer, static_cast<size_t>(n));
    }
    return out;
}
