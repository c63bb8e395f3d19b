#include "dns_resolver.h"
#include "dns_types.h"
#include "core/errors.h"
#include "core/logger.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <netinet/in.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

static const char* DEFAULT_DNS_SERVER = "8.8.8.8";
static const int DNS_PORT = 53;

/* ===================== Socket helpers ===================== */

namespace {
struct FdGuard {
    int fd;
    explicit FdGuard(int f) : fd(f) {}
    ~FdGuard() { if (fd >= 0) ::close(fd); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
};
}

static sockaddr_in serverAddr(const std::string& server) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(DNS_PORT);
    if (inet_pton(AF_INET, server.c_str(), &addr.sin_addr) != 1)
        throw DnsError("invalid DNS server address: " + server);
    return addr;
}

static void applyTimeout(int fd, int seconds) {
    timeval tv{};
    tv.tv_sec = seconds;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

static std::string ioError(const char* op) {
    if (errno == EAGAIN || errno == EWOULDBLOCK)
        return std::string("DNS ") + op + " timed out";
    return std::string("DNS ") + op + " failed: " + std::strerror(errno);
}

/* ===================== Resolver ===================== */

DnsResolver::DnsResolver(std::string server, int timeoutSeconds)
    : server_(std::move(server))
    , timeoutSeconds_(timeoutSeconds)
    , rng_(std::random_device{}()) {}

std::string DnsResolver::systemNameserver(const std::string& resolvConf) {
    std::ifstream in(resolvConf);
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream ls(line);
        std::string key, value;
        ls >> key >> value;
        if (key != "nameserver") continue;
        in_addr probe{};
        if (inet_pton(AF_INET, value.c_str(), &probe) == 1)
            return value;
    }
    return DEFAULT_DNS_SERVER;
}

uint16_t DnsResolver::nextId() {
    std::lock_guard<std::mutex> lock(rngMutex_);
    return static_cast<uint16_t>(rng_() & 0xffff);
}

DnsPacket DnsResolver::exchangeUdp(const std::vector<uint8_t>& q, uint16_t id) {
    FdGuard s(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP));
    if (s.fd < 0)
        throw DnsError(ioError("socket"));
    applyTimeout(s.fd, timeoutSeconds_);

    sockaddr_in addr = serverAddr(server_);
    if (sendto(s.fd, q.data(), q.size(), 0,
               reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0)
        throw DnsError(ioError("send"));

    uint8_t buf[4096];
    // Ignore stray datagrams that do not answer our query id
    for (int attempt = 0; attempt < 4; ++attempt) {
        ssize_t len = recv(s.fd, buf, sizeof(buf), 0);
        if (len < 0)
            throw DnsError(ioError("receive"));
        auto pkt = parseDnsResponse(buf, static_cast<size_t>(len));
        if (pkt.id == id)
            return pkt;
    }
    throw DnsError("DNS reply id mismatch");
}

DnsPacket DnsResolver::exchangeTcp(const std::vector<uint8_t>& q, uint16_t id) {
    FdGuard s(::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP));
    if (s.fd < 0)
        throw DnsError(ioError("socket"));
    applyTimeout(s.fd, timeoutSeconds_);

    sockaddr_in addr = serverAddr(server_);
    if (::connect(s.fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0)
        throw DnsError(ioError("connect"));

    std::vector<uint8_t> framed;
    framed.push_back(static_cast<uint8_t>(q.size() >> 8));
    framed.push_back(static_cast<uint8_t>(q.size() & 0xff));
    framed.insert(framed.end(), q.begin(), q.end());
    if (::send(s.fd, framed.data(), framed.size(), MSG_NOSIGNAL) != static_cast<ssize_t>(framed.size()))
        throw DnsError(ioError("send"));

    auto readExact = [&](uint8_t* out, size_t n) {
        size_t got = 0;
        while (got < n) {
            ssize_t r = recv(s.fd, out + got, n - got, 0);
            if (r == 0)
                throw DnsError("DNS TCP connection closed early");
            if (r < 0) {
                if (errno == EINTR) continue;
                throw DnsError(ioError("receive"));
            }
            got += static_cast<size_t>(r);
        }
    };

    uint8_t lenBuf[2];
    readExact(lenBuf, 2);
    size_t msgLen = (lenBuf[0] << 8) | lenBuf[1];
    std::vector<uint8_t> msg(msgLen);
    readExact(msg.data(), msgLen);

    auto pkt = parseDnsResponse(msg.data(), msg.size());
    if (pkt.id != id)
        throw DnsError("DNS reply id mismatch");
    return pkt;
}

std::vector<DnsAnswer> DnsResolver::query(const std::string& name, DnsRecordType type) {
    uint16_t id = nextId();
    auto q = buildDnsQuery(id, name, static_cast<uint16_t>(type));

    DnsPacket pkt = exchangeUdp(q, id);
    if (pkt.truncated) {
        Logger::instance().log(LogLevel::Debug, "DNS: truncated answer for " + name + ", retrying over TCP");
        pkt = exchangeTcp(q, id);
    }

    switch (pkt.rcode) {
        case DnsResponseCode::NoError:
        case DnsResponseCode::NxDomain:
            break;
        case DnsResponseCode::ServFail:
            throw DnsError("SERVFAIL for " + name);
        case DnsResponseCode::Refused:
            throw DnsError("REFUSED for " + name);
        default:
            throw DnsError("DNS error response for " + name);
    }

    std::vector<DnsAnswer> out;
    for (auto& a : pkt.answers)
        if (a.type == type)
            out.push_back(a);
    return out;
}

std::vector<std::string> DnsResolver::lookupA(const std::string& n) {
    std::vector<std::string> out;
    for (auto& a : query(n, DnsRecordType::A)) out.push_back(a.data);
    return out;
}

std::vector<std::string> DnsResolver::lookupAAAA(const std::string& n) {
    std::vector<std::string> out;
    for (auto& a : query(n, DnsRecordType::AAAA)) out.push_back(a.data);
    return out;
}

std::vector<std::string> DnsResolver::lookupTxt(const std::string& n) {
    std::vector<std::string> out;
    for (auto& a : query(n, DnsRecordType::TXT)) out.push_back(a.data);
    return out;
}

std::vector<MxRecord> DnsResolver::lookupMx(const std::string& n) {
    std::vector<MxRecord> out;
    for (auto& a : query(n, DnsRecordType::MX)) out.push_back({a.preference, a.data});
    return out;
}
