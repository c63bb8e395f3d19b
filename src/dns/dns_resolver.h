#pragma once
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "dns_packet.h"

struct MxRecord {
    uint16_t preference = 0;
    std::string host;
};

// Lookups return an empty list for NXDOMAIN and NOERROR/no-data and throw
// DnsError for timeouts, SERVFAIL/REFUSED and malformed replies.
class IDnsResolver {
public:
    virtual ~IDnsResolver() = default;

    virtual std::vector<std::string> lookupA(const std::string& name) = 0;
    virtual std::vector<std::string> lookupAAAA(const std::string& name) = 0;
    virtual std::vector<std::string> lookupTxt(const std::string& name) = 0;
    virtual std::vector<MxRecord> lookupMx(const std::string& name) = 0;
};

/**
 * Stub resolver: one recursive nameserver, UDP with a receive timeout, TCP
 * retry when the answer comes back truncated. Safe to share between threads;
 * every query uses its own socket.
 */
class DnsResolver : public IDnsResolver {
public:
    DnsResolver(std::string server, int timeoutSeconds);

    std::vector<std::string> lookupA(const std::string& name) override;
    std::vector<std::string> lookupAAAA(const std::string& name) override;
    std::vector<std::string> lookupTxt(const std::string& name) override;
    std::vector<MxRecord> lookupMx(const std::string& name) override;

    const std::string& server() const { return server_; }

    // First IPv4 "nameserver" line of /etc/resolv.conf, or 8.8.8.8.
    static std::string systemNameserver(const std::string& resolvConf = "/etc/resolv.conf");

private:
    std::vector<DnsAnswer> query(const std::string& name, DnsRecordType type);
    DnsPacket exchangeUdp(const std::vector<uint8_t>& q, uint16_t id);
    DnsPacket exchangeTcp(const std::vector<uint8_t>& q, uint16_t id);
    uint16_t nextId();

    std::string server_;
    int timeoutSeconds_;
    std::mutex rngMutex_;
    std::mt19937 rng_;
};
