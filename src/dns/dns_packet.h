#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include "dns_types.h"

struct DnsAnswer {
    std::string name;
    DnsRecordType type;
    uint32_t ttl = 0;
    std::string data;         // A/AAAA: address text, TXT: joined strings, MX: exchange
    uint16_t preference = 0;  // MX only
};

struct DnsPacket {
    uint16_t id = 0;
    bool truncated = false;
    DnsResponseCode rcode = DnsResponseCode::NoError;
    std::vector<DnsAnswer> answers;
};

std::vector<uint8_t> buildDnsQuery(uint16_t id, const std::string& name, uint16_t type);

// Throws DnsError on a malformed or truncated buffer.
DnsPacket parseDnsResponse(const uint8_t* buf, size_t len);
