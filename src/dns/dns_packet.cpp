#include "dns_packet.h"
#include "core/errors.h"

#include <arpa/inet.h>
#include <cstdio>

static void need(size_t off, size_t count, size_t len) {
    if (off + count > len)
        throw DnsError("truncated DNS packet");
}

static uint16_t read16(const uint8_t* buf, size_t& off, size_t len) {
    need(off, 2, len);
    uint16_t v = (buf[off] << 8) | buf[off + 1];
    off += 2;
    return v;
}

static uint32_t read32(const uint8_t* buf, size_t& off, size_t len) {
    need(off, 4, len);
    uint32_t v = (uint32_t(buf[off]) << 24) | (buf[off + 1] << 16)
               | (buf[off + 2] << 8) | buf[off + 3];
    off += 4;
    return v;
}

// Compression pointers are followed with a hop limit so a looping packet
// cannot recurse forever.
static std::string readName(const uint8_t* buf, size_t& off, size_t max, int depth = 0) {
    if (depth > 16)
        throw DnsError("DNS name compression loop");

    std::string name;
    while (true) {
        need(off, 1, max);
        uint8_t len = buf[off++];
        if (len == 0) break;
        if ((len & 0xC0) == 0xC0) {
            need(off, 1, max);
            size_t ptr = ((len & 0x3F) << 8) | buf[off++];
            if (ptr >= max)
                throw DnsError("DNS compression pointer out of range");
            size_t tmp = ptr;
            std::string tail = readName(buf, tmp, max, depth + 1);
            if (!name.empty() && !tail.empty()) name += '.';
            return name + tail;
        }
        need(off, len, max);
        if (!name.empty()) name += '.';
        name.append(reinterpret_cast<const char*>(buf + off), len);
        off += len;
    }
    return name;
}

std::vector<uint8_t> buildDnsQuery(uint16_t id, const std::string& name, uint16_t type) {
    std::vector<uint8_t> q(12);
    q[0] = id >> 8;
    q[1] = id & 0xff;
    q[2] = 0x01; q[3] = 0x00;   // RD

    q[5] = 0x01;                // QDCOUNT

    size_t start = 0;
    while (start <= name.size()) {
        size_t dot = name.find('.', start);
        if (dot == std::string::npos) dot = name.size();
        size_t len = dot - start;
        if (len > 63)
            throw DnsError("DNS label too long in " + name);
        if (len > 0) {
            q.push_back(static_cast<uint8_t>(len));
            q.insert(q.end(), name.begin() + start, name.begin() + dot);
        }
        start = dot + 1;
    }
    q.push_back(0);

    q.push_back(type >> 8);
    q.push_back(type & 0xff);
    q.push_back(0); q.push_back(1);   // IN

    return q;
}

DnsPacket parseDnsResponse(const uint8_t* buf, size_t len) {
    DnsPacket pkt{};
    size_t off = 0;

    pkt.id = read16(buf, off, len);
    uint16_t flags = read16(buf, off, len);
    pkt.truncated = (flags & 0x0200) != 0;
    pkt.rcode = dnsResponseCodeFromWire(flags & 0x000F);

    uint16_t qd = read16(buf, off, len);
    uint16_t an = read16(buf, off, len);
    read16(buf, off, len); // NS
    read16(buf, off, len); // AR

    for (int i = 0; i < qd; i++) {
        readName(buf, off, len);
        need(off, 4, len);
        off += 4;
    }

    for (int i = 0; i < an; i++) {
        DnsAnswer a;
        a.name = readName(buf, off, len);
        a.type = static_cast<DnsRecordType>(read16(buf, off, len));
        off += 2; // class
        a.ttl = read32(buf, off, len);
        uint16_t rdlen = read16(buf, off, len);
        need(off, rdlen, len);

        if (a.type == DnsRecordType::A && rdlen == 4) {
            char ip[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, buf + off, ip, sizeof(ip));
            a.data = ip;
        } else if (a.type == DnsRecordType::AAAA && rdlen == 16) {
            char ip[INET6_ADDRSTRLEN];
            inet_ntop(AF_INET6, buf + off, ip, sizeof(ip));
            a.data = ip;
        } else if (a.type == DnsRecordType::TXT) {
            // one or more <len><bytes> character-strings
            size_t p = off, end = off + rdlen;
            while (p < end) {
                uint8_t sl = buf[p++];
                if (p + sl > end)
                    throw DnsError("malformed TXT record");
                a.data.append(reinterpret_cast<const char*>(buf + p), sl);
                p += sl;
            }
        } else if (a.type == DnsRecordType::MX && rdlen >= 3) {
            size_t p = off;
            a.preference = read16(buf, p, len);
            a.data = readName(buf, p, len);
        }
        off += rdlen;
        pkt.answers.push_back(a);
    }

    return pkt;
}
