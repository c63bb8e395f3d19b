#pragma once
#include <cstdint>

enum class DnsRecordType : uint16_t {
    A     = 1,
    PTR   = 12,
    MX    = 15,
    TXT   = 16,
    AAAA  = 28
};

enum class DnsResponseCode {
    NoError,
    NxDomain,
    ServFail,
    Refused,
    Other
};

inline DnsResponseCode dnsResponseCodeFromWire(uint16_t rcode) {
    switch (rcode) {
        case 0: return DnsResponseCode::NoError;
        case 2: return DnsResponseCode::ServFail;
        case 3: return DnsResponseCode::NxDomain;
        case 5: return DnsResponseCode::Refused;
        default: return DnsResponseCode::Other;
    }
}
