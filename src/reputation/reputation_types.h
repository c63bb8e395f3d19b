#pragma once
#include <optional>
#include <string>
#include <vector>

#include "core/probe_result.h"

struct DnsblZone {
    std::string zone;
    double weight = 0.0;
};

struct DnsblHit {
    std::string zone;
    double weight = 0.0;
    std::vector<std::string> txt;
};

struct AbuseIpDbReport {
    std::optional<double> confidenceScore;   // 0-100
    std::optional<long long> totalReports;
};

struct IpqsReport {
    std::optional<double> fraudScore;        // 0-100
    std::optional<bool> proxy;
    std::optional<bool> vpn;
    std::optional<bool> tor;
    std::optional<bool> recentAbuse;
};

// Reputation of the first resolved IP. `checked` is false when the domain had
// no A record; disabled providers stay std::nullopt and are left out of the
// report.
struct ReputationBundle {
    bool checked = false;
    std::optional<std::vector<DnsblHit>> dnsblHits;
    std::optional<ProbeResult<AbuseIpDbReport>> abuseIpDb;
    std::optional<ProbeResult<IpqsReport>> ipqs;
};
