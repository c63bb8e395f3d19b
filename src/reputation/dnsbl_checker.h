#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "dns/dns_resolver.h"
#include "reputation/reputation_types.h"

// "1.2.3.4" -> "4.3.2.1"; std::nullopt for anything that is not IPv4.
std::optional<std::string> reverseIpv4(const std::string& ip);

/**
 * First-match-wins reduction over an ordered zone list.
 *
 * `probe` is called for each zone in list order until one returns a hit;
 * zones after the first hit are never probed. The result holds at most one
 * hit. This is the DNSBL protocol contract: zones are listed strongest
 * first, and a weaker list must not add to or replace a stronger one.
 */
std::vector<DnsblHit> firstListedZone(
    const std::vector<DnsblZone>& zones,
    const std::function<std::optional<DnsblHit>(const DnsblZone&)>& probe);

class DnsblChecker {
public:
    explicit DnsblChecker(IDnsResolver& dns);

    // Zones are queried strictly in order, never concurrently.
    std::vector<DnsblHit> check(const std::string& ip, const std::vector<DnsblZone>& zones);

private:
    std::optional<DnsblHit> probeZone(const std::string& reversedIp, const DnsblZone& zone);

    IDnsResolver& dns_;
};
