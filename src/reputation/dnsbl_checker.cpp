#include "reputation/dnsbl_checker.h"
#include "core/errors.h"
#include "core/input_validator.h"
#include "core/logger.h"
#include "monitoring/metrics.h"

#include <sstream>

std::optional<std::string> reverseIpv4(const std::string& ip) {
    if (!InputValidator::isIpv4Address(ip))
        return std::nullopt;

    std::vector<std::string> octets;
    std::stringstream ss(ip);
    std::string tok;
    while (std::getline(ss, tok, '.'))
        octets.push_back(tok);
    if (octets.size() != 4)
        return std::nullopt;

    return octets[3] + "." + octets[2] + "." + octets[1] + "." + octets[0];
}

std::vector<DnsblHit> firstListedZone(
    const std::vector<DnsblZone>& zones,
    const std::function<std::optional<DnsblHit>(const DnsblZone&)>& probe) {
    for (const auto& zone : zones) {
        if (auto hit = probe(zone))
            return {*hit};
    }
    return {};
}

DnsblChecker::DnsblChecker(IDnsResolver& dns) : dns_(dns) {}

std::optional<DnsblHit> DnsblChecker::probeZone(const std::string& reversedIp,
                                                const DnsblZone& zone) {
    const std::string qname = reversedIp + "." + zone.zone;
    Metrics::instance().inc("probe_dnsbl_total");

    std::vector<std::string> answers;
    try {
        answers = dns_.lookupA(qname);
    } catch (const DnsError& ex) {
        // An unreachable list is treated as "not listed there"
        Metrics::instance().inc("probe_dnsbl_errors_total");
        Logger::instance().log(LogLevel::Warn,
            "DNSBL: " + zone.zone + " lookup failed: " + ex.what());
        return std::nullopt;
    }
    if (answers.empty())
        return std::nullopt;

    DnsblHit hit{zone.zone, zone.weight, {}};
    try {
        hit.txt = dns_.lookupTxt(qname);
    } catch (const DnsError& ex) {
        Logger::instance().log(LogLevel::Debug,
            "DNSBL: TXT detail for " + qname + " unavailable: " + ex.what());
    }

    Logger::instance().log(LogLevel::Info, "DNSBL: listed in " + zone.zone);
    return hit;
}

std::vector<DnsblHit> DnsblChecker::check(const std::string& ip,
                                          const std::vector<DnsblZone>& zones) {
    auto reversed = reverseIpv4(ip);
    if (!reversed)
        return {};

    return firstListedZone(zones, [&](const DnsblZone& zone) {
        return probeZone(*reversed, zone);
    });
}
