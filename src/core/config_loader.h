#pragma once

#include <string>
#include <vector>

#include "reputation/reputation_types.h"
#include "risk/scoring_config.h"

struct DiagConfig {
    // Network
    int timeoutSeconds = 6;
    std::string dnsServer;          // empty: /etc/resolv.conf, then 8.8.8.8
    std::string userAgent = "EmailDiag/1.1";
    std::string whoisBootstrap = "whois.iana.org";
    int tlsPort = 443;
    bool concurrentProbes = false;

    // Geolocation
    std::string geoEndpoint = "http://ip-api.com/json/";

    // Reputation
    bool dnsblEnabled = true;
    // Priority order: the first zone that lists the IP is the only one reported
    std::vector<DnsblZone> dnsblZones = {
        {"zen.spamhaus.org", 60},
        {"bl.spamcop.net", 40},
    };

    bool abuseIpDbEnabled = true;
    std::string abuseIpDbEndpoint = "https://api.abuseipdb.com/api/v2/check";
    int abuseIpDbMaxAgeDays = 365;
    std::string abuseIpDbKey;

    bool ipqsEnabled = true;
    std::string ipqsEndpoint = "https://ipqualityscore.com/api/json/ip/";
    int ipqsStrictness = 1;
    std::string ipqsKey;

    ScoringConfig scoring;

    // Logging
    std::string logFile;            // empty: stderr
    std::string logLevel = "warn";
};

class ConfigLoader {
public:
    static DiagConfig loadFromFile(const std::string& path);
    static DiagConfig loadFromString(const std::string& yaml);
    static void validateConfig(const DiagConfig& cfg);
};
