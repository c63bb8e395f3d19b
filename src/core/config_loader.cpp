#include "core/config_loader.h"
#include "core/errors.h"
#include "core/logger.h"

#include <yaml-cpp/yaml.h>
#include <arpa/inet.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

/* ===================== Section readers ===================== */

static std::string toCountryCode(std::string cc) {
    std::transform(cc.begin(), cc.end(), cc.begin(),
        [](unsigned char c) { return std::toupper(c); });
    return cc;
}

static std::set<std::string> readCountrySet(const YAML::Node& n) {
    std::set<std::string> out;
    for (const auto& item : n)
        out.insert(toCountryCode(item.as<std::string>()));
    return out;
}

static void readScoring(const YAML::Node& s, ScoringConfig& sc) {
    if (s["missing_creation_date"]) sc.missingCreationDate = s["missing_creation_date"].as<double>();
    if (s["age_under_7_days"])      sc.ageUnder7Days   = s["age_under_7_days"].as<double>();
    if (s["age_under_90_days"])     sc.ageUnder90Days  = s["age_under_90_days"].as<double>();
    if (s["age_under_180_days"])    sc.ageUnder180Days = s["age_under_180_days"].as<double>();
    if (s["age_under_365_days"])    sc.ageUnder365Days = s["age_under_365_days"].as<double>();
    if (s["age_over_year"])         sc.ageOverYear     = s["age_over_year"].as<double>();

    if (s["tls_invalid"])           sc.tlsInvalid        = s["tls_invalid"].as<double>();
    if (s["tls_valid_non_free_ca"]) sc.tlsValidNonFreeCa = s["tls_valid_non_free_ca"].as<double>();
    if (s["self_signed"])           sc.selfSigned        = s["self_signed"].as<double>();
    if (s["free_ca_base"])          sc.freeCaBase        = s["free_ca_base"].as<double>();
    if (s["free_ca_young_bonus"])   sc.freeCaYoungBonus  = s["free_ca_young_bonus"].as<double>();
    if (s["free_ca_young_days"])    sc.freeCaYoungDays   = s["free_ca_young_days"].as<int>();
    if (s["free_ca_marker"])        sc.freeCaMarker      = s["free_ca_marker"].as<std::string>();

    if (s["home_country"])       sc.homeCountry      = toCountryCode(s["home_country"].as<std::string>());
    if (s["geo_high"])           sc.geoHigh          = readCountrySet(s["geo_high"]);
    if (s["geo_medium"])         sc.geoMedium        = readCountrySet(s["geo_medium"]);
    if (s["geo_high_impact"])    sc.geoHighImpact    = s["geo_high_impact"].as<double>();
    if (s["geo_medium_impact"])  sc.geoMediumImpact  = s["geo_medium_impact"].as<double>();
    if (s["geo_unknown_impact"]) sc.geoUnknownImpact = s["geo_unknown_impact"].as<double>();
    if (s["non_home_elevate"])   sc.nonHomeElevateToMedium = s["non_home_elevate"].as<bool>();
    if (s["non_home_nudge"])     sc.nonHomeNudge     = s["non_home_nudge"].as<double>();

    if (s["abuseipdb_multiplier"]) sc.abuseIpDbMultiplier = s["abuseipdb_multiplier"].as<double>();
    if (s["abuseipdb_cap"])        sc.abuseIpDbCap        = s["abuseipdb_cap"].as<double>();
    if (s["ipqs_multiplier"])      sc.ipqsMultiplier      = s["ipqs_multiplier"].as<double>();
    if (s["ipqs_cap"])             sc.ipqsCap             = s["ipqs_cap"].as<double>();

    if (auto t = s["thresholds"]) {
        if (t["medium"])   sc.mediumThreshold   = t["medium"].as<int>();
        if (t["high"])     sc.highThreshold     = t["high"].as<int>();
        if (t["critical"]) sc.criticalThreshold = t["critical"].as<int>();
    }
}

static DiagConfig fromNode(const YAML::Node& root) {
    DiagConfig cfg;

    if (auto n = root["network"]) {
        if (n["timeout_seconds"])   cfg.timeoutSeconds   = n["timeout_seconds"].as<int>();
        if (n["dns_server"])        cfg.dnsServer        = n["dns_server"].as<std::string>();
        if (n["user_agent"])        cfg.userAgent        = n["user_agent"].as<std::string>();
        if (n["whois_bootstrap"])   cfg.whoisBootstrap   = n["whois_bootstrap"].as<std::string>();
        if (n["tls_port"])          cfg.tlsPort          = n["tls_port"].as<int>();
        if (n["concurrent_probes"]) cfg.concurrentProbes = n["concurrent_probes"].as<bool>();
    }

    if (auto g = root["geolocation"]) {
        if (g["endpoint"]) cfg.geoEndpoint = g["endpoint"].as<std::string>();
    }

    if (auto r = root["reputation"]) {
        if (auto d = r["dnsbl"]) {
            if (d["enabled"]) cfg.dnsblEnabled = d["enabled"].as<bool>();
            if (d["zones"]) {
                cfg.dnsblZones.clear();
                for (const auto& z : d["zones"]) {
                    DnsblZone zone;
                    zone.zone = z["zone"].as<std::string>();
                    zone.weight = z["weight"].as<double>();
                    cfg.dnsblZones.push_back(zone);
                }
            }
        }
        if (auto a = r["abuseipdb"]) {
            if (a["enabled"])      cfg.abuseIpDbEnabled    = a["enabled"].as<bool>();
            if (a["endpoint"])     cfg.abuseIpDbEndpoint   = a["endpoint"].as<std::string>();
            if (a["max_age_days"]) cfg.abuseIpDbMaxAgeDays = a["max_age_days"].as<int>();
            if (a["api_key"])      cfg.abuseIpDbKey        = a["api_key"].as<std::string>();
        }
        if (auto q = r["ipqs"]) {
            if (q["enabled"])    cfg.ipqsEnabled    = q["enabled"].as<bool>();
            if (q["endpoint"])   cfg.ipqsEndpoint   = q["endpoint"].as<std::string>();
            if (q["strictness"]) cfg.ipqsStrictness = q["strictness"].as<int>();
            if (q["api_key"])    cfg.ipqsKey        = q["api_key"].as<std::string>();
        }
    }

    if (auto s = root["scoring"])
        readScoring(s, cfg.scoring);

    if (auto l = root["logging"]) {
        if (l["file"])  cfg.logFile  = l["file"].as<std::string>();
        if (l["level"]) cfg.logLevel = l["level"].as<std::string>();
    }

    return cfg;
}

/* ===================== Loading ===================== */

DiagConfig ConfigLoader::loadFromFile(const std::string& path) {
    DiagConfig cfg;

    try {
        cfg = fromNode(YAML::LoadFile(path));
    } catch (const YAML::Exception& ex) {
        Logger::instance().log(
            LogLevel::Error,
            std::string("Failed to load config: ") + ex.what());
        throw ConfigError("Failed to load config " + path + ": " + ex.what());
    }

    validateConfig(cfg);
    return cfg;
}

DiagConfig ConfigLoader::loadFromString(const std::string& yaml) {
    DiagConfig cfg;

    try {
        YAML::Node root = YAML::Load(yaml);
        if (root.IsDefined() && !root.IsNull())
            cfg = fromNode(root);
    } catch (const YAML::Exception& ex) {
        throw ConfigError(std::string("Failed to parse config: ") + ex.what());
    }

    validateConfig(cfg);
    return cfg;
}

void ConfigLoader::validateConfig(const DiagConfig& cfg) {
    std::vector<std::string> errors;

    // Network
    if (cfg.timeoutSeconds < 1 || cfg.timeoutSeconds > 60) {
        errors.push_back("network.timeout_seconds must be between 1-60");
    }
    if (cfg.tlsPort <= 0 || cfg.tlsPort > 65535) {
        errors.push_back("network.tls_port must be between 1-65535");
    }
    if (!cfg.dnsServer.empty()) {
        in_addr probe{};
        if (inet_pton(AF_INET, cfg.dnsServer.c_str(), &probe) != 1)
            errors.push_back("network.dns_server must be an IPv4 address");
    }
    if (cfg.whoisBootstrap.empty()) {
        errors.push_back("network.whois_bootstrap is required");
    }

    // Reputation
    for (const auto& z : cfg.dnsblZones) {
        if (z.zone.empty())
            errors.push_back("reputation.dnsbl.zones entries need a zone name");
        if (z.weight < 0)
            errors.push_back("reputation.dnsbl.zones weight for " + z.zone + " must not be negative");
    }
    if (cfg.abuseIpDbMaxAgeDays < 1 || cfg.abuseIpDbMaxAgeDays > 365) {
        errors.push_back("reputation.abuseipdb.max_age_days must be between 1-365");
    }

    // Scoring
    const auto& s = cfg.scoring;
    if (!(0 < s.mediumThreshold && s.mediumThreshold < s.highThreshold &&
          s.highThreshold < s.criticalThreshold && s.criticalThreshold <= 100)) {
        errors.push_back("scoring.thresholds must satisfy 0 < medium < high < critical <= 100");
    }
    if (s.abuseIpDbCap <= 0 || s.ipqsCap <= 0) {
        errors.push_back("scoring caps must be positive");
    }
    if (s.homeCountry.size() != 2) {
        errors.push_back("scoring.home_country must be an ISO-3166 alpha-2 code");
    }

    // Log level validation
    std::vector<std::string> validLevels = {"debug", "info", "warn", "warning", "error"};
    if (std::find(validLevels.begin(), validLevels.end(), cfg.logLevel) == validLevels.end()) {
        errors.push_back("logging.level must be one of: debug, info, warn, error");
    }

    if (!errors.empty()) {
        std::string errorMsg = "Configuration validation failed:\n";
        for (const auto& error : errors) {
            errorMsg += "  - " + error + "\n";
        }
        Logger::instance().log(LogLevel::Error, errorMsg);
        throw ConfigError("Invalid configuration: " + errorMsg);
    }

    Logger::instance().log(LogLevel::Debug, "Configuration validation passed");
}
