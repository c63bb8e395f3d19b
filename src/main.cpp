#include "core/config_loader.h"
#include "core/errors.h"
#include "core/logger.h"
#include "diag/certificate_prober.h"
#include "diag/diagnostic_orchestrator.h"
#include "diag/geo_locator.h"
#include "diag/result_json.h"
#include "dns/dns_resolver.h"
#include "monitoring/metrics.h"
#include "net/http_client.h"
#include "reputation/abuseipdb_provider.h"
#include "reputation/ipqs_provider.h"
#include "whois/whois_client.h"

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

struct CliOptions {
    std::string email;
    bool verbose = false;
    std::string configPath;
    std::string abuseIpDbKey;
    std::string ipqsKey;
    std::string logLevel;
};

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <email> [--verbose] [--abuseipdb-key KEY] [--ipqs-key KEY]\n"
              << "       [--config PATH] [--log-level debug|info|warn|error]\n\n"
              << "Email domain diagnostics with risk scoring and IP reputation checks.\n"
              << "Keys may also come from ABUSEIPDB_KEY / IPQS_KEY, the config from CONFIG_PATH.\n";
}

std::string envOr(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : fallback;
}

// Returns false on a usage error.
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " needs a value" << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--abuseipdb-key") {
            if (!value(opts.abuseIpDbKey)) return false;
        } else if (arg == "--ipqs-key") {
            if (!value(opts.ipqsKey)) return false;
        } else if (arg == "--config") {
            if (!value(opts.configPath)) return false;
        } else if (arg == "--log-level") {
            if (!value(opts.logLevel)) return false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << std::endl;
            return false;
        } else if (opts.email.empty()) {
            opts.email = arg;
        } else {
            std::cerr << "Error: only one email may be given" << std::endl;
            return false;
        }
    }
    return !opts.email.empty();
}

}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
    }

    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage(argv[0]);
        return 1;
    }

    // 1) Configuration: --config, then CONFIG_PATH, then built-in defaults
    DiagConfig cfg;
    try {
        std::string configPath = opts.configPath.empty()
            ? envOr("CONFIG_PATH", "")
            : opts.configPath;
        cfg = configPath.empty()
            ? ConfigLoader::loadFromString("")
            : ConfigLoader::loadFromFile(configPath);
    } catch (const ConfigError& ex) {
        std::cerr << ex.what() << std::endl;
        return 2;
    }

    // 2) Logging
    Logger::instance().setFile(cfg.logFile);
    Logger::instance().setLevel(logLevelFromString(
        opts.logLevel.empty() ? cfg.logLevel : opts.logLevel));

    // 3) Credentials: flag > environment > config file
    cfg.abuseIpDbKey = opts.abuseIpDbKey.empty() ? envOr("ABUSEIPDB_KEY", cfg.abuseIpDbKey) : opts.abuseIpDbKey;
    cfg.ipqsKey = opts.ipqsKey.empty() ? envOr("IPQS_KEY", cfg.ipqsKey) : opts.ipqsKey;

    if (cfg.abuseIpDbKey.empty())
        Logger::instance().log(LogLevel::Info, "AbuseIPDB key not set, provider disabled");
    if (cfg.ipqsKey.empty())
        Logger::instance().log(LogLevel::Info, "IPQS key not set, provider disabled");

    // 4) Collaborators
    std::string dnsServer = cfg.dnsServer.empty()
        ? DnsResolver::systemNameserver()
        : cfg.dnsServer;
    DnsResolver dns(dnsServer, cfg.timeoutSeconds);
    WhoisClient whois(cfg.whoisBootstrap, cfg.timeoutSeconds);
    HttpClient http(cfg.timeoutSeconds, cfg.userAgent);
    CertificateProber certificates(cfg.timeoutSeconds, cfg.scoring.freeCaMarker);
    IpApiGeoLocator geo(http, cfg.geoEndpoint);
    AbuseIpDbProvider abuseIpDb(http, cfg.abuseIpDbEndpoint, cfg.abuseIpDbMaxAgeDays);
    IpqsProvider ipqs(http, cfg.ipqsEndpoint, cfg.ipqsStrictness);

    Logger::instance().log(LogLevel::Debug, "Using DNS server " + dnsServer);

    DiagnosticOrchestrator orchestrator(cfg, {dns, whois, certificates, geo, abuseIpDb, ipqs});

    // 5) Run
    DiagnosticResult result;
    try {
        result = orchestrator.run(opts.email, opts.verbose);
    } catch (const InvalidInputError& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }

    // WHOIS text is not always valid UTF-8
    std::cout << toJson(result).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;

    Logger::instance().log(LogLevel::Debug, "Probe counters:\n" + Metrics::instance().renderPrometheus());
    return 0;
}
