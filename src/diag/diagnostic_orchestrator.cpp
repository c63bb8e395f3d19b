#include "diag/diagnostic_orchestrator.h"
#include "diag/domain_resolver.h"
#include "core/input_validator.h"
#include "core/logger.h"
#include "reputation/dnsbl_checker.h"

#include <future>
#include <optional>

DiagnosticOrchestrator::DiagnosticOrchestrator(DiagConfig cfg, DiagnosticServices services)
    : cfg_(std::move(cfg))
    , services_(services)
    , scorer_(cfg_.scoring) {}

DiagnosticResult DiagnosticOrchestrator::run(const std::string& email, bool verbose) {
    return run(email, verbose, std::chrono::system_clock::now());
}

// Deferred tasks run on the calling thread at get(), which gives the plain
// sequential behaviour.
static std::launch launchPolicy(bool concurrent) {
    return concurrent ? std::launch::async : std::launch::deferred;
}

ReputationBundle DiagnosticOrchestrator::checkReputation(const std::string& ip) {
    const auto policy = launchPolicy(cfg_.concurrentProbes);
    ReputationBundle rep;
    rep.checked = true;

    // DNSBL zones stay sequential inside the checker; only the provider as a
    // whole overlaps with the API calls
    std::optional<std::future<std::vector<DnsblHit>>> dnsblF;
    if (cfg_.dnsblEnabled) {
        dnsblF = std::async(policy, [this, &ip] {
            DnsblChecker checker(services_.dns);
            return checker.check(ip, cfg_.dnsblZones);
        });
    }

    std::optional<std::future<ProbeResult<AbuseIpDbReport>>> abuseF;
    if (cfg_.abuseIpDbEnabled) {
        abuseF = std::async(policy, [this, &ip] {
            return services_.abuseIpDb.check(ip, cfg_.abuseIpDbKey);
        });
    }

    std::optional<std::future<ProbeResult<IpqsReport>>> ipqsF;
    if (cfg_.ipqsEnabled) {
        ipqsF = std::async(policy, [this, &ip] {
            return services_.ipqs.check(ip, cfg_.ipqsKey);
        });
    }

    if (dnsblF) rep.dnsblHits = dnsblF->get();
    if (abuseF) rep.abuseIpDb = abuseF->get();
    if (ipqsF)  rep.ipqs = ipqsF->get();
    return rep;
}

VerboseDetails DiagnosticOrchestrator::collectVerbose(const std::string& domain,
                                                      const std::vector<std::string>& addresses) {
    DomainResolver resolver(services_.dns, services_.whois);

    VerboseDetails v;
    v.a = addresses;
    v.aaaa = resolver.resolveAAAA(domain);
    v.mx = resolver.resolveMx(domain);
    v.whoisFull = resolver.lookupWhoisFull(domain);
    return v;
}

DiagnosticResult DiagnosticOrchestrator::run(const std::string& email, bool verbose, Timestamp now) {
    const auto policy = launchPolicy(cfg_.concurrentProbes);

    DiagnosticResult result;
    result.inputEmail = email;
    // Throws InvalidInputError before any network traffic
    result.domain = InputValidator::domainFromEmail(email);
    const std::string domain = result.domain;

    Logger::instance().log(LogLevel::Info, "Diagnostic started for " + domain);

    /* ---------- RESOLVE ---------- */

    DomainResolver resolver(services_.dns, services_.whois);
    auto whoisF = std::async(policy, [&resolver, &domain] {
        return resolver.lookupWhois(domain);
    });
    std::vector<std::string> addresses = resolver.resolveA(domain);
    result.domainWhois = whoisF.get();

    /* ---------- TLS + GEO + REPUTATION ---------- */

    const std::string probeHost = addresses.empty() ? "www." + domain : domain;
    auto certF = std::async(policy, [this, &probeHost] {
        return services_.certificates.probe(probeHost, cfg_.tlsPort);
    });

    std::optional<std::future<ProbeResult<GeoSummary>>> geoF;
    std::optional<std::future<ReputationBundle>> repF;
    if (!addresses.empty()) {
        const std::string& ip = addresses.front();
        geoF = std::async(policy, [this, &ip] { return services_.geo.locate(ip); });
        repF = std::async(policy, [this, &ip] { return checkReputation(ip); });
    }

    result.certificate = certF.get();
    if (geoF) {
        IpDetail detail;
        detail.ip = addresses.front();
        detail.geo = geoF->get();
        result.ipDetails.push_back(detail);
    }
    if (repF)
        result.reputation = repF->get();

    /* ---------- SCORE ---------- */

    result.risk = scorer_.score(result.domainWhois, result.certificate,
                                result.ipDetails, result.reputation, now);

    Logger::instance().log(LogLevel::Info,
        "Diagnostic for " + domain + ": score=" + std::to_string(result.risk.score) +
        " label=" + riskLabelToString(result.risk.label));

    if (verbose)
        result.verbose = collectVerbose(domain, addresses);

    return result;
}
