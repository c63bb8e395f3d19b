#pragma once
#include <string>

#include "core/config_loader.h"
#include "diag/certificate_prober.h"
#include "diag/diagnostic_types.h"
#include "diag/geo_locator.h"
#include "dns/dns_resolver.h"
#include "reputation/ip_reputation_provider.h"
#include "risk/risk_scorer.h"
#include "whois/whois_client.h"

// External collaborators of one orchestrator. Not owned.
struct DiagnosticServices {
    IDnsResolver& dns;
    IWhoisClient& whois;
    ICertificateProber& certificates;
    IGeoLocator& geo;
    IpReputationProvider<AbuseIpDbReport>& abuseIpDb;
    IpReputationProvider<IpqsReport>& ipqs;
};

/**
 * Runs one diagnostic:
 *   resolve -> TLS probe (domain, or www.<domain> without A records)
 *   -> geolocation -> reputation (first IP only) -> scoring.
 *
 * With concurrentProbes the independent probes overlap; results are still
 * composed in the order above. Only InvalidInputError escapes; every probe
 * reports its own failures inline.
 */
class DiagnosticOrchestrator {
public:
    DiagnosticOrchestrator(DiagConfig cfg, DiagnosticServices services);

    DiagnosticResult run(const std::string& email, bool verbose);
    DiagnosticResult run(const std::string& email, bool verbose, Timestamp now);

private:
    ReputationBundle checkReputation(const std::string& ip);
    VerboseDetails collectVerbose(const std::string& domain,
                                  const std::vector<std::string>& addresses);

    DiagConfig cfg_;
    DiagnosticServices services_;
    RiskScorer scorer_;
};
