#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/probe_result.h"
#include "core/timestamp.h"
#include "dns/dns_resolver.h"
#include "reputation/reputation_types.h"
#include "risk/risk_types.h"

struct WhoisSummary {
    std::string domainName;
    std::string registrar;
    std::optional<Timestamp> creationDate;
    std::optional<Timestamp> expirationDate;
};

struct CertificateSummary {
    bool tlsValid = false;
    bool certificateSeen = false;
    std::optional<std::string> issuerCountry;
    std::optional<std::string> issuerOrg;
    std::optional<std::string> issuerCommonName;
    std::optional<Timestamp> notAfter;
    std::string notAfterRaw;    // kept when the date did not parse
    bool isSelfSigned = false;
    bool isLetsEncrypt = false;

    // Issuer CN, falling back to O
    std::optional<std::string> issuerSummary() const {
        return issuerCommonName ? issuerCommonName : issuerOrg;
    }
};

struct GeoSummary {
    std::optional<std::string> country;
    std::optional<std::string> countryCode;
    std::optional<std::string> region;
    std::optional<std::string> city;
    std::optional<double> lat;
    std::optional<double> lon;
    std::optional<std::string> isp;
    std::optional<std::string> org;
};

struct IpDetail {
    std::string ip;
    ProbeResult<GeoSummary> geo = ProbeResult<GeoSummary>::absent();
};

struct WhoisFull {
    std::string server;
    std::vector<std::pair<std::string, std::string>> fields;
};

struct VerboseDetails {
    std::vector<std::string> a;
    std::vector<std::string> aaaa;
    std::vector<MxRecord> mx;
    ProbeResult<WhoisFull> whoisFull = ProbeResult<WhoisFull>::absent();
};

// The report for one email. Built fresh per call and never mutated afterwards.
struct DiagnosticResult {
    std::string inputEmail;
    std::string domain;
    ProbeResult<WhoisSummary> domainWhois = ProbeResult<WhoisSummary>::absent();
    CertificateSummary certificate;
    std::vector<IpDetail> ipDetails;    // first resolved IP only
    ReputationBundle reputation;
    RiskAssessment risk;
    std::optional<VerboseDetails> verbose;
};
