#include "risk/risk_scorer.h"

#include <algorithm>
#include <cmath>

namespace {

struct Accumulator {
    double total = 0.0;
    std::vector<Signal> signals;

    void add(const std::string& name, double impact,
             nlohmann::json context = nlohmann::json::object()) {
        total += impact;
        signals.push_back({name, impact, std::move(context)});
    }
};

double clampScore(double s) {
    return std::max(0.0, std::min(100.0, s));
}

}

RiskScorer::RiskScorer(ScoringConfig cfg) : cfg_(std::move(cfg)) {}

RiskLabel RiskScorer::labelFor(double score) const {
    if (score >= cfg_.criticalThreshold) return RiskLabel::Critical;
    if (score >= cfg_.highThreshold)     return RiskLabel::High;
    if (score >= cfg_.mediumThreshold)   return RiskLabel::Medium;
    return RiskLabel::Low;
}

RiskAssessment RiskScorer::score(const ProbeResult<WhoisSummary>& whois,
                                 const CertificateSummary& cert,
                                 const std::vector<IpDetail>& ipDetails,
                                 const ReputationBundle& reputation) const {
    return score(whois, cert, ipDetails, reputation, std::chrono::system_clock::now());
}

RiskAssessment RiskScorer::score(const ProbeResult<WhoisSummary>& whois,
                                 const CertificateSummary& cert,
                                 const std::vector<IpDetail>& ipDetails,
                                 const ReputationBundle& reputation,
                                 Timestamp now) const {
    Accumulator acc;

    /* ---------- DOMAIN AGE ---------- */

    std::optional<long long> ageDays;
    if (whois.isOk() && whois.value().creationDate)
        ageDays = daysBetween(*whois.value().creationDate, now);

    if (!ageDays) {
        acc.add("missing_creation_date", cfg_.missingCreationDate);
    } else {
        long long d = *ageDays;
        nlohmann::json ctx = {{"age_days", d}};
        if (d < 7)
            acc.add("age_<7d", cfg_.ageUnder7Days, ctx);
        else if (d < 90)
            acc.add("age_7d_to_3m", cfg_.ageUnder90Days, ctx);
        else if (d < 180)
            acc.add("age_3m_to_6m", cfg_.ageUnder180Days, ctx);
        else if (d < 365)
            acc.add("age_6m_to_12m", cfg_.ageUnder365Days, ctx);
        else
            acc.add("age_>12m", cfg_.ageOverYear, ctx);
    }

    /* ---------- TLS ---------- */

    // A valid free-CA certificate gets no credit here; rule 4 prices it
    if (!cert.tlsValid)
        acc.add("tls_invalid_or_absent", cfg_.tlsInvalid);
    else if (!cert.isLetsEncrypt)
        acc.add("tls_valid_non_LE", cfg_.tlsValidNonFreeCa);

    if (cert.isSelfSigned)
        acc.add("self_signed", cfg_.selfSigned);

    if (cert.isLetsEncrypt) {
        double impact = cfg_.freeCaBase;
        if (ageDays && *ageDays < cfg_.freeCaYoungDays)
            impact += cfg_.freeCaYoungBonus;
        acc.add("lets_encrypt", impact);
    }

    /* ---------- GEO (first IP only) ---------- */

    std::optional<std::string> countryCode;
    if (!ipDetails.empty() && ipDetails.front().geo.isOk())
        countryCode = ipDetails.front().geo.value().countryCode;

    if (!countryCode || countryCode->empty()) {
        acc.add("geo_unknown", cfg_.geoUnknownImpact);
    } else {
        const std::string& cc = *countryCode;
        if (cfg_.geoHigh.count(cc)) {
            acc.add("geo_high:" + cc, cfg_.geoHighImpact);
        } else if (cfg_.geoMedium.count(cc)) {
            acc.add("geo_medium:" + cc, cfg_.geoMediumImpact);
        } else if (cc != cfg_.homeCountry) {
            // Provisional label from the score so far: a foreign host always
            // clears the Low band, but is not stacked on an already risky one
            double provisional = clampScore(acc.total);
            if (cfg_.nonHomeElevateToMedium && labelFor(provisional) == RiskLabel::Low) {
                double delta = std::max(0.0, cfg_.mediumThreshold - provisional);
                acc.add("geo_non_home_elevate:" + cc, delta);
            } else if (cfg_.nonHomeNudge != 0) {
                acc.add("geo_non_home_nudge:" + cc, cfg_.nonHomeNudge);
            }
        }
    }

    /* ---------- REPUTATION (first IP only) ---------- */

    if (!ipDetails.empty()) {
        if (reputation.dnsblHits && !reputation.dnsblHits->empty()) {
            // first/strongest zone only, never summed
            const DnsblHit& h = reputation.dnsblHits->front();
            acc.add("dnsbl_listed:" + h.zone, h.weight, {{"txt", h.txt}});
        }

        if (reputation.abuseIpDb && reputation.abuseIpDb->isOk() &&
            reputation.abuseIpDb->value().confidenceScore) {
            double c = *reputation.abuseIpDb->value().confidenceScore;
            double impact = std::min(c * cfg_.abuseIpDbMultiplier, cfg_.abuseIpDbCap);
            acc.add("abuseipdb_confidence", impact, {{"confidence", c}});
        }

        if (reputation.ipqs && reputation.ipqs->isOk() &&
            reputation.ipqs->value().fraudScore) {
            double f = *reputation.ipqs->value().fraudScore;
            double impact = std::min(f * cfg_.ipqsMultiplier, cfg_.ipqsCap);
            acc.add("ipqs_fraud_score", impact, {{"fraud_score", f}});
        }
    }

    /* ---------- CLAMP & LABEL ---------- */

    RiskAssessment out;
    // nearbyint rounds half to even under the default rounding mode
    out.score = static_cast<int>(std::nearbyint(clampScore(acc.total)));
    out.label = labelFor(out.score);
    out.signals = std::move(acc.signals);
    return out;
}
