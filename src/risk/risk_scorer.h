#pragma once
#include <vector>

#include "diag/diagnostic_types.h"
#include "risk/risk_types.h"
#include "risk/scoring_config.h"

/**
 * Deterministic risk scoring.
 *
 * Rules run in a fixed order (domain age, TLS, self-signed, free CA,
 * geography, reputation) and every contribution is recorded as a Signal.
 * The order matters: the geography rule looks at the label implied by the
 * running score before reputation is added.
 */
class RiskScorer {
public:
    explicit RiskScorer(ScoringConfig cfg = ScoringConfig{});

    RiskAssessment score(const ProbeResult<WhoisSummary>& whois,
                         const CertificateSummary& cert,
                         const std::vector<IpDetail>& ipDetails,
                         const ReputationBundle& reputation,
                         Timestamp now) const;

    RiskAssessment score(const ProbeResult<WhoisSummary>& whois,
                         const CertificateSummary& cert,
                         const std::vector<IpDetail>& ipDetails,
                         const ReputationBundle& reputation) const;

    RiskLabel labelFor(double score) const;

    const ScoringConfig& config() const { return cfg_; }

private:
    ScoringConfig cfg_;
};
