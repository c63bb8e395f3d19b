#include <gtest/gtest.h>

#include "core/config_loader.h"
#include "risk/risk_scorer.h"
#include "fakes.h"

#include <algorithm>

using namespace std::chrono;

namespace {

const Timestamp NOW = *parseIsoTimestamp("2025-06-01T12:00:00Z");

ProbeResult<WhoisSummary> agedDays(int days) {
    WhoisSummary w;
    w.domainName = "EXAMPLE.TEST";
    w.creationDate = NOW - hours(24 * days);
    return ProbeResult<WhoisSummary>::ok(w);
}

ProbeResult<WhoisSummary> whoisFailed() {
    return ProbeResult<WhoisSummary>::error("domain whois failed: timeout");
}

CertificateSummary validCert() {
    CertificateSummary c;
    c.tlsValid = true;
    c.certificateSeen = true;
    c.issuerOrg = "DigiCert Inc";
    c.issuerCommonName = "DigiCert Global G2 TLS RSA SHA256 2020 CA1";
    return c;
}

CertificateSummary letsEncryptCert() {
    CertificateSummary c;
    c.tlsValid = true;
    c.certificateSeen = true;
    c.issuerOrg = "Let's Encrypt";
    c.issuerCommonName = "R11";
    c.isLetsEncrypt = true;
    return c;
}

std::vector<IpDetail> ipIn(const std::string& cc) {
    IpDetail d;
    d.ip = "203.0.113.7";
    d.geo = ProbeResult<GeoSummary>::ok(geoIn(cc));
    return {d};
}

const Signal* findSignal(const RiskAssessment& r, const std::string& prefix) {
    auto it = std::find_if(r.signals.begin(), r.signals.end(),
        [&](const Signal& s) { return s.name.rfind(prefix, 0) == 0; });
    return it == r.signals.end() ? nullptr : &*it;
}

}

TEST(RiskScorer, DomainAgeBuckets) {
    RiskScorer scorer;
    struct Case { int days; const char* name; double impact; };
    const Case cases[] = {
        {0, "age_<7d", 40},
        {6, "age_<7d", 40},
        {7, "age_7d_to_3m", 25},
        {89, "age_7d_to_3m", 25},
        {90, "age_3m_to_6m", 12},
        {179, "age_3m_to_6m", 12},
        {180, "age_6m_to_12m", 5},
        {364, "age_6m_to_12m", 5},
        {365, "age_>12m", -15},
        {4000, "age_>12m", -15},
    };

    for (const auto& c : cases) {
        auto r = scorer.score(agedDays(c.days), validCert(), ipIn("GB"), {}, NOW);
        ASSERT_FALSE(r.signals.empty());
        EXPECT_EQ(r.signals[0].name, c.name) << c.days << " days";
        EXPECT_DOUBLE_EQ(r.signals[0].impact, c.impact) << c.days << " days";
        EXPECT_EQ(r.signals[0].context["age_days"].get<long long>(), c.days);
    }
}

TEST(RiskScorer, MissingCreationDateAddsTen) {
    RiskScorer scorer;
    auto r = scorer.score(whoisFailed(), validCert(), ipIn("GB"), {}, NOW);
    ASSERT_FALSE(r.signals.empty());
    EXPECT_EQ(r.signals[0].name, "missing_creation_date");
    EXPECT_DOUBLE_EQ(r.signals[0].impact, 10);

    WhoisSummary noDate;
    noDate.registrar = "Example Registrar";
    auto r2 = scorer.score(ProbeResult<WhoisSummary>::ok(noDate), validCert(), ipIn("GB"), {}, NOW);
    EXPECT_EQ(r2.signals[0].name, "missing_creation_date");
}

TEST(RiskScorer, ValidNonFreeCaCertificateLowersScore) {
    RiskScorer scorer;
    auto r = scorer.score(agedDays(200), validCert(), ipIn("GB"), {}, NOW);
    const Signal* s = findSignal(r, "tls_valid_non_LE");
    ASSERT_NE(s, nullptr);
    EXPECT_DOUBLE_EQ(s->impact, -10);
    EXPECT_EQ(findSignal(r, "tls_invalid_or_absent"), nullptr);
    EXPECT_EQ(r.score, 0);   // 5 - 10, clamped
}

TEST(RiskScorer, FreeCaCertificateGetsNoValidityCredit) {
    RiskScorer scorer;
    auto r = scorer.score(agedDays(400), letsEncryptCert(), ipIn("GB"), {}, NOW);
    EXPECT_EQ(findSignal(r, "tls_valid_non_LE"), nullptr);
    const Signal* le = findSignal(r, "lets_encrypt");
    ASSERT_NE(le, nullptr);
    EXPECT_DOUBLE_EQ(le->impact, 45);
    EXPECT_EQ(r.score, 30);
}

TEST(RiskScorer, SelfSignedAndInvalidHandshakeBothCount) {
    RiskScorer scorer;
    CertificateSummary c;
    c.tlsValid = false;
    c.certificateSeen = true;
    c.isSelfSigned = true;

    auto r = scorer.score(agedDays(400), c, ipIn("GB"), {}, NOW);
    const Signal* invalid = findSignal(r, "tls_invalid_or_absent");
    const Signal* self = findSignal(r, "self_signed");
    ASSERT_NE(invalid, nullptr);
    ASSERT_NE(self, nullptr);
    EXPECT_DOUBLE_EQ(invalid->impact, 40);
    EXPECT_DOUBLE_EQ(self->impact, 30);
    EXPECT_EQ(r.score, 55);   // -15 + 40 + 30
    EXPECT_EQ(r.label, RiskLabel::High);
}

TEST(RiskScorer, YoungDomainWithFreeCaCompounds) {
    RiskScorer scorer;
    auto young = scorer.score(agedDays(10), letsEncryptCert(), ipIn("GB"), {}, NOW);
    auto old = scorer.score(agedDays(400), letsEncryptCert(), ipIn("GB"), {}, NOW);

    EXPECT_DOUBLE_EQ(findSignal(young, "lets_encrypt")->impact, 55);
    EXPECT_DOUBLE_EQ(findSignal(old, "lets_encrypt")->impact, 45);

    // age delta (+25 vs -15) plus the young-domain bonus
    EXPECT_EQ(young.score, 80);
    EXPECT_EQ(old.score, 30);
    EXPECT_EQ(young.score - old.score, 50);
    EXPECT_GT(young.score, old.score);
}

TEST(RiskScorer, GeographyHighMediumUnknownAndHome) {
    RiskScorer scorer;

    auto high = scorer.score(agedDays(400), validCert(), ipIn("RU"), {}, NOW);
    ASSERT_NE(findSignal(high, "geo_high:RU"), nullptr);
    EXPECT_DOUBLE_EQ(findSignal(high, "geo_high:RU")->impact, 40);

    auto medium = scorer.score(agedDays(400), validCert(), ipIn("BR"), {}, NOW);
    ASSERT_NE(findSignal(medium, "geo_medium:BR"), nullptr);
    EXPECT_DOUBLE_EQ(findSignal(medium, "geo_medium:BR")->impact, 25);

    auto home = scorer.score(agedDays(400), validCert(), ipIn("GB"), {}, NOW);
    EXPECT_EQ(findSignal(home, "geo_"), nullptr);

    auto noIp = scorer.score(agedDays(400), validCert(), {}, {}, NOW);
    ASSERT_NE(findSignal(noIp, "geo_unknown"), nullptr);
    EXPECT_DOUBLE_EQ(findSignal(noIp, "geo_unknown")->impact, 5);

    IpDetail failed;
    failed.ip = "203.0.113.7";
    failed.geo = ProbeResult<GeoSummary>::error("geo failed: reserved range");
    auto geoError = scorer.score(agedDays(400), validCert(), {failed}, {}, NOW);
    EXPECT_NE(findSignal(geoError, "geo_unknown"), nullptr);
}

TEST(RiskScorer, NonHomeCountryElevatesLowToMediumBoundary) {
    ScoringConfig cfg;
    cfg.tlsValidNonFreeCa = 0;
    RiskScorer scorer(cfg);

    // running score 10: missing date (+10), valid certificate (0)
    auto r = scorer.score(whoisFailed(), validCert(), ipIn("US"), {}, NOW);
    const Signal* s = findSignal(r, "geo_non_home_elevate:US");
    ASSERT_NE(s, nullptr);
    EXPECT_DOUBLE_EQ(s->impact, 15);
    EXPECT_EQ(r.score, 25);
    EXPECT_EQ(r.label, RiskLabel::Medium);
    EXPECT_EQ(findSignal(r, "geo_non_home_nudge"), nullptr);
}

TEST(RiskScorer, NonHomeCountryNudgesAlreadyRiskyScore) {
    RiskScorer scorer;
    CertificateSummary invalid;
    // +25 (age) +40 (tls) = 65 before geography
    auto r = scorer.score(agedDays(30), invalid, ipIn("US"), {}, NOW);
    const Signal* s = findSignal(r, "geo_non_home_nudge:US");
    ASSERT_NE(s, nullptr);
    EXPECT_DOUBLE_EQ(s->impact, 5);
    EXPECT_EQ(r.score, 70);
    EXPECT_EQ(findSignal(r, "geo_non_home_elevate"), nullptr);
}

TEST(RiskScorer, ElevationUsesClampedProvisionalScore) {
    RiskScorer scorer;
    // -15 (age) -10 (tls) = -25; provisional clamps to 0 so the lift is 25
    auto r = scorer.score(agedDays(400), validCert(), ipIn("DE"), {}, NOW);
    const Signal* s = findSignal(r, "geo_non_home_elevate:DE");
    ASSERT_NE(s, nullptr);
    EXPECT_DOUBLE_EQ(s->impact, 25);
    EXPECT_EQ(r.score, 0);
}

TEST(RiskScorer, ElevationCanBeDisabled) {
    ScoringConfig cfg;
    cfg.nonHomeElevateToMedium = false;
    cfg.nonHomeNudge = 0;
    RiskScorer scorer(cfg);

    auto r = scorer.score(agedDays(400), validCert(), ipIn("DE"), {}, NOW);
    EXPECT_EQ(findSignal(r, "geo_non_home"), nullptr);
}

TEST(RiskScorer, OnlyFirstDnsblHitCounts) {
    RiskScorer scorer;
    ReputationBundle rep;
    rep.checked = true;
    rep.dnsblHits = std::vector<DnsblHit>{
        {"zen.spamhaus.org", 60, {"https://www.spamhaus.org/query/ip/203.0.113.7"}},
        {"bl.spamcop.net", 40, {}},
    };

    auto r = scorer.score(agedDays(400), validCert(), ipIn("GB"), rep, NOW);
    const Signal* s = findSignal(r, "dnsbl_listed:");
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->name, "dnsbl_listed:zen.spamhaus.org");
    EXPECT_DOUBLE_EQ(s->impact, 60);
    EXPECT_EQ(s->context["txt"][0], "https://www.spamhaus.org/query/ip/203.0.113.7");
    EXPECT_EQ(std::count_if(r.signals.begin(), r.signals.end(),
        [](const Signal& x) { return x.name.rfind("dnsbl_listed", 0) == 0; }), 1);
    EXPECT_EQ(r.score, 35);   // -15 -10 +60
}

TEST(RiskScorer, ApiReputationIsScaledAndCapped) {
    RiskScorer scorer;
    auto scoreWith = [&](double confidence, double fraud) {
        ReputationBundle rep;
        rep.checked = true;
        AbuseIpDbReport a;
        a.confidenceScore = confidence;
        a.totalReports = 12;
        IpqsReport q;
        q.fraudScore = fraud;
        rep.abuseIpDb = ProbeResult<AbuseIpDbReport>::ok(a);
        rep.ipqs = ProbeResult<IpqsReport>::ok(q);
        return scorer.score(agedDays(400), validCert(), ipIn("GB"), rep, NOW);
    };

    auto mid = scoreWith(30, 50);
    EXPECT_DOUBLE_EQ(findSignal(mid, "abuseipdb_confidence")->impact, 15);
    EXPECT_DOUBLE_EQ(findSignal(mid, "ipqs_fraud_score")->impact, 20);
    EXPECT_DOUBLE_EQ(findSignal(mid, "abuseipdb_confidence")->context["confidence"].get<double>(), 30);

    auto max = scoreWith(100, 100);
    EXPECT_DOUBLE_EQ(findSignal(max, "abuseipdb_confidence")->impact, 50);
    EXPECT_DOUBLE_EQ(findSignal(max, "ipqs_fraud_score")->impact, 40);
}

TEST(RiskScorer, AbsentOrFailedProvidersContributeNothing) {
    RiskScorer scorer;
    ReputationBundle rep;
    rep.checked = true;
    rep.dnsblHits = std::vector<DnsblHit>{};
    rep.abuseIpDb = ProbeResult<AbuseIpDbReport>::absent();
    rep.ipqs = ProbeResult<IpqsReport>::error("ipqs status 403: invalid key");

    auto r = scorer.score(agedDays(400), validCert(), ipIn("GB"), rep, NOW);
    EXPECT_EQ(findSignal(r, "abuseipdb"), nullptr);
    EXPECT_EQ(findSignal(r, "ipqs"), nullptr);
    EXPECT_EQ(findSignal(r, "dnsbl"), nullptr);

    IpqsReport noScore;
    noScore.proxy = true;
    rep.ipqs = ProbeResult<IpqsReport>::ok(noScore);
    auto r2 = scorer.score(agedDays(400), validCert(), ipIn("GB"), rep, NOW);
    EXPECT_EQ(findSignal(r2, "ipqs"), nullptr);
}

TEST(RiskScorer, ReputationNeedsAnIpDetail) {
    RiskScorer scorer;
    ReputationBundle rep;
    rep.checked = true;
    rep.dnsblHits = std::vector<DnsblHit>{{"zen.spamhaus.org", 60, {}}};

    auto r = scorer.score(agedDays(400), validCert(), {}, rep, NOW);
    EXPECT_EQ(findSignal(r, "dnsbl"), nullptr);
}

TEST(RiskScorer, ClampsToHundred) {
    RiskScorer scorer;
    CertificateSummary c;
    c.isSelfSigned = true;
    ReputationBundle rep;
    rep.checked = true;
    rep.dnsblHits = std::vector<DnsblHit>{{"zen.spamhaus.org", 60, {}}};

    auto r = scorer.score(agedDays(1), c, ipIn("KP"), rep, NOW);
    EXPECT_EQ(r.score, 100);
    EXPECT_EQ(r.label, RiskLabel::Critical);
}

TEST(RiskScorer, RoundsHalfToEven) {
    RiskScorer scorer;
    ReputationBundle rep;
    rep.checked = true;
    AbuseIpDbReport a;
    a.confidenceScore = 35;   // 17.5
    rep.abuseIpDb = ProbeResult<AbuseIpDbReport>::ok(a);

    // 5 (age) + 40 (tls) + 17.5 = 62.5
    auto r = scorer.score(agedDays(200), CertificateSummary{}, ipIn("GB"), rep, NOW);
    EXPECT_EQ(r.score, 62);

    a.confidenceScore = 37;   // 18.5 -> 63.5
    rep.abuseIpDb = ProbeResult<AbuseIpDbReport>::ok(a);
    auto r2 = scorer.score(agedDays(200), CertificateSummary{}, ipIn("GB"), rep, NOW);
    EXPECT_EQ(r2.score, 64);
}

TEST(RiskScorer, LabelThresholds) {
    RiskScorer scorer;
    EXPECT_EQ(scorer.labelFor(0), RiskLabel::Low);
    EXPECT_EQ(scorer.labelFor(24), RiskLabel::Low);
    EXPECT_EQ(scorer.labelFor(25), RiskLabel::Medium);
    EXPECT_EQ(scorer.labelFor(49), RiskLabel::Medium);
    EXPECT_EQ(scorer.labelFor(50), RiskLabel::High);
    EXPECT_EQ(scorer.labelFor(74), RiskLabel::High);
    EXPECT_EQ(scorer.labelFor(75), RiskLabel::Critical);
    EXPECT_EQ(scorer.labelFor(100), RiskLabel::Critical);
}

TEST(RiskScorer, ScoreAlwaysBoundedAndLabelConsistent) {
    RiskScorer scorer;
    const int ages[] = {-1, 0, 3, 30, 120, 200, 500};
    const char* countries[] = {"GB", "US", "CN", "TR", ""};

    for (int age : ages) {
        for (const char* cc : countries) {
            for (int certKind = 0; certKind < 3; ++certKind) {
                CertificateSummary c = certKind == 0 ? CertificateSummary{}
                                     : certKind == 1 ? validCert() : letsEncryptCert();
                auto whois = age < 0 ? whoisFailed() : agedDays(age);
                auto ips = std::string(cc).empty() ? std::vector<IpDetail>{} : ipIn(cc);

                auto r = scorer.score(whois, c, ips, {}, NOW);
                EXPECT_GE(r.score, 0);
                EXPECT_LE(r.score, 100);
                EXPECT_EQ(r.label, scorer.labelFor(r.score));
            }
        }
    }
}

TEST(RiskScorer, SignalsFollowRuleOrder) {
    RiskScorer scorer;
    CertificateSummary c;
    c.isSelfSigned = true;
    c.isLetsEncrypt = true;
    ReputationBundle rep;
    rep.checked = true;
    rep.dnsblHits = std::vector<DnsblHit>{{"bl.spamcop.net", 40, {}}};
    IpqsReport q;
    q.fraudScore = 10;
    rep.ipqs = ProbeResult<IpqsReport>::ok(q);

    auto r = scorer.score(agedDays(20), c, ipIn("CN"), rep, NOW);
    std::vector<std::string> names;
    for (const auto& s : r.signals) names.push_back(s.name);

    const std::vector<std::string> expected = {
        "age_7d_to_3m", "tls_invalid_or_absent", "self_signed", "lets_encrypt",
        "geo_high:CN", "dnsbl_listed:bl.spamcop.net", "ipqs_fraud_score",
    };
    EXPECT_EQ(names, expected);
}

TEST(RiskScorer, SubstitutedWeightTable) {
    ScoringConfig cfg;
    cfg.homeCountry = "US";
    cfg.geoHigh = {"XX"};
    cfg.geoHighImpact = 70;
    RiskScorer scorer(cfg);

    auto home = scorer.score(agedDays(400), validCert(), ipIn("US"), {}, NOW);
    EXPECT_EQ(findSignal(home, "geo_"), nullptr);

    auto high = scorer.score(agedDays(400), validCert(), ipIn("XX"), {}, NOW);
    EXPECT_DOUBLE_EQ(findSignal(high, "geo_high:XX")->impact, 70);

    auto formerlyHigh = scorer.score(agedDays(400), validCert(), ipIn("CN"), {}, NOW);
    EXPECT_EQ(findSignal(formerlyHigh, "geo_high"), nullptr);
}

TEST(RiskScorer, LowerCaseHomeCountryFromConfigStillMatches) {
    auto cfg = ConfigLoader::loadFromString(R"(
scoring:
  home_country: gb
  geo_high: [cn]
)");
    RiskScorer scorer(cfg.scoring);

    auto home = scorer.score(agedDays(400), validCert(), ipIn("GB"), {}, NOW);
    EXPECT_EQ(findSignal(home, "geo_"), nullptr);

    auto high = scorer.score(agedDays(400), validCert(), ipIn("CN"), {}, NOW);
    EXPECT_NE(findSignal(high, "geo_high:CN"), nullptr);
}
