#include <gtest/gtest.h>

#include "core/errors.h"
#include "diag/diagnostic_orchestrator.h"
#include "diag/result_json.h"
#include "fakes.h"

#include <algorithm>

namespace {

const Timestamp NOW = *parseIsoTimestamp("2025-06-01T00:00:00Z");

struct Harness {
    FakeDnsResolver dns;
    FakeWhoisClient whois;
    FakeCertificateProber certs;
    FakeGeoLocator geo;
    FakeReputationProvider<AbuseIpDbReport> abuse;
    FakeReputationProvider<IpqsReport> ipqs;
    DiagConfig cfg;

    DiagnosticResult run(const std::string& email, bool verbose = false) {
        DiagnosticOrchestrator orchestrator(cfg, {dns, whois, certs, geo, abuse, ipqs});
        return orchestrator.run(email, verbose, NOW);
    }
};

// A three-day-old domain on a blocklisted Chinese host with a self-signed
// certificate.
void suspicious(Harness& h) {
    h.whois.record.fields = {
        {"Domain Name", "NEWDOMAIN.EXAMPLE"},
        {"Registrar", "Cheap Names Ltd"},
        {"Creation Date", "2025-05-29T00:00:00Z"},
    };
    h.dns.a["newdomain.example"] = {"9.9.9.9"};
    h.dns.a["9.9.9.9.zen.spamhaus.org"] = {"127.0.0.2"};
    h.dns.txt["9.9.9.9.zen.spamhaus.org"] = {"Listed by SBL"};

    h.certs.summary.tlsValid = false;
    h.certs.summary.certificateSeen = true;
    h.certs.summary.isSelfSigned = true;
    h.certs.summary.issuerCommonName = "newdomain.example";

    h.geo.result = ProbeResult<GeoSummary>::ok(geoIn("CN"));
}

bool hasSignal(const DiagnosticResult& r, const std::string& name) {
    return std::any_of(r.risk.signals.begin(), r.risk.signals.end(),
        [&](const Signal& s) { return s.name == name; });
}

}

TEST(DiagnosticOrchestrator, SuspiciousDomainIsCritical) {
    Harness h;
    suspicious(h);

    auto r = h.run("test@newdomain.example");

    EXPECT_EQ(r.inputEmail, "test@newdomain.example");
    EXPECT_EQ(r.domain, "newdomain.example");
    ASSERT_EQ(r.ipDetails.size(), 1u);
    EXPECT_EQ(r.ipDetails[0].ip, "9.9.9.9");
    EXPECT_EQ(h.certs.hosts, std::vector<std::string>{"newdomain.example"});

    ASSERT_TRUE(r.reputation.dnsblHits);
    ASSERT_EQ(r.reputation.dnsblHits->size(), 1u);
    EXPECT_EQ(r.reputation.dnsblHits->front().zone, "zen.spamhaus.org");
    EXPECT_EQ(h.dns.count("A", "9.9.9.9.bl.spamcop.net"), 0);

    EXPECT_TRUE(hasSignal(r, "age_<7d"));
    EXPECT_TRUE(hasSignal(r, "tls_invalid_or_absent"));
    EXPECT_TRUE(hasSignal(r, "self_signed"));
    EXPECT_TRUE(hasSignal(r, "geo_high:CN"));
    EXPECT_TRUE(hasSignal(r, "dnsbl_listed:zen.spamhaus.org"));
    EXPECT_EQ(r.risk.score, 100);
    EXPECT_EQ(r.risk.label, RiskLabel::Critical);

    auto j = toJson(r);
    EXPECT_EQ(j["risk_score"], 100);
    EXPECT_EQ(j["risk_label"], "Critical");
    EXPECT_EQ(j["reputation"]["dnsbl_hits"][0]["weight"], 60.0);
}

TEST(DiagnosticOrchestrator, MissingCredentialsLeaveProvidersAbsent) {
    Harness h;
    suspicious(h);

    auto r = h.run("test@newdomain.example");

    ASSERT_TRUE(r.reputation.abuseIpDb);
    EXPECT_TRUE(r.reputation.abuseIpDb->isAbsent());
    ASSERT_TRUE(r.reputation.ipqs);
    EXPECT_TRUE(r.reputation.ipqs->isAbsent());
    EXPECT_EQ(h.abuse.calls.load(), 0);
    EXPECT_EQ(h.ipqs.calls.load(), 0);
    EXPECT_FALSE(hasSignal(r, "abuseipdb_confidence"));

    auto j = toJson(r);
    EXPECT_TRUE(j["reputation"]["abuseipdb"].is_null());
    EXPECT_TRUE(j["reputation"]["ipqs"].is_null());
}

TEST(DiagnosticOrchestrator, ConfiguredCredentialsReachProviders) {
    Harness h;
    suspicious(h);
    h.cfg.abuseIpDbKey = "abuse-key";
    h.cfg.ipqsKey = "ipqs-key";
    AbuseIpDbReport a;
    a.confidenceScore = 80;
    h.abuse.result = ProbeResult<AbuseIpDbReport>::ok(a);
    h.ipqs.result = ProbeResult<IpqsReport>::error("ipqs status 402: quota exceeded");

    auto r = h.run("test@newdomain.example");
    EXPECT_EQ(h.abuse.calls.load(), 1);
    EXPECT_EQ(h.ipqs.calls.load(), 1);
    EXPECT_TRUE(hasSignal(r, "abuseipdb_confidence"));
    EXPECT_FALSE(hasSignal(r, "ipqs_fraud_score"));
    EXPECT_EQ(toJson(r)["reputation"]["ipqs"]["error"], "ipqs status 402: quota exceeded");
}

TEST(DiagnosticOrchestrator, DisabledProvidersAreLeftOut) {
    Harness h;
    suspicious(h);
    h.cfg.dnsblEnabled = false;
    h.cfg.ipqsEnabled = false;

    auto r = h.run("test@newdomain.example");
    EXPECT_FALSE(r.reputation.dnsblHits);
    EXPECT_FALSE(r.reputation.ipqs);
    EXPECT_TRUE(r.reputation.abuseIpDb);
    EXPECT_EQ(h.dns.count("A", "9.9.9.9.zen.spamhaus.org"), 0);

    auto rep = toJson(r)["reputation"];
    EXPECT_FALSE(rep.contains("dnsbl_hits"));
    EXPECT_FALSE(rep.contains("ipqs"));
    EXPECT_TRUE(rep.contains("abuseipdb"));
}

TEST(DiagnosticOrchestrator, WhoisFailureScoresMissingCreationDate) {
    Harness h;
    suspicious(h);
    h.whois.fail = true;

    auto r = h.run("test@newdomain.example");
    ASSERT_TRUE(r.domainWhois.isError());
    ASSERT_FALSE(r.risk.signals.empty());
    EXPECT_EQ(r.risk.signals[0].name, "missing_creation_date");
    EXPECT_DOUBLE_EQ(r.risk.signals[0].impact, 10);

    auto j = toJson(r);
    EXPECT_EQ(j["domain_whois"]["error"].get<std::string>().rfind("domain whois failed: ", 0), 0u);
}

TEST(DiagnosticOrchestrator, NoAddressProbesWwwAndSkipsReputation) {
    Harness h;
    h.whois.record.fields = {{"Creation Date", "2010-01-01T00:00:00Z"}};
    h.cfg.abuseIpDbKey = "abuse-key";

    auto r = h.run("someone@bare.example");

    EXPECT_EQ(h.certs.hosts, std::vector<std::string>{"www.bare.example"});
    EXPECT_TRUE(r.ipDetails.empty());
    EXPECT_FALSE(r.reputation.checked);
    EXPECT_EQ(h.geo.calls.load(), 0);
    EXPECT_EQ(h.abuse.calls.load(), 0);
    EXPECT_TRUE(hasSignal(r, "geo_unknown"));

    auto j = toJson(r);
    EXPECT_TRUE(j["ip_details"].is_array());
    EXPECT_TRUE(j["ip_details"].empty());
    EXPECT_TRUE(j["reputation"].is_object());
    EXPECT_TRUE(j["reputation"].empty());
}

TEST(DiagnosticOrchestrator, DnsFailureIsTreatedAsNoAddress) {
    Harness h;
    h.dns.failing.insert("broken.example");

    auto r = h.run("x@broken.example");
    EXPECT_TRUE(r.ipDetails.empty());
    EXPECT_EQ(h.certs.hosts, std::vector<std::string>{"www.broken.example"});
}

TEST(DiagnosticOrchestrator, InvalidEmailMakesNoCalls) {
    Harness h;
    EXPECT_THROW(h.run("not-an-email"), InvalidInputError);
    EXPECT_EQ(h.dns.total(), 0u);
    EXPECT_EQ(h.whois.calls.load(), 0);
    EXPECT_TRUE(h.certs.hosts.empty());
    EXPECT_EQ(h.geo.calls.load(), 0);
}

TEST(DiagnosticOrchestrator, ConcurrentModeGivesTheSameReport) {
    Harness sequential;
    suspicious(sequential);
    Harness concurrent;
    suspicious(concurrent);
    concurrent.cfg.concurrentProbes = true;

    auto a = toJson(sequential.run("test@newdomain.example", true));
    auto b = toJson(concurrent.run("test@newdomain.example", true));
    EXPECT_EQ(a, b);
    EXPECT_EQ(concurrent.dns.count("A", "9.9.9.9.bl.spamcop.net"), 0);
}

TEST(DiagnosticOrchestrator, VerboseAddsDnsAndFullWhois) {
    Harness h;
    suspicious(h);
    h.dns.aaaa["newdomain.example"] = {"2001:db8::9"};
    h.dns.mx["newdomain.example"] = {{5, "mx.newdomain.example."}};
    h.whois.record.server = "whois.cheapnames.example";
    h.whois.record.fields.push_back({"Name Server", "NS1.CHEAPNAMES.EXAMPLE"});
    h.whois.record.fields.push_back({"Name Server", "NS2.CHEAPNAMES.EXAMPLE"});

    auto quiet = toJson(h.run("test@newdomain.example", false));
    EXPECT_FALSE(quiet.contains("dns"));
    EXPECT_FALSE(quiet.contains("domain_whois_full"));

    auto j = toJson(h.run("test@newdomain.example", true));
    EXPECT_EQ(j["dns"]["A"][0], "9.9.9.9");
    EXPECT_EQ(j["dns"]["AAAA"][0], "2001:db8::9");
    EXPECT_EQ(j["dns"]["MX"][0]["preference"], 5);
    EXPECT_EQ(j["dns"]["MX"][0]["host"], "mx.newdomain.example");
    EXPECT_EQ(j["domain_whois_full"]["whois_server"], "whois.cheapnames.example");
    ASSERT_TRUE(j["domain_whois_full"]["Name Server"].is_array());
    EXPECT_EQ(j["domain_whois_full"]["Name Server"].size(), 2u);
    EXPECT_EQ(j["domain_whois_full"]["Registrar"], "Cheap Names Ltd");
}

TEST(DiagnosticOrchestrator, VerboseWhoisFailureIsReported) {
    Harness h;
    h.whois.fail = true;

    auto j = toJson(h.run("a@gone.example", true));
    EXPECT_FALSE(j.contains("domain_whois_full"));
    EXPECT_TRUE(j["domain_whois_full_error"].is_string());
    EXPECT_TRUE(j["dns"]["MX"].empty());
}
