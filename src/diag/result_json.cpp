#include "diag/result_json.h"

using json = nlohmann::json;

/* ===================== Helpers ===================== */

template <typename T>
static json opt(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

static json optTime(const std::optional<Timestamp>& t) {
    return t ? json(formatIsoTimestamp(*t)) : json(nullptr);
}

static json errorMarker(const std::string& message) {
    return {{"error", message}};
}

/* ===================== Sections ===================== */

static json whoisJson(const ProbeResult<WhoisSummary>& w) {
    if (!w.isOk())
        return errorMarker(w.isError() ? w.errorMessage() : "domain whois not run");
    const auto& s = w.value();
    return {
        {"domain_name", s.domainName.empty() ? json(nullptr) : json(s.domainName)},
        {"registrar", s.registrar.empty() ? json(nullptr) : json(s.registrar)},
        {"creation_date", optTime(s.creationDate)},
        {"expiration_date", optTime(s.expirationDate)},
    };
}

static json issuerJson(const CertificateSummary& c) {
    json notAfter = nullptr;
    if (c.notAfter)
        notAfter = formatIsoTimestamp(*c.notAfter);
    else if (!c.notAfterRaw.empty())
        notAfter = c.notAfterRaw;

    return {
        {"issuer_country", opt(c.issuerCountry)},
        {"issuer_org", opt(c.issuerOrg)},
        {"issuer_common_name", opt(c.issuerCommonName)},
        {"issuer_summary", opt(c.issuerSummary())},
        {"not_after", notAfter},
        {"is_self_signed", c.isSelfSigned},
        {"is_lets_encrypt", c.isLetsEncrypt},
    };
}

static json geoJson(const ProbeResult<GeoSummary>& g) {
    if (!g.isOk())
        return errorMarker(g.isError() ? g.errorMessage() : "geo not run");
    const auto& s = g.value();
    return {
        {"country", opt(s.country)},
        {"country_code", opt(s.countryCode)},
        {"region", opt(s.region)},
        {"city", opt(s.city)},
        {"lat", opt(s.lat)},
        {"lon", opt(s.lon)},
        {"isp", opt(s.isp)},
        {"org", opt(s.org)},
    };
}

static json abuseJson(const ProbeResult<AbuseIpDbReport>& r) {
    if (r.isAbsent()) return nullptr;
    if (r.isError()) return errorMarker(r.errorMessage());
    return {
        {"confidence_score", opt(r.value().confidenceScore)},
        {"total_reports", opt(r.value().totalReports)},
    };
}

static json ipqsJson(const ProbeResult<IpqsReport>& r) {
    if (r.isAbsent()) return nullptr;
    if (r.isError()) return errorMarker(r.errorMessage());
    const auto& q = r.value();
    return {
        {"fraud_score", opt(q.fraudScore)},
        {"proxy", opt(q.proxy)},
        {"vpn", opt(q.vpn)},
        {"tor", opt(q.tor)},
        {"recent_abuse", opt(q.recentAbuse)},
    };
}

static json reputationJson(const ReputationBundle& rep) {
    json out = json::object();
    if (!rep.checked)
        return out;

    if (rep.dnsblHits) {
        json hits = json::array();
        for (const auto& h : *rep.dnsblHits)
            hits.push_back({{"zone", h.zone}, {"weight", h.weight}, {"txt", h.txt}});
        out["dnsbl_hits"] = hits;
    }
    if (rep.abuseIpDb) out["abuseipdb"] = abuseJson(*rep.abuseIpDb);
    if (rep.ipqs)      out["ipqs"] = ipqsJson(*rep.ipqs);
    return out;
}

static json signalJson(const Signal& s) {
    json j = s.context.is_object() ? s.context : json::object();
    j["name"] = s.name;
    j["impact"] = s.impact;
    return j;
}

json toJson(const RiskAssessment& risk) {
    json signals = json::array();
    for (const auto& s : risk.signals)
        signals.push_back(signalJson(s));
    return {
        {"risk_score", risk.score},
        {"risk_label", riskLabelToString(risk.label)},
        {"signals", signals},
    };
}

static void addVerbose(json& out, const VerboseDetails& v) {
    json mx = json::array();
    for (const auto& r : v.mx)
        mx.push_back({{"preference", r.preference}, {"host", r.host}});
    out["dns"] = {{"A", v.a}, {"AAAA", v.aaaa}, {"MX", mx}};

    if (v.whoisFull.isOk()) {
        json full = json::object();
        for (const auto& [key, value] : v.whoisFull.value().fields) {
            // repeated keys (name servers, statuses) collapse into arrays
            if (!full.contains(key)) {
                full[key] = value;
            } else if (full[key].is_array()) {
                full[key].push_back(value);
            } else {
                full[key] = json::array({full[key], value});
            }
        }
        full["whois_server"] = v.whoisFull.value().server;
        out["domain_whois_full"] = full;
    } else if (v.whoisFull.isError()) {
        out["domain_whois_full_error"] = v.whoisFull.errorMessage();
    }
}

json toJson(const DiagnosticResult& r) {
    json ipDetails = json::array();
    for (const auto& d : r.ipDetails)
        ipDetails.push_back({{"ip", d.ip}, {"geo", geoJson(d.geo)}});

    json out = {
        {"input_email", r.inputEmail},
        {"domain", r.domain},
        {"domain_whois", whoisJson(r.domainWhois)},
        {"ssl", {{"tls_valid", r.certificate.tlsValid}}},
        {"issuer", issuerJson(r.certificate)},
        {"ip_details", ipDetails},
        {"reputation", reputationJson(r.reputation)},
    };
    out.update(toJson(r.risk));

    if (r.verbose)
        addVerbose(out, *r.verbose);
    return out;
}
