#include "diag/domain_resolver.h"
#include "core/errors.h"
#include "core/input_validator.h"
#include "core/logger.h"
#include "monitoring/metrics.h"

/* ===================== WHOIS field names ===================== */
// Registries disagree on labels; the first listed key that is present wins.

static const std::vector<std::string> DOMAIN_KEYS = {"Domain Name", "domain"};
static const std::vector<std::string> REGISTRAR_KEYS = {"Registrar", "registrar"};
static const std::vector<std::string> CREATED_KEYS = {
    "Creation Date", "created", "Registered on", "Registration Time"
};
static const std::vector<std::string> EXPIRES_KEYS = {
    "Registry Expiry Date", "Registrar Registration Expiration Date",
    "Expiry Date", "Expiration Date", "expires", "paid-till"
};

DomainResolver::DomainResolver(IDnsResolver& dns, IWhoisClient& whois)
    : dns_(dns), whois_(whois) {}

WhoisSummary DomainResolver::summarize(const WhoisRecord& record) {
    WhoisSummary s;
    s.domainName = record.first(DOMAIN_KEYS);
    s.registrar = record.first(REGISTRAR_KEYS);

    std::string created = record.first(CREATED_KEYS);
    if (!created.empty())
        s.creationDate = parseWhoisTimestamp(created);

    std::string expires = record.first(EXPIRES_KEYS);
    if (!expires.empty())
        s.expirationDate = parseWhoisTimestamp(expires);

    return s;
}

WhoisRecord DomainResolver::lookupRecord(const std::string& domain) {
    std::string name = domain;
    for (;;) {
        try {
            return whois_.lookup(name);
        } catch (const WhoisNoMatchError&) {
            std::string parent = WhoisClient::parentDomain(name);
            if (parent.empty())
                throw;
            Logger::instance().log(LogLevel::Debug,
                "WHOIS: no record for " + name + ", trying " + parent);
            name = parent;
        }
    }
}

ProbeResult<WhoisSummary> DomainResolver::lookupWhois(const std::string& domain) {
    Metrics::instance().inc("probe_whois_total");
    try {
        return ProbeResult<WhoisSummary>::ok(summarize(lookupRecord(domain)));
    } catch (const std::exception& ex) {
        Metrics::instance().inc("probe_whois_errors_total");
        Logger::instance().log(LogLevel::Warn,
            "WHOIS: lookup for " + domain + " failed: " + ex.what());
        return ProbeResult<WhoisSummary>::error(std::string("domain whois failed: ") + ex.what());
    }
}

ProbeResult<WhoisFull> DomainResolver::lookupWhoisFull(const std::string& domain) {
    try {
        auto rec = lookupRecord(domain);
        return ProbeResult<WhoisFull>::ok({rec.server, rec.fields});
    } catch (const std::exception& ex) {
        Logger::instance().log(LogLevel::Warn,
            "WHOIS: full lookup for " + domain + " failed: " + ex.what());
        return ProbeResult<WhoisFull>::error(ex.what());
    }
}

std::vector<std::string> DomainResolver::resolveA(const std::string& domain) {
    Metrics::instance().inc("probe_dns_a_total");
    try {
        return dns_.lookupA(domain);
    } catch (const std::exception& ex) {
        Metrics::instance().inc("probe_dns_a_errors_total");
        Logger::instance().log(LogLevel::Warn,
            "DNS: A lookup for " + domain + " failed: " + ex.what());
        return {};
    }
}

std::vector<std::string> DomainResolver::resolveAAAA(const std::string& domain) {
    try {
        return dns_.lookupAAAA(domain);
    } catch (const std::exception& ex) {
        Logger::instance().log(LogLevel::Warn,
            "DNS: AAAA lookup for " + domain + " failed: " + ex.what());
        return {};
    }
}

std::vector<MxRecord> DomainResolver::resolveMx(const std::string& domain) {
    try {
        auto records = dns_.lookupMx(domain);
        for (auto& mx : records) {
            if (!mx.host.empty() && mx.host.back() == '.')
                mx.host.pop_back();
        }
        return records;
    } catch (const std::exception& ex) {
        Logger::instance().log(LogLevel::Warn,
            "DNS: MX lookup for " + domain + " failed: " + ex.what());
        return {};
    }
}

Resolution DomainResolver::resolve(const std::string& email) {
    Resolution r;
    r.domain = InputValidator::domainFromEmail(email);
    r.whois = lookupWhois(r.domain);
    r.addresses = resolveA(r.domain);
    return r;
}
