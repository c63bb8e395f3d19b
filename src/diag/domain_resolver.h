#pragma once
#include <string>
#include <vector>

#include "diag/diagnostic_types.h"
#include "dns/dns_resolver.h"
#include "whois/whois_client.h"

struct Resolution {
    std::string domain;
    ProbeResult<WhoisSummary> whois = ProbeResult<WhoisSummary>::absent();
    std::vector<std::string> addresses;   // A records only
};

/**
 * Email -> domain -> (WHOIS summary, A records).
 *
 * Only a missing '@' is fatal (InvalidInputError, before any traffic). WHOIS
 * failures become an error marker and DNS failures an empty address list.
 */
class DomainResolver {
public:
    DomainResolver(IDnsResolver& dns, IWhoisClient& whois);

    Resolution resolve(const std::string& email);

    ProbeResult<WhoisSummary> lookupWhois(const std::string& domain);
    ProbeResult<WhoisFull> lookupWhoisFull(const std::string& domain);
    std::vector<std::string> resolveA(const std::string& domain);
    std::vector<std::string> resolveAAAA(const std::string& domain);
    std::vector<MxRecord> resolveMx(const std::string& domain);

    static WhoisSummary summarize(const WhoisRecord& record);

private:
    // Retries with the parent name on "no match" (mail.google.com ->
    // google.com), never going above two labels.
    WhoisRecord lookupRecord(const std::string& domain);

    IDnsResolver& dns_;
    IWhoisClient& whois_;
};
