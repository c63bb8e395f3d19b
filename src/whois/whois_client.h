#pragma once
#include <string>
#include <utility>
#include <vector>

struct WhoisRecord {
    std::string domain;
    std::string server;     // server that gave the most specific answer
    std::vector<std::pair<std::string, std::string>> fields;   // in answer order
    std::string rawText;

    // First value whose key matches one of `keys` (case-insensitive), in the
    // order the keys are given.
    std::string first(const std::vector<std::string>& keys) const;
};

class IWhoisClient {
public:
    virtual ~IWhoisClient() = default;

    // Throws WhoisError / NetworkError; WhoisNoMatchError when the registry
    // has no record for exactly this name.
    virtual WhoisRecord lookup(const std::string& domain) = 0;
};

/**
 * RFC 3912 client. Starts at a bootstrap server (whois.iana.org), follows the
 * registry referral, then at most one registrar referral.
 */
class WhoisClient : public IWhoisClient {
public:
    WhoisClient(std::string bootstrapServer, int timeoutSeconds);

    WhoisRecord lookup(const std::string& domain) override;

    static std::vector<std::pair<std::string, std::string>> parseFields(const std::string& text);
    static std::string referralFrom(const std::vector<std::pair<std::string, std::string>>& fields);
    static bool isNoMatch(const std::string& text);

    // "mail.google.com" -> "google.com"; "" once only two labels remain.
    static std::string parentDomain(const std::string& domain);

private:
    std::string query(const std::string& server, const std::string& domain);

    std::string bootstrap_;
    int timeoutSeconds_;
};
