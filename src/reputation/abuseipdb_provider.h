#pragma once
#include "net/http_client.h"
#include "reputation/ip_reputation_provider.h"
#include "reputation/reputation_types.h"

class AbuseIpDbProvider : public IpReputationProvider<AbuseIpDbReport> {
public:
    AbuseIpDbProvider(IHttpClient& http, std::string endpoint, int maxAgeDays);

    ProbeResult<AbuseIpDbReport> check(const std::string& ip,
                                       const std::string& apiKey) override;

    std::string name() const override {
        return "abuseipdb";
    }

    // Maps an API v2 /check response onto AbuseIpDbReport.
    static ProbeResult<AbuseIpDbReport> normalize(const HttpResponse& resp);

private:
    IHttpClient& http_;
    std::string endpoint_;
    int maxAgeDays_;
};
