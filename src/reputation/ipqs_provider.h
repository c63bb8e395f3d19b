#pragma once
#include "net/http_client.h"
#include "reputation/ip_reputation_provider.h"
#include "reputation/reputation_types.h"

class IpqsProvider : public IpReputationProvider<IpqsReport> {
public:
    IpqsProvider(IHttpClient& http, std::string endpoint, int strictness);

    ProbeResult<IpqsReport> check(const std::string& ip,
                                  const std::string& apiKey) override;

    std::string name() const override {
        return "ipqs";
    }

    static ProbeResult<IpqsReport> normalize(const HttpResponse& resp);

private:
    IHttpClient& http_;
    std::string endpoint_;
    int strictness_;
};
