#pragma once
#include <string>
#include <nlohmann/json.hpp>

#include "diag/diagnostic_types.h"
#include "net/http_client.h"

class IGeoLocator {
public:
    virtual ~IGeoLocator() = default;
    virtual ProbeResult<GeoSummary> locate(const std::string& ip) = 0;
};

// ip-api.com JSON endpoint; one request, no retry.
class IpApiGeoLocator : public IGeoLocator {
public:
    IpApiGeoLocator(IHttpClient& http, std::string endpoint);

    ProbeResult<GeoSummary> locate(const std::string& ip) override;

    static ProbeResult<GeoSummary> normalize(const HttpResponse& resp);

private:
    IHttpClient& http_;
    std::string endpoint_;
};
