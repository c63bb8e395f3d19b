#include "diag/geo_locator.h"
#include "core/json_fields.h"
#include "core/logger.h"
#include "monitoring/metrics.h"

using json = nlohmann::json;

static const char* GEO_FIELDS = "status,message,country,countryCode,regionName,city,lat,lon,isp,org";

IpApiGeoLocator::IpApiGeoLocator(IHttpClient& http, std::string endpoint)
    : http_(http), endpoint_(std::move(endpoint)) {}

ProbeResult<GeoSummary> IpApiGeoLocator::normalize(const HttpResponse& resp) {
    if (resp.status != 200)
        return ProbeResult<GeoSummary>::error(
            "geo failed: status " + std::to_string(resp.status));

    json j = json::parse(resp.body, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return ProbeResult<GeoSummary>::error("geo failed: response is not a JSON object");

    if (jsonString(j, "status").value_or("") != "success")
        return ProbeResult<GeoSummary>::error(
            "geo failed: " + jsonString(j, "message").value_or("unknown error"));

    GeoSummary g;
    g.country = jsonString(j, "country");
    g.countryCode = jsonString(j, "countryCode");
    g.region = jsonString(j, "regionName");
    g.city = jsonString(j, "city");
    g.lat = jsonNumber(j, "lat");
    g.lon = jsonNumber(j, "lon");
    g.isp = jsonString(j, "isp");
    g.org = jsonString(j, "org");
    return ProbeResult<GeoSummary>::ok(g);
}

ProbeResult<GeoSummary> IpApiGeoLocator::locate(const std::string& ip) {
    Metrics::instance().inc("probe_geo_total");

    std::string url = endpoint_ + HttpClient::urlEncode(ip) + "?" +
        HttpClient::buildQuery({{"fields", GEO_FIELDS}});

    try {
        auto result = normalize(http_.get(url, {}));
        if (result.isError()) {
            Metrics::instance().inc("probe_geo_errors_total");
            Logger::instance().log(LogLevel::Warn, "Geo: " + ip + ": " + result.errorMessage());
        }
        return result;
    } catch (const std::exception& ex) {
        Metrics::instance().inc("probe_geo_errors_total");
        Logger::instance().log(LogLevel::Warn, "Geo: lookup for " + ip + " failed: " + ex.what());
        return ProbeResult<GeoSummary>::error(std::string("geo failed: ") + ex.what());
    }
}
