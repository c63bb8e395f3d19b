#include "reputation/abuseipdb_provider.h"
#include "core/json_fields.h"
#include "core/logger.h"
#include "monitoring/metrics.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

AbuseIpDbProvider::AbuseIpDbProvider(IHttpClient& http, std::string endpoint, int maxAgeDays)
    : http_(http), endpoint_(std::move(endpoint)), maxAgeDays_(maxAgeDays) {}

ProbeResult<AbuseIpDbReport> AbuseIpDbProvider::normalize(const HttpResponse& resp) {
    if (resp.status != 200)
        return ProbeResult<AbuseIpDbReport>::error(
            "abuseipdb status " + std::to_string(resp.status) + ": " + bodyExcerpt(resp.body));

    json j = json::parse(resp.body, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return ProbeResult<AbuseIpDbReport>::error("abuseipdb failed: response is not a JSON object");

    AbuseIpDbReport r;
    auto data = j.find("data");
    if (data != j.end() && data->is_object()) {
        r.confidenceScore = jsonNumber(*data, "abuseConfidenceScore");
        r.totalReports = jsonInteger(*data, "totalReports");
    }
    return ProbeResult<AbuseIpDbReport>::ok(r);
}

ProbeResult<AbuseIpDbReport> AbuseIpDbProvider::check(const std::string& ip,
                                                      const std::string& apiKey) {
    if (apiKey.empty())
        return ProbeResult<AbuseIpDbReport>::absent();

    Metrics::instance().inc("probe_abuseipdb_total");

    std::string url = endpoint_ + "?" + HttpClient::buildQuery({
        {"ipAddress", ip},
        {"maxAgeInDays", std::to_string(maxAgeDays_)},
    });

    try {
        auto resp = http_.get(url, {{"Key", apiKey}, {"Accept", "application/json"}});
        auto result = normalize(resp);
        if (result.isError()) {
            Metrics::instance().inc("probe_abuseipdb_errors_total");
            Logger::instance().log(LogLevel::Warn, "AbuseIPDB: " + result.errorMessage());
        }
        return result;
    } catch (const std::exception& ex) {
        Metrics::instance().inc("probe_abuseipdb_errors_total");
        Logger::instance().log(LogLevel::Warn, std::string("AbuseIPDB: request failed: ") + ex.what());
        return ProbeResult<AbuseIpDbReport>::error(std::string("abuseipdb failed: ") + ex.what());
    }
}
