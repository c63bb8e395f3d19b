#include "reputation/ipqs_provider.h"
#include "core/json_fields.h"
#include "core/logger.h"
#include "monitoring/metrics.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

IpqsProvider::IpqsProvider(IHttpClient& http, std::string endpoint, int strictness)
    : http_(http), endpoint_(std::move(endpoint)), strictness_(strictness) {}

ProbeResult<IpqsReport> IpqsProvider::normalize(const HttpResponse& resp) {
    if (resp.status != 200)
        return ProbeResult<IpqsReport>::error(
            "ipqs status " + std::to_string(resp.status) + ": " + bodyExcerpt(resp.body));

    json j = json::parse(resp.body, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return ProbeResult<IpqsReport>::error("ipqs failed: response is not a JSON object");

    // IPQS answers 200 with success=false for bad keys and quota errors
    auto success = jsonBool(j, "success");
    if (success && !*success)
        return ProbeResult<IpqsReport>::error(
            "ipqs failed: " + jsonString(j, "message").value_or("request rejected"));

    IpqsReport r;
    r.fraudScore = jsonNumber(j, "fraud_score");
    r.proxy = jsonBool(j, "proxy");
    r.vpn = jsonBool(j, "vpn");
    r.tor = jsonBool(j, "tor");
    r.recentAbuse = jsonBool(j, "recent_abuse");
    return ProbeResult<IpqsReport>::ok(r);
}

ProbeResult<IpqsReport> IpqsProvider::check(const std::string& ip,
                                            const std::string& apiKey) {
    if (apiKey.empty())
        return ProbeResult<IpqsReport>::absent();

    Metrics::instance().inc("probe_ipqs_total");

    std::string url = endpoint_ + HttpClient::urlEncode(apiKey) + "/" + HttpClient::urlEncode(ip) +
        "?" + HttpClient::buildQuery({
            {"strictness", std::to_string(strictness_)},
            {"allow_public_access_points", "true"},
        });

    try {
        auto result = normalize(http_.get(url, {}));
        if (result.isError()) {
            Metrics::instance().inc("probe_ipqs_errors_total");
            Logger::instance().log(LogLevel::Warn, "IPQS: " + result.errorMessage());
        }
        return result;
    } catch (const std::exception& ex) {
        Metrics::instance().inc("probe_ipqs_errors_total");
        Logger::instance().log(LogLevel::Warn, std::string("IPQS: request failed: ") + ex.what());
        return ProbeResult<IpqsReport>::error(std::string("ipqs failed: ") + ex.what());
    }
}
