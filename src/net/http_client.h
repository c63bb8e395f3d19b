#pragma once
#include <string>
#include <utility>
#include <vector>

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
    int status = 0;
    HttpHeaders headers;
    std::string body;
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Throws NetworkError on transport or framing failure. Any HTTP status,
    // including 4xx/5xx, is a successful exchange.
    virtual HttpResponse get(const std::string& url, const HttpHeaders& headers) = 0;
};

/**
 * HTTP GET over libcurl's easy interface. One handle per request, peer
 * verification on, and `timeoutSeconds` bounds the whole exchange.
 */
class HttpClient : public IHttpClient {
public:
    HttpClient(int timeoutSeconds, std::string userAgent);

    HttpResponse get(const std::string& url, const HttpHeaders& headers) override;

    static std::string urlEncode(const std::string& s);
    static std::string buildQuery(const HttpHeaders& params);

private:
    int timeoutSeconds_;
    std::string userAgent_;
};
