#include "net/http_client.h"
#include "core/errors.h"
#include "core/logger.h"

#include <curl/curl.h>
#include <memory>
#include <mutex>

static const size_t MAX_RESPONSE = 4 * 1024 * 1024;

struct CurlDeleter {
    void operator()(CURL* c) const noexcept {
        if (c) curl_easy_cleanup(c);
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* l) const noexcept {
        if (l) curl_slist_free_all(l);
    }
};

using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

static void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
            throw NetworkError("curl_global_init failed");
    });
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

/* ===================== libcurl callbacks ===================== */

static size_t writeBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    size_t n = size * nmemb;
    // returning short aborts the transfer with CURLE_WRITE_ERROR
    if (body->size() + n > MAX_RESPONSE)
        return 0;
    body->append(ptr, n);
    return n;
}

static size_t writeHeader(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t n = size * nmemb;
    std::string line(ptr, n);

    // a new status line (redirect, 100-continue) starts a fresh header block
    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return n;
    }
    size_t colon = line.find(':');
    if (colon != std::string::npos)
        headers->emplace_back(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
    return n;
}

/* ===================== Client ===================== */

HttpClient::HttpClient(int timeoutSeconds, std::string userAgent)
    : timeoutSeconds_(timeoutSeconds), userAgent_(std::move(userAgent)) {
    ensureCurlGlobalInit();
}

std::string HttpClient::urlEncode(const std::string& s) {
    ensureCurlGlobalInit();
    char* escaped = curl_easy_escape(nullptr, s.c_str(), static_cast<int>(s.size()));
    if (!escaped)
        throw NetworkError("curl_easy_escape failed");
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

std::string HttpClient::buildQuery(const HttpHeaders& params) {
    std::string q;
    for (const auto& [k, v] : params) {
        if (!q.empty()) q += '&';
        q += urlEncode(k) + "=" + urlEncode(v);
    }
    return q;
}

HttpResponse HttpClient::get(const std::string& url, const HttpHeaders& headers) {
    CurlPtr curl(curl_easy_init());
    if (!curl)
        throw NetworkError("curl_easy_init failed");

    CurlSlistPtr headerList;
    for (const auto& [k, v] : headers) {
        std::string line = k + ": " + v;
        curl_slist* next = curl_slist_append(headerList.get(), line.c_str());
        if (!next)
            throw NetworkError("curl_slist_append failed");
        headerList.release();
        headerList.reset(next);
    }

    HttpResponse resp;
    char errbuf[CURL_ERROR_SIZE] = {0};

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(h, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeoutSeconds_));
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeoutSeconds_));
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeBody);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, writeHeader);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &resp.headers);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);

    // origin only; IPQS carries its key in the path
    size_t hostStart = url.find("://");
    hostStart = hostStart == std::string::npos ? 0 : hostStart + 3;
    Logger::instance().log(LogLevel::Debug,
        "HTTP GET " + url.substr(0, url.find('/', hostStart)));

    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(rc);
        throw NetworkError("HTTP GET failed: " + detail);
    }

    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    resp.status = static_cast<int>(status);
    return resp;
}
