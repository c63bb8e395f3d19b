#include "whois/whois_client.h"
#include "net/tcp_socket.h"
#include "core/errors.h"
#include "core/logger.h"

#include <algorithm>
#include <cctype>
#include <sstream>

static const int WHOIS_PORT = 43;

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return s;
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string WhoisRecord::first(const std::vector<std::string>& keys) const {
    for (const auto& key : keys) {
        std::string k = toLower(key);
        for (const auto& [name, value] : fields)
            if (toLower(name) == k && !value.empty())
                return value;
    }
    return "";
}

WhoisClient::WhoisClient(std::string bootstrapServer, int timeoutSeconds)
    : bootstrap_(std::move(bootstrapServer)), timeoutSeconds_(timeoutSeconds) {}

/* ===================== Parsing ===================== */

std::vector<std::pair<std::string, std::string>> WhoisClient::parseFields(const std::string& text) {
    std::vector<std::pair<std::string, std::string>> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '%' || t[0] == '#')
            continue;
        // ">>> Last update of WHOIS database: ... <<<" closes the record body
        if (t.rfind(">>>", 0) == 0)
            break;
        size_t colon = t.find(':');
        if (colon == std::string::npos || colon == 0)
            continue;
        std::string key = trim(t.substr(0, colon));
        std::string value = trim(t.substr(colon + 1));
        // long keys are legal notices, not fields
        if (key.size() > 48 || value.empty())
            continue;
        out.emplace_back(key, value);
    }
    return out;
}

std::string WhoisClient::referralFrom(const std::vector<std::pair<std::string, std::string>>& fields) {
    for (const auto& [key, value] : fields) {
        std::string k = toLower(key);
        if (k == "refer" || k == "whois" || k == "registrar whois server") {
            std::string v = toLower(value);
            if (v.rfind("whois://", 0) == 0) v = v.substr(8);
            if (v.rfind("http://", 0) == 0 || v.rfind("https://", 0) == 0)
                continue;
            return v;
        }
    }
    return "";
}

bool WhoisClient::isNoMatch(const std::string& text) {
    std::string t = toLower(text);
    return t.find("no match for") != std::string::npos ||
           t.find("not found") != std::string::npos ||
           t.find("no entries found") != std::string::npos ||
           t.find("no data found") != std::string::npos;
}

std::string WhoisClient::parentDomain(const std::string& domain) {
    std::string name = domain;
    if (!name.empty() && name.back() == '.')
        name.pop_back();
    size_t dot = name.find('.');
    if (dot == std::string::npos)
        return "";
    std::string parent = name.substr(dot + 1);
    // registries only hold registrable names; never go above two labels
    if (parent.find('.') == std::string::npos)
        return "";
    return parent;
}

/* ===================== Transport ===================== */

std::string WhoisClient::query(const std::string& server, const std::string& domain) {
    Logger::instance().log(LogLevel::Debug, "WHOIS: querying " + server + " for " + domain);
    TcpSocket sock = TcpSocket::connect(server, WHOIS_PORT, timeoutSeconds_);
    sock.sendAll(domain + "\r\n");
    return sock.readToEnd(1024 * 1024);
}

WhoisRecord WhoisClient::lookup(const std::string& domain) {
    WhoisRecord rec;
    rec.domain = domain;

    std::string bootstrapText = query(bootstrap_, domain);
    auto registry = referralFrom(parseFields(bootstrapText));
    if (registry.empty())
        throw WhoisError("no WHOIS server known for " + domain);

    std::string registryText = query(registry, domain);
    if (trim(registryText).empty())
        throw WhoisError("empty WHOIS answer from " + registry);

    auto registryFields = parseFields(registryText);
    rec.server = registry;
    rec.fields = registryFields;
    rec.rawText = registryText;

    if (isNoMatch(registryText) && rec.first({"Domain Name", "domain"}).empty())
        throw WhoisNoMatchError("no match for " + domain + " at " + registry);

    // Thin registries (.com/.net) point at the registrar for the full record
    std::string registrar = referralFrom(registryFields);
    if (!registrar.empty() && registrar != registry) {
        try {
            std::string registrarText = query(registrar, domain);
            auto registrarFields = parseFields(registrarText);
            if (!registrarFields.empty()) {
                rec.fields.insert(rec.fields.end(), registrarFields.begin(), registrarFields.end());
                rec.rawText += "\n" + registrarText;
                rec.server = registrar;
            }
        } catch (const NetworkError& ex) {
            Logger::instance().log(LogLevel::Warn,
                "WHOIS: registrar referral " + registrar + " failed: " + ex.what());
        }
    }

    return rec;
}
