#include "input_validator.h"
#include "errors.h"
#include "logger.h"
#include <algorithm>
#include <cctype>
#include <regex>
#include <arpa/inet.h>

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string InputValidator::domainFromEmail(const std::string& email) {
    auto at = email.find('@');
    if (at == std::string::npos) {
        throw InvalidInputError("Provide an email like name@example.com");
    }

    std::string domain = trim(email.substr(at + 1));
    std::transform(domain.begin(), domain.end(), domain.begin(),
        [](unsigned char c) { return std::tolower(c); });

    if (domain.empty()) {
        throw InvalidInputError("Email has no domain part: " + email);
    }

    if (!isValidDomain(domain)) {
        // Not fatal; every probe fails soft on a malformed name
        Logger::instance().log(LogLevel::Warn,
            "InputValidator: unusual domain syntax: " + domain);
    }
    return domain;
}

bool InputValidator::isValidDomain(const std::string& domain) {
    if (domain.empty() || domain.length() > 253) { // RFC 1035 limit
        return false;
    }
    
    // Basic domain validation
    std::regex pattern(R"(^([a-zA-Z0-9]([a-zA-Z0-9\-]{0,61}[a-zA-Z0-9])?\.)+[a-zA-Z]{2,}$)");
    return std::regex_match(domain, pattern);
}

bool InputValidator::isIpv4Address(const std::string& ip) {
    in_addr addr{};
    return inet_pton(AF_INET, ip.c_str(), &addr) == 1;
}
