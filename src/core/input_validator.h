#pragma once

#include <string>

/**
 * Input validation for the diagnostic entry point
 */
class InputValidator {
public:
    // Substring after the first '@', trimmed and lower-cased.
    // Throws InvalidInputError when there is no '@' or nothing after it.
    static std::string domainFromEmail(const std::string& email);

    // Validate domain name (RFC 1035 shape, at least one dot)
    static bool isValidDomain(const std::string& domain);

    // Dotted-quad IPv4 literal
    static bool isIpv4Address(const std::string& ip);
};
