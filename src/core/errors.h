#pragma once
#include <stdexcept>
#include <string>

/* ===================== Fatal errors ===================== */

// Malformed caller input; raised before any network traffic.
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what)
        : std::invalid_argument(what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

/* ===================== Transport errors ===================== */
// These never leave a probe: each component turns them into a
// ProbeResult error marker.

class NetworkError : public std::runtime_error {
public:
    explicit NetworkError(const std::string& what)
        : std::runtime_error(what) {}
};

class DnsError : public std::runtime_error {
public:
    explicit DnsError(const std::string& what)
        : std::runtime_error(what) {}
};

class WhoisError : public std::runtime_error {
public:
    explicit WhoisError(const std::string& what)
        : std::runtime_error(what) {}
};

// The registry answered but holds no record for the queried name.
class WhoisNoMatchError : public WhoisError {
public:
    explicit WhoisNoMatchError(const std::string& what)
        : WhoisError(what) {}
};
