#pragma once
#include <chrono>
#include <optional>
#include <string>

using Timestamp = std::chrono::system_clock::time_point;

// ISO-8601 ("2024-03-01T10:00:00Z", "+02:00" offsets, fractional seconds,
// space separator) or bare "YYYY-MM-DD". Values without an offset are UTC.
std::optional<Timestamp> parseIsoTimestamp(const std::string& text);

// WHOIS dates: ISO-8601 as above, or "DD-Mon-YYYY" (.uk, .ie, ...), UTC.
std::optional<Timestamp> parseWhoisTimestamp(const std::string& text);

// Certificate validity form, e.g. "Jun  1 12:00:00 2025 GMT".
std::optional<Timestamp> parseCertTimestamp(const std::string& text);

// "YYYY-MM-DDTHH:MM:SS+00:00"
std::string formatIsoTimestamp(Timestamp ts);

// Whole days from `from` to `to`, rounded towards negative infinity.
long long daysBetween(Timestamp from, Timestamp to);
