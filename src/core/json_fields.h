#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Lenient field readers for third-party payloads: a missing key or a value
// of the wrong type reads as std::nullopt instead of throwing.

inline std::optional<double> jsonNumber(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number())
        return std::nullopt;
    return it->get<double>();
}

inline std::optional<long long> jsonInteger(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number())
        return std::nullopt;
    return static_cast<long long>(it->get<double>());
}

inline std::optional<bool> jsonBool(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean())
        return std::nullopt;
    return it->get<bool>();
}

inline std::optional<std::string> jsonString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

inline std::string bodyExcerpt(const std::string& body, size_t max = 200) {
    return body.size() > max ? body.substr(0, max) : body;
}
