#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

enum class ProbeStatus {
    Ok,
    Error,
    Absent   // provider not configured; distinct from "checked and clean"
};

/**
 * Outcome of one external probe.
 *
 * Every component that talks to a third party returns one of these instead of
 * throwing, so a dead WHOIS server or a rejected API key shows up as an inline
 * {error: ...} marker in the report and scoring carries on without it.
 */
template <typename T>
class ProbeResult {
public:
    static ProbeResult ok(T value) {
        ProbeResult r(ProbeStatus::Ok);
        r.value_ = std::move(value);
        return r;
    }

    static ProbeResult error(std::string message) {
        ProbeResult r(ProbeStatus::Error);
        r.error_ = std::move(message);
        return r;
    }

    static ProbeResult absent() {
        return ProbeResult(ProbeStatus::Absent);
    }

    ProbeStatus status() const { return status_; }
    bool isOk() const { return status_ == ProbeStatus::Ok; }
    bool isError() const { return status_ == ProbeStatus::Error; }
    bool isAbsent() const { return status_ == ProbeStatus::Absent; }

    const T& value() const {
        if (!value_)
            throw std::logic_error("ProbeResult: no value (" + error_ + ")");
        return *value_;
    }

    const std::string& errorMessage() const { return error_; }

private:
    explicit ProbeResult(ProbeStatus s) : status_(s) {}

    ProbeStatus status_;
    std::optional<T> value_;
    std::string error_;
};
