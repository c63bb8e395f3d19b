#pragma once
#include <cstdint>
#include <string>
#include <map>
#include <mutex>

// Probe counters for one process: probe_<name>_total and
// probe_<name>_errors_total.
class Metrics {
public:
    static Metrics& instance();

    void inc(const std::string& name, int value = 1);
    int64_t value(const std::string& name) const;
    void reset();

    std::string renderPrometheus() const;

private:
    Metrics() = default;
    mutable std::mutex mutex_;
    std::map<std::string, int64_t> counters_;
};
