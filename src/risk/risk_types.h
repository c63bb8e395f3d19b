#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class RiskLabel {
    Low,
    Medium,
    High,
    Critical
};

inline std::string riskLabelToString(RiskLabel l) {
    switch (l) {
    case RiskLabel::Low: return "Low";
    case RiskLabel::Medium: return "Medium";
    case RiskLabel::High: return "High";
    case RiskLabel::Critical: return "Critical";
    }
    return "Low";
}

// One scoring contribution. `context` carries free-form detail (age_days,
// txt, confidence...) rendered next to name and impact.
struct Signal {
    std::string name;
    double impact = 0.0;
    nlohmann::json context = nlohmann::json::object();
};

struct RiskAssessment {
    int score = 0;
    RiskLabel label = RiskLabel::Low;
    std::vector<Signal> signals;   // in the order they were applied
};
