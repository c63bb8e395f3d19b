#pragma once
#include <nlohmann/json.hpp>

#include "diag/diagnostic_types.h"

// Report document consumed by the rendering layer. Error markers are
// rendered as {"error": "..."} in the slot of the probe that failed.
nlohmann::json toJson(const DiagnosticResult& result);

nlohmann::json toJson(const RiskAssessment& risk);
