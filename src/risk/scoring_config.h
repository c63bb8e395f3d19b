#pragma once
#include <set>
#include <string>

// Weight table for RiskScorer. Defaults reproduce the production table.
struct ScoringConfig {
    // Domain age
    double missingCreationDate = 10;
    double ageUnder7Days = 40;
    double ageUnder90Days = 25;
    double ageUnder180Days = 12;
    double ageUnder365Days = 5;
    double ageOverYear = -15;

    // TLS
    double tlsInvalid = 40;
    double tlsValidNonFreeCa = -10;
    double selfSigned = 30;
    double freeCaBase = 45;
    double freeCaYoungBonus = 10;
    int freeCaYoungDays = 90;
    std::string freeCaMarker = "Let's Encrypt";

    // Geography (ISO-3166-1 alpha-2)
    std::string homeCountry = "GB";
    std::set<std::string> geoHigh = {"CN", "RU", "BY", "IR", "KP"};
    std::set<std::string> geoMedium = {"TR", "VN", "ID", "NG", "PK", "BR"};
    double geoHighImpact = 40;
    double geoMediumImpact = 25;
    double geoUnknownImpact = 5;
    bool nonHomeElevateToMedium = true;
    double nonHomeNudge = 5;

    // Reputation
    double abuseIpDbMultiplier = 0.5;
    double abuseIpDbCap = 50;
    double ipqsMultiplier = 0.4;
    double ipqsCap = 40;

    // Labels
    int mediumThreshold = 25;
    int highThreshold = 50;
    int criticalThreshold = 75;
};
