#include "HealthScorer.hpp"
#include "../Errors.hpp"
#include <algorithm>
#include <cmath>

namespace fleetsense::domain {

namespace {

// The capped deduction is rounded half away from zero before it is
// subtracted, so every component is a whole number.
int cappedComponent(double deduction, double cap) {
    return std::max(0, 100 - static_cast<int>(std::round(std::min(cap, deduction))));
}

int clampScore(double value) {
    return static_cast<int>(std::clamp(std::round(value), 0.0, 100.0));
}

void requireFinite(double value, const char* name) {
    if (!std::isfinite(value)) {
        throw ComputationError(std::string("non-finite feature: ") + name);
    }
}

} // namespace

int HealthScorer::connectivityScore(const DailyHealthFeature& f) {
    double deduction = f.offlineEventCount * 8.0 + std::max(f.maxGapMinutes - 30.0, 0.0) * 0.25;
    return cappedComponent(deduction, 70.0);
}

int HealthScorer::safetyScore(const DailyHealthFeature& f) {
    double deduction = f.harshEventCount * 4.0 + f.overspeedEventCount * 3.0 + f.speedingExposurePct * 0.5;
    return cappedComponent(deduction, 75.0);
}

int HealthScorer::utilizationScore(const DailyHealthFeature& f) {
    double deduction = f.idleMinutes * 0.15 + f.idleEventCount * 2.0 + std::max(f.distanceKm - 400.0, 0.0) * 0.05;
    return cappedComponent(deduction, 65.0);
}

int HealthScorer::dataQualityScore(const DailyHealthFeature& f) {
    double deduction = f.impossibleJumpCount * 12.0
                     + f.gpsDriftRatio * 100.0 * 0.7
                     + (f.lowSampleDay ? 20.0 : 0.0)
                     + (100.0 - f.dataCompletenessPct) * 0.5;
    return cappedComponent(deduction, 85.0);
}

int HealthScorer::confidenceScore(const DailyHealthFeature& f) {
    double anomaly = std::min(100.0, f.impossibleJumpCount * 15.0 + f.gpsDriftRatio * 100.0 * 40.0);
    return clampScore(f.dataCompletenessPct * 0.7 + (100.0 - anomaly) * 0.3);
}

HealthTrend HealthScorer::trendFor(int score, std::optional<int> previousScore) {
    if (score < 40) {
        return HealthTrend::Critical;
    }
    if (!previousScore) {
        return HealthTrend::Stable;
    }
    int delta = score - *previousScore;
    if (delta >= 8) {
        return HealthTrend::Improving;
    }
    if (delta <= -8) {
        return HealthTrend::Declining;
    }
    return HealthTrend::Stable;
}

DailyHealthScore HealthScorer::score(const DailyHealthFeature& f, std::optional<int> previousScore) const {
    requireFinite(f.maxGapMinutes, "max_gap_minutes");
    requireFinite(f.speedingExposurePct, "speeding_exposure_pct");
    requireFinite(f.gpsDriftRatio, "gps_drift_ratio");
    requireFinite(f.distanceKm, "distance_km");
    requireFinite(f.idleMinutes, "idle_minutes");
    requireFinite(f.dataCompletenessPct, "data_completeness_pct");

    DailyHealthScore result;
    result.vehicleId = f.vehicleId;
    result.date = f.date;
    result.modelVersion = kModelVersion;
    result.previousScore = previousScore;

    result.connectivityScore = connectivityScore(f);
    result.safetyScore = safetyScore(f);
    result.utilizationScore = utilizationScore(f);
    result.dataQualityScore = dataQualityScore(f);

    double raw = 0.35 * result.connectivityScore
               + 0.30 * result.safetyScore
               + 0.20 * result.utilizationScore
               + 0.15 * result.dataQualityScore;

    if (f.maxGapMinutes >= 240.0) raw -= 10.0;
    if (f.impossibleJumpCount >= 3) raw -= 15.0;
    if (f.speedingExposurePct >= 20.0) raw -= 10.0;

    int health = clampScore(raw);
    int confidence = confidenceScore(f);

    // A sparse or noisy day cannot report a near-perfect score
    if (confidence < 35) {
        health = std::min(health, 75);
    } else if (confidence < 50) {
        health = std::min(health, 85);
    }

    result.healthScore = health;
    result.confidenceScore = confidence;
    result.trend = trendFor(health, previousScore);
    return result;
}

} // namespace fleetsense::domain
