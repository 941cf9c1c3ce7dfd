#pragma once

#include "TimeUtil.hpp"
#include <optional>
#include <string>

namespace fleetsense {

enum class HealthTrend {
    Improving,
    Stable,
    Declining,
    Critical
};

/**
 * @brief Pure aggregation of one vehicle-day of telemetry
 */
struct DailyHealthFeature {
    std::string vehicleId;
    CalendarDate date;

    int pointsCount = 0;
    int transitionCount = 0;
    std::optional<double> avgSamplingIntervalMinutes;
    double maxGapMinutes = 0.0;

    std::optional<double> avgBatteryPercent;
    std::optional<double> minBatteryPercent;

    double speedingExposurePct = 0.0;
    int impossibleJumpCount = 0;
    double gpsDriftRatio = 0.0;

    int tripCount = 0;
    double distanceKm = 0.0;
    double movingMinutes = 0.0;

    int idleEventCount = 0;
    double idleMinutes = 0.0;
    int overspeedEventCount = 0;
    int harshEventCount = 0;
    int offlineEventCount = 0;

    bool lowSampleDay = true;
    int expectedPoints = 288;
    double dataCompletenessPct = 0.0;
};

struct DailyHealthScore {
    std::string vehicleId;
    CalendarDate date;

    int healthScore = 0;
    int confidenceScore = 0;
    HealthTrend trend = HealthTrend::Stable;
    std::optional<int> previousScore;

    int connectivityScore = 0;
    int safetyScore = 0;
    int utilizationScore = 0;
    int dataQualityScore = 0;

    std::string modelVersion;
};

std::string healthTrendToString(HealthTrend trend);

} // namespace fleetsense
