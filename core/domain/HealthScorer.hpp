#pragma once

#include "../HealthRecord.hpp"
#include <optional>

namespace fleetsense::domain {

/**
 * @brief Deterministic daily health model
 *
 * Four capped component deductions, a weighted blend, flat anomaly
 * penalties, and a confidence ceiling. Output depends only on the features
 * and the previous day's score.
 */
class HealthScorer {
public:
    static constexpr const char* kModelVersion = "daily-gps-health-v1";

    /**
     * @throws ComputationError if a feature is not finite
     */
    DailyHealthScore score(const DailyHealthFeature& feature, std::optional<int> previousScore) const;

    static int connectivityScore(const DailyHealthFeature& feature);
    static int safetyScore(const DailyHealthFeature& feature);
    static int utilizationScore(const DailyHealthFeature& feature);
    static int dataQualityScore(const DailyHealthFeature& feature);

    static int confidenceScore(const DailyHealthFeature& feature);
    static HealthTrend trendFor(int score, std::optional<int> previousScore);
};

} // namespace fleetsense::domain
