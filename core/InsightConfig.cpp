#include "InsightConfig.hpp"

namespace fleetsense {

std::vector<std::string> InsightConfig::validate() const {
    std::vector<std::string> problems;

    if (utcOffsetMinutes < -14 * 60 || utcOffsetMinutes > 14 * 60) {
        problems.push_back("utc_offset_minutes must be within +/-840");
    }
    if (detector.criticalBatteryPct >= detector.lowBatteryPct) {
        problems.push_back("detector.critical_battery_pct must be below low_battery_pct");
    }
    if (detector.overspeedKph <= 0.0 || detector.overspeedErrorKph < detector.overspeedKph ||
        detector.overspeedCriticalKph < detector.overspeedErrorKph) {
        problems.push_back("detector overspeed thresholds must be positive and ascending");
    }
    if (detector.defaultCooldown.count() < 0 || detector.movingCooldown.count() < 0) {
        problems.push_back("detector cooldowns must not be negative");
    }
    if (detector.idleLookback < detector.idleThreshold) {
        problems.push_back("detector.idle_lookback_minutes must cover idle_threshold_minutes");
    }
    if (trips.maxSampleGap.count() <= 0 || trips.idleTimeout.count() <= 0) {
        problems.push_back("trips gap and idle timeout must be positive");
    }
    if (trips.noiseFloorKm < 0.0) {
        problems.push_back("trips.noise_floor_km must not be negative");
    }
    if (locations.clusterRadiusMeters <= 0.0) {
        problems.push_back("locations.cluster_radius_m must be positive");
    }
    if (locations.historyWindowDays <= 0) {
        problems.push_back("locations.history_window_days must be positive");
    }
    if (health.workerCount < 1) {
        problems.push_back("health.workers must be at least 1");
    }
    if (health.recomputeDays < 1 || health.recomputeDays > 3) {
        problems.push_back("health.recompute_days must be between 1 and 3");
    }
    if (pipeline.reorderWindow.count() < 0) {
        problems.push_back("pipeline.reorder_window_seconds must not be negative");
    }
    if (retention.infoMaxAgeDays <= 0 || retention.maxAgeDays < retention.infoMaxAgeDays) {
        problems.push_back("retention ages must be positive with info_max_age_days <= max_age_days");
    }
    if (mqtt.useTls && mqtt.caPath.empty()) {
        problems.push_back("mqtt.ca_path is required when use_tls is true");
    }

    return problems;
}

} // namespace fleetsense
