#pragma once

#include "Trip.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace fleetsense {

struct DetectorConfig {
    double lowBatteryPct = 20.0;
    double criticalBatteryPct = 10.0;
    double overspeedKph = 100.0;
    double overspeedErrorKph = 120.0;
    double overspeedCriticalKph = 140.0;
    double rapidAccelerationDeltaKph = 30.0;
    double harshBrakingDeltaKph = 40.0;
    double movingSpeedKph = 5.0;
    double idleSpeedKph = 5.0;
    std::chrono::minutes idleThreshold{30};
    std::chrono::minutes idleLookback{120};
    std::chrono::minutes defaultCooldown{5};
    std::chrono::minutes movingCooldown{10};
};

struct TripConfig {
    std::chrono::seconds maxSampleGap{180};   ///< Ignition-on gap that splits a trip
    std::chrono::seconds idleTimeout{180};    ///< Zero-speed run that ends an idle-timeout trip
    double noiseFloorKm = 0.05;
    bool spikeFilterEnabled = true;
    double spikeMaxJumpKm = 10.0;
    double spikeMaxSpeedKph = 250.0;
};

struct LocationConfig {
    double clusterRadiusMeters = 50.0;
    double minDwellMinutes = 15.0;
    double idleDwellSpeedKph = 2.0;
    int historyWindowDays = 30;
    int classifyAfterVisits = 3;
    double nearbyDefaultRadiusMeters = 100.0;
};

struct HealthConfig {
    int workerCount = 4;
    int recomputeDays = 2;
    TripSource tripSource = TripSource::IdleTimeout;
};

struct PipelineConfig {
    std::chrono::seconds reorderWindow{30};
};

struct RetentionConfig {
    int maxAgeDays = 30;
    int infoMaxAgeDays = 7;
};

struct MqttConfig {
    std::string host;
    std::uint16_t port = 1883;
    std::string clientId = "fleetsense";
    std::string username;
    std::string password;
    bool useTls = false;
    std::string caPath;
    std::string certPath;
    std::string keyPath;
    std::string positionTopic = "fleet/+/positions";
    std::string eventTopicPrefix = "fleet";

    bool isConfigured() const { return !host.empty(); }
};

struct InsightConfig {
    int utcOffsetMinutes = 0;   ///< Local time used for dates and hour-of-day buckets

    DetectorConfig detector;
    TripConfig trips;
    LocationConfig locations;
    HealthConfig health;
    PipelineConfig pipeline;
    RetentionConfig retention;
    MqttConfig mqtt;

    // Empty when the configuration is usable.
    std::vector<std::string> validate() const;
};

} // namespace fleetsense
