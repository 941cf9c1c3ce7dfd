#pragma once

#include "TimeUtil.hpp"
#include <optional>
#include <string>

namespace fleetsense {

struct GeoPoint {
    double lat = 0.0;
    double lon = 0.0;
};

/**
 * @brief One timestamped position/status reading for a vehicle
 *
 * Owned by the ingestion collaborator. Immutable once accepted.
 */
struct PositionSample {
    std::string vehicleId;
    Timestamp timestamp;
    double latitude = 0.0;
    double longitude = 0.0;
    double speedKph = 0.0;
    bool ignitionOn = false;
    std::optional<double> batteryPercent;
    std::optional<double> odometerMeters;  ///< Cumulative odometer
    bool isOnline = true;

    GeoPoint point() const { return GeoPoint{latitude, longitude}; }
};

// Throws InputError when a field is missing or out of range.
void validateSample(const PositionSample& sample);

// Strict ordering used by buffers and stores: vehicle, then timestamp.
bool sampleLess(const PositionSample& a, const PositionSample& b);

} // namespace fleetsense
