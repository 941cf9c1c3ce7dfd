#pragma once

#include "PositionSample.hpp"
#include "TimeUtil.hpp"
#include <string>

namespace fleetsense {

enum class TripSource {
    Ignition,
    IdleTimeout
};

struct Trip {
    std::string id;
    std::string vehicleId;
    Timestamp startTime;
    Timestamp endTime;
    GeoPoint startPoint;
    GeoPoint endPoint;
    double distanceKm = 0.0;
    double maxSpeedKph = 0.0;
    double avgSpeedKph = 0.0;
    double durationMinutes = 0.0;
    bool distanceFromOdometer = false;
    TripSource sourceMethod = TripSource::Ignition;
};

std::string tripSourceToString(TripSource source);
TripSource stringToTripSource(const std::string& str);

} // namespace fleetsense
