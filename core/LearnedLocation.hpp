#pragma once

#include "PositionSample.hpp"
#include "TimeUtil.hpp"
#include <optional>
#include <string>

namespace fleetsense {

enum class LocationType {
    Home,
    Work,
    Parking,
    Frequent,
    Unknown
};

enum class DayPart {
    Morning,    // 05-11
    Afternoon,  // 12-16
    Evening,    // 17-21
    Night
};

struct LearnedLocation {
    std::string id;
    std::string vehicleId;
    GeoPoint centroid;
    double radiusMeters = 50.0;
    int visitCount = 0;
    double totalDurationMinutes = 0.0;
    Timestamp firstVisit;
    Timestamp lastVisit;
    LocationType locationType = LocationType::Unknown;
    double confidence = 0.0;
    std::optional<std::string> customLabel;
    std::optional<int> typicalArrivalHour;
};

// One row of the per-cluster time-of-day table.
struct VisitPattern {
    std::string locationId;
    DayPart dayPart = DayPart::Night;
    int visitCount = 0;
    double typicalHour = 0.0;
    double avgDurationMinutes = 0.0;
};

// A park or idle episode long enough to be clustered.
struct DwellPoint {
    std::string vehicleId;
    GeoPoint point;
    Timestamp arrival;
    double durationMinutes = 0.0;
};

std::string locationTypeToString(LocationType type);
LocationType stringToLocationType(const std::string& str);

std::string dayPartToString(DayPart part);
DayPart dayPartForHour(int hour);

} // namespace fleetsense
