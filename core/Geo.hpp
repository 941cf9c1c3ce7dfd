#pragma once

#include "PositionSample.hpp"
#include <vector>

namespace fleetsense {

class Geo {
public:
    static double distanceMeters(double lat1, double lon1, double lat2, double lon2);
    static double distanceMeters(const GeoPoint& a, const GeoPoint& b);
    static double distanceKm(const GeoPoint& a, const GeoPoint& b);

    // Sum of great-circle legs between consecutive samples.
    static double pathLengthKm(const std::vector<PositionSample>& samples);

    // Centroid of the two-point set {a, b}, taken across the shorter
    // longitude arc so points either side of 180 degrees stay together.
    // Symmetric in its arguments.
    static GeoPoint midpoint(const GeoPoint& a, const GeoPoint& b);

    // Longitude difference folded into [-180, 180].
    static double wrapLongitudeDelta(double delta);

    // Longitude folded into (-180, 180].
    static double normalizeLongitude(double lon);

    static bool isWithinRadius(const GeoPoint& point, const GeoPoint& center, double radiusMeters);

private:
    static constexpr double EARTH_RADIUS_METERS = 6371000.0;
    static double toRadians(double degrees);
};

} // namespace fleetsense
