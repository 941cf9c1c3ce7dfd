#include "Geo.hpp"
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace fleetsense {

double Geo::distanceMeters(double lat1, double lon1, double lat2, double lon2) {
    double dLat = toRadians(lat2 - lat1);
    double dLon = toRadians(lon2 - lon1);

    double a = std::sin(dLat/2) * std::sin(dLat/2) +
               std::cos(toRadians(lat1)) * std::cos(toRadians(lat2)) *
               std::sin(dLon/2) * std::sin(dLon/2);

    double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1-a));
    return EARTH_RADIUS_METERS * c;
}

double Geo::distanceMeters(const GeoPoint& a, const GeoPoint& b) {
    return distanceMeters(a.lat, a.lon, b.lat, b.lon);
}

double Geo::distanceKm(const GeoPoint& a, const GeoPoint& b) {
    return distanceMeters(a, b) / 1000.0;
}

double Geo::pathLengthKm(const std::vector<PositionSample>& samples) {
    double total = 0.0;
    for (size_t i = 1; i < samples.size(); ++i) {
        total += distanceKm(samples[i - 1].point(), samples[i].point());
    }
    return total;
}

GeoPoint Geo::midpoint(const GeoPoint& a, const GeoPoint& b) {
    // Walk the short way round from the western point so argument order
    // cannot change the result
    const GeoPoint& west = (a.lon <= b.lon) ? a : b;
    const GeoPoint& east = (a.lon <= b.lon) ? b : a;
    return GeoPoint{(a.lat + b.lat) / 2.0,
                    normalizeLongitude(west.lon + wrapLongitudeDelta(east.lon - west.lon) / 2.0)};
}

double Geo::wrapLongitudeDelta(double delta) {
    if (delta > 180.0) return delta - 360.0;
    if (delta < -180.0) return delta + 360.0;
    return delta;
}

double Geo::normalizeLongitude(double lon) {
    if (lon > 180.0) return lon - 360.0;
    if (lon <= -180.0) return lon + 360.0;
    return lon;
}

bool Geo::isWithinRadius(const GeoPoint& point, const GeoPoint& center, double radiusMeters) {
    return distanceMeters(point, center) <= radiusMeters;
}

double Geo::toRadians(double degrees) {
    return degrees * M_PI / 180.0;
}

} // namespace fleetsense
