#include "PositionSample.hpp"
#include "Errors.hpp"
#include <cmath>

namespace fleetsense {

void validateSample(const PositionSample& sample) {
    if (sample.vehicleId.empty()) {
        throw InputError("Sample without vehicle id");
    }
    if (!std::isfinite(sample.latitude) || sample.latitude < -90.0 || sample.latitude > 90.0) {
        throw InputError("Latitude out of range for " + sample.vehicleId);
    }
    if (!std::isfinite(sample.longitude) || sample.longitude < -180.0 || sample.longitude > 180.0) {
        throw InputError("Longitude out of range for " + sample.vehicleId);
    }
    if (!std::isfinite(sample.speedKph) || sample.speedKph < 0.0) {
        throw InputError("Invalid speed for " + sample.vehicleId);
    }
    if (sample.batteryPercent &&
        (!std::isfinite(*sample.batteryPercent) || *sample.batteryPercent < 0.0 || *sample.batteryPercent > 100.0)) {
        throw InputError("Battery percent out of range for " + sample.vehicleId);
    }
    if (sample.odometerMeters && (!std::isfinite(*sample.odometerMeters) || *sample.odometerMeters < 0.0)) {
        throw InputError("Negative odometer for " + sample.vehicleId);
    }
    if (toEpochSeconds(sample.timestamp) <= 0) {
        throw InputError("Missing timestamp for " + sample.vehicleId);
    }
}

bool sampleLess(const PositionSample& a, const PositionSample& b) {
    if (a.vehicleId != b.vehicleId) {
        return a.vehicleId < b.vehicleId;
    }
    return a.timestamp < b.timestamp;
}

} // namespace fleetsense
