#pragma once

#include "../PositionSample.hpp"
#include <string>
#include <vector>

namespace fleetsense::ports {

class IPositionStore {
public:
    virtual ~IPositionStore() = default;

    // Returns false when (vehicle_id, timestamp) is already stored.
    virtual bool append(const PositionSample& sample) = 0;

    // Samples with timestamp in [from, to), ascending.
    virtual std::vector<PositionSample> range(const std::string& vehicleId,
                                              Timestamp from, Timestamp to) const = 0;

    // Samples in [from, to) within radiusMeters of center, ascending.
    virtual std::vector<PositionSample> nearby(const std::string& vehicleId, const GeoPoint& center,
                                               double radiusMeters, Timestamp from, Timestamp to) const = 0;

    // Vehicles with at least one sample in [from, to), sorted.
    virtual std::vector<std::string> activeVehicles(Timestamp from, Timestamp to) const = 0;
};

} // namespace fleetsense::ports
