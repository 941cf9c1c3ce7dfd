#pragma once

#include "../Trip.hpp"
#include <optional>
#include <string>
#include <vector>

namespace fleetsense::ports {

struct TripFilter {
    std::string vehicleId;
    std::optional<Timestamp> from;   ///< Inclusive, on start_time
    std::optional<Timestamp> to;     ///< Exclusive, on start_time
    std::optional<TripSource> source;
};

class ITripStore {
public:
    virtual ~ITripStore() = default;

    // Atomically drops the vehicle's trips of this source starting in
    // [from, to) and stores the given trips in their place.
    virtual void replaceRange(const std::string& vehicleId, TripSource source,
                              Timestamp from, Timestamp to,
                              const std::vector<Trip>& trips) = 0;

    // Ascending by start time.
    virtual std::vector<Trip> query(const TripFilter& filter) const = 0;
};

} // namespace fleetsense::ports
