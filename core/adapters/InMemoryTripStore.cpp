#include "InMemoryTripStore.hpp"
#include <algorithm>

namespace fleetsense::adapters {

void InMemoryTripStore::replaceRange(const std::string& vehicleId, TripSource source,
                                     Timestamp from, Timestamp to,
                                     const std::vector<Trip>& trips) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& vehicleTrips = trips_[vehicleId];

    for (auto it = vehicleTrips.begin(); it != vehicleTrips.end();) {
        const auto& trip = it->second;
        if (trip.sourceMethod == source && !(trip.startTime < from) && trip.startTime < to) {
            it = vehicleTrips.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto& trip : trips) {
        vehicleTrips[trip.id] = trip;
    }
}

std::vector<Trip> InMemoryTripStore::query(const ports::TripFilter& filter) const {
    std::vector<Trip> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = trips_.find(filter.vehicleId);
        if (it == trips_.end()) {
            return result;
        }

        for (const auto& entry : it->second) {
            const auto& trip = entry.second;
            if (filter.source && trip.sourceMethod != *filter.source) continue;
            if (filter.from && trip.startTime < *filter.from) continue;
            if (filter.to && !(trip.startTime < *filter.to)) continue;
            result.push_back(trip);
        }
    }

    std::sort(result.begin(), result.end(), [](const Trip& a, const Trip& b) {
        if (a.startTime != b.startTime) {
            return a.startTime < b.startTime;
        }
        return a.sourceMethod < b.sourceMethod;
    });
    return result;
}

} // namespace fleetsense::adapters
