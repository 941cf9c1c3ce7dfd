#include "InMemoryPositionStore.hpp"
#include "../Geo.hpp"

namespace fleetsense::adapters {

bool InMemoryPositionStore::append(const PositionSample& sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& timeline = timelines_[sample.vehicleId];
    return timeline.emplace(toEpochSeconds(sample.timestamp), sample).second;
}

std::vector<PositionSample> InMemoryPositionStore::range(const std::string& vehicleId,
                                                         Timestamp from, Timestamp to) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PositionSample> result;

    auto it = timelines_.find(vehicleId);
    if (it == timelines_.end()) {
        return result;
    }

    const auto& timeline = it->second;
    auto end = timeline.lower_bound(toEpochSeconds(to));
    for (auto pos = timeline.lower_bound(toEpochSeconds(from)); pos != end; ++pos) {
        result.push_back(pos->second);
    }
    return result;
}

std::vector<PositionSample> InMemoryPositionStore::nearby(const std::string& vehicleId, const GeoPoint& center,
                                                          double radiusMeters, Timestamp from, Timestamp to) const {
    std::vector<PositionSample> result;
    for (auto& sample : range(vehicleId, from, to)) {
        if (Geo::isWithinRadius(sample.point(), center, radiusMeters)) {
            result.push_back(std::move(sample));
        }
    }
    return result;
}

std::vector<std::string> InMemoryPositionStore::activeVehicles(Timestamp from, Timestamp to) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> vehicles;

    for (const auto& [vehicleId, timeline] : timelines_) {
        auto first = timeline.lower_bound(toEpochSeconds(from));
        if (first != timeline.end() && first->first < toEpochSeconds(to)) {
            vehicles.push_back(vehicleId);
        }
    }
    return vehicles;
}

std::size_t InMemoryPositionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& entry : timelines_) {
        total += entry.second.size();
    }
    return total;
}

} // namespace fleetsense::adapters
