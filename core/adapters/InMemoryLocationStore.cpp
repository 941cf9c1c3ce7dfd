#include "InMemoryLocationStore.hpp"

namespace fleetsense::adapters {

std::vector<LearnedLocation> InMemoryLocationStore::forVehicle(const std::string& vehicleId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LearnedLocation> result;
    for (const auto& entry : locations_) {
        if (entry.second.vehicleId == vehicleId) {
            result.push_back(entry.second);
        }
    }
    return result;
}

std::optional<LearnedLocation> InMemoryLocationStore::find(const std::string& locationId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locations_.find(locationId);
    if (it == locations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryLocationStore::upsert(const LearnedLocation& location) {
    std::lock_guard<std::mutex> lock(mutex_);
    locations_[location.id] = location;
}

std::vector<VisitPattern> InMemoryLocationStore::patterns(const std::string& locationId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<VisitPattern> result;
    auto it = patterns_.find(locationId);
    if (it != patterns_.end()) {
        for (const auto& entry : it->second) {
            result.push_back(entry.second);
        }
    }
    return result;
}

void InMemoryLocationStore::upsertPattern(const VisitPattern& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    patterns_[pattern.locationId][pattern.dayPart] = pattern;
}

} // namespace fleetsense::adapters
