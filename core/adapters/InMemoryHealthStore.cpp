#include "InMemoryHealthStore.hpp"

namespace fleetsense::adapters {

void InMemoryHealthStore::upsert(const DailyHealthFeature& feature, const DailyHealthScore& score) {
    std::lock_guard<std::mutex> lock(mutex_);
    rows_[score.vehicleId][score.date.toDays()] = Row{feature, score};
}

std::optional<DailyHealthFeature> InMemoryHealthStore::feature(const std::string& vehicleId,
                                                               const CalendarDate& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto vehicle = rows_.find(vehicleId);
    if (vehicle == rows_.end()) {
        return std::nullopt;
    }
    auto row = vehicle->second.find(date.toDays());
    if (row == vehicle->second.end()) {
        return std::nullopt;
    }
    return row->second.feature;
}

std::optional<DailyHealthScore> InMemoryHealthStore::score(const std::string& vehicleId,
                                                           const CalendarDate& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto vehicle = rows_.find(vehicleId);
    if (vehicle == rows_.end()) {
        return std::nullopt;
    }
    auto row = vehicle->second.find(date.toDays());
    if (row == vehicle->second.end()) {
        return std::nullopt;
    }
    return row->second.score;
}

std::optional<DailyHealthScore> InMemoryHealthStore::latestBefore(const std::string& vehicleId,
                                                                  const CalendarDate& date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto vehicle = rows_.find(vehicleId);
    if (vehicle == rows_.end()) {
        return std::nullopt;
    }
    auto it = vehicle->second.lower_bound(date.toDays());
    if (it == vehicle->second.begin()) {
        return std::nullopt;
    }
    --it;
    return it->second.score;
}

std::vector<DailyHealthScore> InMemoryHealthStore::range(const std::string& vehicleId,
                                                         const CalendarDate& from,
                                                         const CalendarDate& to) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DailyHealthScore> result;
    auto vehicle = rows_.find(vehicleId);
    if (vehicle == rows_.end()) {
        return result;
    }
    auto end = vehicle->second.upper_bound(to.toDays());
    for (auto it = vehicle->second.lower_bound(from.toDays()); it != end; ++it) {
        result.push_back(it->second.score);
    }
    return result;
}

} // namespace fleetsense::adapters
