#include "InMemoryEventStore.hpp"
#include <algorithm>

namespace fleetsense::adapters {

bool InMemoryEventStore::insertWithCooldown(const VehicleEvent& event, std::chrono::seconds cooldown) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (events_.count(event.id) != 0) {
        return false;
    }

    // Any same-key event with |created_at delta| < cooldown suppresses, in
    // either direction, so late samples cannot slip in before an existing one.
    auto& index = debounceIndex_[{event.vehicleId, event.type}];
    std::int64_t created = toEpochSeconds(event.createdAt);
    std::int64_t window = cooldown.count();
    auto lower = index.upper_bound(created - window);
    if (lower != index.end() && lower->first < created + window) {
        return false;
    }

    index.emplace(created, event.id);
    events_.emplace(event.id, event);
    return true;
}

std::vector<VehicleEvent> InMemoryEventStore::query(const ports::EventFilter& filter) const {
    std::vector<VehicleEvent> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : events_) {
            const auto& event = entry.second;
            if (filter.vehicleId && event.vehicleId != *filter.vehicleId) continue;
            if (filter.acknowledged && event.acknowledged != *filter.acknowledged) continue;
            if (filter.severity && event.severity != *filter.severity) continue;
            if (filter.type && event.type != *filter.type) continue;
            if (filter.from && event.createdAt < *filter.from) continue;
            if (filter.to && !(event.createdAt < *filter.to)) continue;
            if (filter.notExpiredAt && event.isExpired(*filter.notExpiredAt)) continue;
            result.push_back(event);
        }
    }

    std::sort(result.begin(), result.end(), [](const VehicleEvent& a, const VehicleEvent& b) {
        if (a.createdAt != b.createdAt) {
            return a.createdAt > b.createdAt;
        }
        return a.id < b.id;
    });

    if (filter.limit > 0 && result.size() > filter.limit) {
        result.resize(filter.limit);
    }
    return result;
}

std::optional<VehicleEvent> InMemoryEventStore::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = events_.find(id);
    if (it == events_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryEventStore::acknowledge(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = events_.find(id);
    if (it == events_.end()) {
        return false;
    }
    it->second.acknowledged = true;
    return true;
}

std::size_t InMemoryEventStore::purge(const std::function<bool(const VehicleEvent&)>& eligible) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;

    for (auto it = events_.begin(); it != events_.end();) {
        if (!eligible(it->second)) {
            ++it;
            continue;
        }

        auto& index = debounceIndex_[{it->second.vehicleId, it->second.type}];
        auto range = index.equal_range(toEpochSeconds(it->second.createdAt));
        for (auto pos = range.first; pos != range.second; ++pos) {
            if (pos->second == it->first) {
                index.erase(pos);
                break;
            }
        }

        it = events_.erase(it);
        ++removed;
    }
    return removed;
}

std::size_t InMemoryEventStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

} // namespace fleetsense::adapters
