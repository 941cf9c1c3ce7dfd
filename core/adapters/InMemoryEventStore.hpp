#pragma once

#include "../ports/IEventStore.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>

namespace fleetsense::adapters {

class InMemoryEventStore : public ports::IEventStore {
public:
    InMemoryEventStore() = default;
    ~InMemoryEventStore() override = default;

    bool insertWithCooldown(const VehicleEvent& event, std::chrono::seconds cooldown) override;
    std::vector<VehicleEvent> query(const ports::EventFilter& filter) const override;
    std::optional<VehicleEvent> find(const std::string& id) const override;
    bool acknowledge(const std::string& id) override;
    std::size_t purge(const std::function<bool(const VehicleEvent&)>& eligible) override;

    std::size_t size() const;

private:
    // (vehicle_id, type) -> created_at epoch seconds -> event id
    using DebounceKey = std::pair<std::string, EventType>;

    std::unordered_map<std::string, VehicleEvent> events_;
    std::map<DebounceKey, std::multimap<std::int64_t, std::string>> debounceIndex_;
    mutable std::mutex mutex_;
};

} // namespace fleetsense::adapters
