#pragma once

#include "../VehicleEvent.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fleetsense::ports {

struct EventFilter {
    std::optional<std::string> vehicleId;
    std::optional<bool> acknowledged;
    std::optional<Severity> severity;
    std::optional<EventType> type;
    std::optional<Timestamp> from;          ///< Inclusive, on created_at
    std::optional<Timestamp> to;            ///< Exclusive, on created_at
    std::optional<Timestamp> notExpiredAt;  ///< Drop events whose expires_at is before this instant
    std::size_t limit = 0;                  ///< 0 means unlimited
};

class IEventStore {
public:
    virtual ~IEventStore() = default;

    /**
     * @brief Insert unless an event of the same (vehicle, type) lies within cooldown
     * @return true if inserted, false if suppressed or already stored
     * @note Check and insert are atomic with respect to other inserts
     */
    virtual bool insertWithCooldown(const VehicleEvent& event, std::chrono::seconds cooldown) = 0;

    // Newest first.
    virtual std::vector<VehicleEvent> query(const EventFilter& filter) const = 0;
    virtual std::optional<VehicleEvent> find(const std::string& id) const = 0;

    // Idempotent. Returns false only when the id is unknown.
    virtual bool acknowledge(const std::string& id) = 0;

    // Deletes every event for which eligible() is true and returns the count.
    virtual std::size_t purge(const std::function<bool(const VehicleEvent&)>& eligible) = 0;
};

} // namespace fleetsense::ports
