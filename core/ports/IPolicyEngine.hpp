#pragma once

#include "../VehicleEvent.hpp"
#include <chrono>

namespace fleetsense::ports {

struct RetryPolicy {
    virtual ~RetryPolicy() = default;
    virtual std::chrono::milliseconds getBackoffDelay(int attemptCount) const = 0;
    virtual bool shouldRetry(int attemptCount) const = 0;
};

// Minimum spacing between two events of one type for one vehicle.
struct CooldownPolicy {
    virtual ~CooldownPolicy() = default;
    virtual std::chrono::seconds getCooldown(EventType type) const = 0;
};

struct RetentionPolicy {
    virtual ~RetentionPolicy() = default;
    virtual std::chrono::hours getLifetime(EventType type) const = 0;
    virtual bool isPurgeEligible(const VehicleEvent& event, Timestamp now) const = 0;
};

class IPolicyEngine {
public:
    virtual ~IPolicyEngine() = default;

    virtual const RetryPolicy& getRetryPolicy() const = 0;
    virtual const CooldownPolicy& getCooldownPolicy() const = 0;
    virtual const RetentionPolicy& getRetentionPolicy() const = 0;
};

} // namespace fleetsense::ports
