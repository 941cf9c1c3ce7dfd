#pragma once

#include "../ports/IPolicyEngine.hpp"
#include "../InsightConfig.hpp"
#include <algorithm>
#include <cmath>

namespace fleetsense::adapters {

class ExponentialBackoffRetryPolicy : public ports::RetryPolicy {
public:
    ExponentialBackoffRetryPolicy(std::chrono::milliseconds baseDelay = std::chrono::milliseconds(1000),
                                double multiplier = 2.0,
                                std::chrono::milliseconds maxDelay = std::chrono::minutes(5),
                                int maxAttempts = 5)
        : baseDelay_(baseDelay), multiplier_(multiplier), maxDelay_(maxDelay), maxAttempts_(maxAttempts) {}

    std::chrono::milliseconds getBackoffDelay(int attemptCount) const override {
        auto delay = std::chrono::milliseconds(static_cast<long long>(
            baseDelay_.count() * std::pow(multiplier_, attemptCount - 1)));
        return std::min(delay, maxDelay_);
    }

    bool shouldRetry(int attemptCount) const override {
        return attemptCount < maxAttempts_;
    }

private:
    std::chrono::milliseconds baseDelay_;
    double multiplier_;
    std::chrono::milliseconds maxDelay_;
    int maxAttempts_;
};

class TypedCooldownPolicy : public ports::CooldownPolicy {
public:
    TypedCooldownPolicy(std::chrono::seconds defaultCooldown = std::chrono::minutes(5),
                       std::chrono::seconds movingCooldown = std::chrono::minutes(10))
        : defaultCooldown_(defaultCooldown), movingCooldown_(movingCooldown) {}

    std::chrono::seconds getCooldown(EventType type) const override {
        return type == EventType::VehicleMoving ? movingCooldown_ : defaultCooldown_;
    }

private:
    std::chrono::seconds defaultCooldown_;
    std::chrono::seconds movingCooldown_;
};

class TieredRetentionPolicy : public ports::RetentionPolicy {
public:
    TieredRetentionPolicy(int maxAgeDays = 30, int infoMaxAgeDays = 7)
        : maxAge_(std::chrono::hours(24 * maxAgeDays)),
          infoMaxAge_(std::chrono::hours(24 * infoMaxAgeDays)) {}

    std::chrono::hours getLifetime(EventType type) const override {
        switch (type) {
            case EventType::IgnitionOn:
            case EventType::IgnitionOff:
                return std::chrono::hours(2);
            case EventType::TripCompleted:
                return std::chrono::hours(4);
            case EventType::VehicleMoving:
            case EventType::Online:
                return std::chrono::hours(1);
            default:
                return std::chrono::hours(24);
        }
    }

    bool isPurgeEligible(const VehicleEvent& event, Timestamp now) const override {
        if (event.acknowledged && event.isExpired(now)) {
            return true;
        }
        // The age limit applies whether or not the event was acknowledged
        if (event.createdAt < now - maxAge_) {
            return true;
        }
        return event.severity == Severity::Info && event.createdAt < now - infoMaxAge_;
    }

private:
    std::chrono::hours maxAge_;
    std::chrono::hours infoMaxAge_;
};

class DefaultPolicyEngine : public ports::IPolicyEngine {
public:
    DefaultPolicyEngine() = default;

    explicit DefaultPolicyEngine(const InsightConfig& config,
                                 ExponentialBackoffRetryPolicy retryPolicy = ExponentialBackoffRetryPolicy())
        : retryPolicy_(retryPolicy),
          cooldownPolicy_(config.detector.defaultCooldown, config.detector.movingCooldown),
          retentionPolicy_(config.retention.maxAgeDays, config.retention.infoMaxAgeDays) {}

    const ports::RetryPolicy& getRetryPolicy() const override {
        return retryPolicy_;
    }

    const ports::CooldownPolicy& getCooldownPolicy() const override {
        return cooldownPolicy_;
    }

    const ports::RetentionPolicy& getRetentionPolicy() const override {
        return retentionPolicy_;
    }

private:
    ExponentialBackoffRetryPolicy retryPolicy_;
    TypedCooldownPolicy cooldownPolicy_;
    TieredRetentionPolicy retentionPolicy_;
};

} // namespace fleetsense::adapters
