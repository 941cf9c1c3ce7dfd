#include "EventDetector.hpp"
#include "../Errors.hpp"
#include "RecordId.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fleetsense::domain {

namespace {

std::string formatNumber(double value, int precision = 0) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

EventDetector::EventDetector(DetectorConfig config, std::shared_ptr<ports::IPolicyEngine> policyEngine)
    : config_(config), policyEngine_(policyEngine) {
    rules_ = {
        {"battery", &EventDetector::batteryRule},
        {"overspeed", &EventDetector::overspeedRule},
        {"rapid_acceleration", &EventDetector::accelerationRule},
        {"harsh_braking", &EventDetector::brakingRule},
        {"ignition", &EventDetector::ignitionRule},
        {"moving_again", &EventDetector::movingAgainRule},
        {"idle", &EventDetector::idleRule},
        {"connectivity", &EventDetector::connectivityRule},
    };
}

std::vector<VehicleEvent> EventDetector::evaluate(DetectorState& state, const PositionSample& sample) const {
    std::vector<VehicleEvent> events;
    RuleContext ctx{state.previous ? &*state.previous : nullptr, sample, state};

    for (const auto& rule : rules_) {
        std::vector<VehicleEvent> ruleEvents;
        try {
            (this->*rule.fn)(ctx, ruleEvents);
        } catch (const StateGapError&) {
            continue;
        } catch (const std::exception& e) {
            std::cerr << "[EventDetector] Rule '" << rule.name << "' failed for "
                      << sample.vehicleId << " at " << formatIso8601(sample.timestamp)
                      << ": " << e.what() << std::endl;
            continue;
        }
        events.insert(events.end(), ruleEvents.begin(), ruleEvents.end());
    }

    advance(state, sample);
    return events;
}

std::vector<std::string> EventDetector::ruleNames() const {
    std::vector<std::string> names;
    for (const auto& rule : rules_) {
        names.emplace_back(rule.name);
    }
    return names;
}

void EventDetector::batteryRule(const RuleContext& ctx, std::vector<VehicleEvent>& out) const {
    const auto& current = ctx.current;
    if (!current.batteryPercent) {
        return;
    }

    double now = *current.batteryPercent;
    std::optional<double> before;
    if (ctx.previous) {
        before = ctx.previous->batteryPercent;
        if (!before) {
            // Previous reading unknown: no crossing can be established
            return;
        }
    }

    auto crossed = [&](double threshold) {
        return now < threshold && (!before || *before >= threshold);
    };

    EventType type;
    Severity severity;
    double threshold;
    std::string title;

    if (crossed(config_.criticalBatteryPct)) {
        type = EventType::CriticalBattery;
        severity = Severity::Critical;
        threshold = config_.criticalBatteryPct;
        title = "Critical Battery Level";
    } else if (now >= config_.criticalBatteryPct && crossed(config_.lowBatteryPct)) {
        type = EventType::LowBattery;
        severity = Severity::Warning;
        threshold = config_.lowBatteryPct;
        title = "Low Battery Warning";
    } else {
        return;
    }

    auto event = makeEvent(type, severity, current, title,
                           "Battery at " + formatNumber(now) + "%, below " + formatNumber(threshold) + "%");
    event.valueBefore = before;
    event.valueAfter = now;
    event.threshold = threshold;
    event.metadata["battery_percent"] = now;
    event.metadata["previous_percent"] = before ? nlohmann::json(*before) : nlohmann::json(nullptr);
    out.push_back(std::move(event));
}

void EventDetector::overspeedRule(const RuleContext& ctx, std::vector<VehicleEvent>& out) const {
    const auto& current = ctx.current;
    if (current.speedKph <= config_.overspeedKph) {
        return;
    }
    if (ctx.previous && ctx.previous->speedKph > config_.overspeedKph) {
        return;
    }

    Severity severity = Severity::Warning;
    if (current.speedKph > config_.overspeedCriticalKph) {
        severity = Severity::Critical;
    } else if (current.speedKph > config_.overspeedErrorKph) {
        severity = Severity::Error;
    }

    auto event = makeEvent(EventType::Overspeeding, severity, current, "Overspeeding Detected",
                           "Speed " + formatNumber(current.speedKph) + " km/h exceeds " +
                           formatNumber(config_.overspeedKph) + " km/h");
    event.valueAfter = current.speedKph;
    event.threshold = config_.overspeedKph;
    if (ctx.previous) {
        event.valueBefore = ctx.previous->speedKph;
    }
    event.metadata["speed"] = current.speedKph;
    event.metadata["threshold"] = config_.overspeedKph;
    event.metadata["previous_speed"] = ctx.previous ? nlohmann::json(ctx.previous->speedKph) : nlohmann::json(nullptr);
    out.push_back(std::move(event));
}

void EventDetector::accelerationRule(const RuleContext& ctx, std::vector<VehicleEvent>& out) const {
    const auto& previous = requirePrevious(ctx);
    double delta = ctx.current.speedKph - previous.speedKph;
    if (delta <= config_.rapidAccelerationDeltaKph) {
        return;
    }

    auto event = makeEvent(EventType::RapidAcceleration, Severity::Warning, ctx.current, "Rapid Acceleration",
                           "Speed rose from " + formatNumber(previous.speedKph) + " to " +
                           formatNumber(ctx.current.speedKph) + " km/h");
    event.valueBefore = previous.speedKph;
    event.valueAfter = ctx.current.speedKph;
    event.threshold = config_.rapidAccelerationDeltaKph;
    event.metadata["speed_before"] = previous.speedKph;
    event.metadata["speed_after"] = ctx.current.speedKph;
    event.metadata["delta"] = delta;
    out.push_back(std::move(event));
}

void EventDetector::brakingRule(const RuleContext& ctx, std::vector<VehicleEvent>& out) const {
    const auto& previous = requirePrevious(ctx);
    double delta = previous.speedKph - ctx.current.speedKph;
    if (delta <= config_.harshBrakingDeltaKph) {
        return;
    }

    auto event = makeEvent(EventType::HarshBraking, Severity::Warning, ctx.current, "Harsh Braking",
                           "Speed dropped from " + formatNumber(previous.speedKph) + " to " +
                           formatNumber(ctx.current.speedKph) + " km/h");
    event.valueBefore = previous.speedKph;
    event.valueAfter = ctx.current.speedKph;
    event.threshold = config_.harshBrakingDeltaKph;
    event.metadata["speed_before"] = previous.speedKph;
    event.metadata["speed_after"] = ctx.current.speedKph;
    event.metadata["delta"] = delta;
    out.push_back(std::move(event));
}

void EventDetector::ignitionRule(const RuleContext& ctx, std::vector<VehicleEvent>& out) const {
    const auto& previous = requirePrevious(ctx);
    const auto& current = ctx.current;
    if (previous.ignitionOn == current.ignitionOn) {
        return;
    }

    if (current.ignitionOn) {
        out.push_back(makeEvent(EventType::IgnitionOn, Severity::Info, current, "Vehicle Started",
                                "Ignition turned on"));
        return;
    }

    // Summarise the ignition-on run that just ended
    const PositionSample& runStart = ctx.state.ignitionRunStart ? *ctx.state.ignitionRunStart : previous;
    double durationMinutes = minutesBetween(runStart.timestamp, current.timestamp);

    nlohmann::json distanceKm = nullptr;
    if (runStart.odometerMeters && current.odometerMeters && *current.odometerMeters >= *runStart.odometerMeters) {
        distanceKm = (*current.odometerMeters - *runStart.odometerMeters) / 1000.0;
    }

    nlohmann::json summary;
    summary["duration_minutes"] = std::round(durationMinutes);
    summary["distance_km"] = distanceKm;
    summary["final_battery"] = current.batteryPercent ? nlohmann::json(*current.batteryPercent) : nlohmann::json(nullptr);
    summary["trip_start"] = formatIso8601(runStart.timestamp);
    summary["location"] = {{"lat", current.latitude}, {"lon", current.longitude}};

    std::string tripText = "Trip of " +
        (distanceKm.is_null() ? std::string("unknown distance") : formatNumber(distanceKm.get<double>(), 1) + " km") +
        " in " + formatNumber(durationMinutes) + " minutes";

    auto off = makeEvent(EventType::IgnitionOff, Severity::Info, current, "Engine Stopped",
                         "Ignition turned off. " + tripText);
    off.metadata = summary;
    out.push_back(std::move(off));

    auto completed = makeEvent(EventType::TripCompleted, Severity::Info, current, "Trip Completed", tripText);
    completed.metadata = summary;
    out.push_back(std::move(completed));
}

void EventDetector::movingAgainRule(const RuleContext& ctx, std::vector<VehicleEvent>& out) const {
    const auto& previous = requirePrevious(ctx);
    const auto& current = ctx.current;
    if (!current.ignitionOn || current.speedKph <= config_.movingSpeedKph ||
        previous.speedKph > config_.movingSpeedKph) {
        return;
    }

    auto event = makeEvent(EventType::VehicleMoving, Severity::Info, current, "Vehicle Started Moving",
                           "Vehicle moving at " + formatNumber(current.speedKph) + " km/h");
    event.valueBefore = previous.speedKph;
    event.valueAfter = current.speedKph;
    event.metadata["speed"] = current.speedKph;
    event.metadata["previous_speed"] = previous.speedKph;
    out.push_back(std::move(event));
}

void EventDetector::idleRule(const RuleContext& ctx, std::vector<VehicleEvent>& out) const {
    const auto& previous = requirePrevious(ctx);
    const auto& current = ctx.current;
    bool idleNow = current.ignitionOn && current.speedKph < config_.idleSpeedKph;
    bool idleBefore = previous.ignitionOn && previous.speedKph < config_.idleSpeedKph;
    if (!idleNow || !idleBefore) {
        return;
    }

    Timestamp runStart = ctx.state.lowSpeedRunStart ? *ctx.state.lowSpeedRunStart : previous.timestamp;
    runStart = std::max(runStart, current.timestamp - config_.idleLookback);

    double idleMinutes = minutesBetween(runStart, current.timestamp);
    if (idleMinutes < static_cast<double>(config_.idleThreshold.count())) {
        return;
    }

    auto event = makeEvent(EventType::IdleTooLong, Severity::Warning, current, "Extended Idling",
                           "Engine idling for " + formatNumber(idleMinutes) + " minutes");
    event.valueAfter = idleMinutes;
    event.threshold = static_cast<double>(config_.idleThreshold.count());
    event.metadata["idle_minutes"] = std::round(idleMinutes);
    event.metadata["battery_percent"] = current.batteryPercent ? nlohmann::json(*current.batteryPercent) : nlohmann::json(nullptr);
    event.metadata["threshold_minutes"] = config_.idleThreshold.count();
    out.push_back(std::move(event));
}

void EventDetector::connectivityRule(const RuleContext& ctx, std::vector<VehicleEvent>& out) const {
    const auto& previous = requirePrevious(ctx);
    const auto& current = ctx.current;
    if (previous.isOnline == current.isOnline) {
        return;
    }

    if (current.isOnline) {
        auto event = makeEvent(EventType::Online, Severity::Info, current, "Vehicle Online",
                               "Vehicle reconnected");
        event.metadata["offline_minutes"] = std::round(minutesBetween(previous.timestamp, current.timestamp));
        out.push_back(std::move(event));
    } else {
        out.push_back(makeEvent(EventType::Offline, Severity::Warning, current, "Vehicle Offline",
                                "Vehicle lost connectivity"));
    }
}

const PositionSample& EventDetector::requirePrevious(const RuleContext& ctx) {
    if (!ctx.previous) {
        throw StateGapError("No previous sample for " + ctx.current.vehicleId);
    }
    return *ctx.previous;
}

void EventDetector::advance(DetectorState& state, const PositionSample& sample) const {
    bool continuesRun = state.previous && state.previous->ignitionOn;

    if (sample.ignitionOn) {
        if (!continuesRun || !state.ignitionRunStart) {
            state.ignitionRunStart = sample;
        }
    } else {
        state.ignitionRunStart.reset();
    }

    if (sample.ignitionOn && sample.speedKph < config_.idleSpeedKph) {
        if (!state.lowSpeedRunStart) {
            state.lowSpeedRunStart = sample.timestamp;
        }
    } else {
        state.lowSpeedRunStart.reset();
    }

    state.previous = sample;
}

VehicleEvent EventDetector::makeEvent(EventType type, Severity severity, const PositionSample& sample,
                                      std::string title, std::string description) const {
    VehicleEvent event;
    event.id = RecordId::fromParts({sample.vehicleId, eventTypeToString(type),
                                    std::to_string(toEpochSeconds(sample.timestamp))});
    event.vehicleId = sample.vehicleId;
    event.type = type;
    event.severity = severity;
    event.title = std::move(title);
    event.description = std::move(description);
    event.latitude = sample.latitude;
    event.longitude = sample.longitude;
    event.createdAt = sample.timestamp;
    event.expiresAt = sample.timestamp + policyEngine_->getRetentionPolicy().getLifetime(type);
    return event;
}

} // namespace fleetsense::domain
