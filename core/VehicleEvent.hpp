#pragma once

#include "TimeUtil.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace fleetsense {

enum class EventType {
    LowBattery,
    CriticalBattery,
    Overspeeding,
    RapidAcceleration,
    HarshBraking,
    IgnitionOn,
    IgnitionOff,
    TripCompleted,
    VehicleMoving,
    IdleTooLong,
    Offline,
    Online
};

enum class Severity {
    Info,
    Warning,
    Error,
    Critical
};

struct VehicleEvent {
    std::string id;
    std::string vehicleId;
    EventType type = EventType::Online;
    Severity severity = Severity::Info;
    std::string title;
    std::string description;
    nlohmann::json metadata = nlohmann::json::object();

    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<double> valueBefore;
    std::optional<double> valueAfter;
    std::optional<double> threshold;

    Timestamp createdAt;
    Timestamp expiresAt;
    bool acknowledged = false;

    bool isExpired(Timestamp now) const { return expiresAt < now; }
};

std::string eventTypeToString(EventType type);
EventType stringToEventType(const std::string& str);

std::string severityToString(Severity severity);
Severity stringToSeverity(const std::string& str);

} // namespace fleetsense
