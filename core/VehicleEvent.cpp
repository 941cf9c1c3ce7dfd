#include "VehicleEvent.hpp"
#include "Errors.hpp"
#include <unordered_map>

namespace fleetsense {

std::string eventTypeToString(EventType type) {
    static const std::unordered_map<EventType, std::string> typeMap = {
        {EventType::LowBattery, "low_battery"},
        {EventType::CriticalBattery, "critical_battery"},
        {EventType::Overspeeding, "overspeeding"},
        {EventType::RapidAcceleration, "rapid_acceleration"},
        {EventType::HarshBraking, "harsh_braking"},
        {EventType::IgnitionOn, "ignition_on"},
        {EventType::IgnitionOff, "ignition_off"},
        {EventType::TripCompleted, "trip_completed"},
        {EventType::VehicleMoving, "vehicle_moving"},
        {EventType::IdleTooLong, "idle_too_long"},
        {EventType::Offline, "offline"},
        {EventType::Online, "online"}
    };

    auto it = typeMap.find(type);
    return (it != typeMap.end()) ? it->second : "unknown";
}

EventType stringToEventType(const std::string& str) {
    static const std::unordered_map<std::string, EventType> stringMap = {
        {"low_battery", EventType::LowBattery},
        {"critical_battery", EventType::CriticalBattery},
        {"overspeeding", EventType::Overspeeding},
        {"rapid_acceleration", EventType::RapidAcceleration},
        {"harsh_braking", EventType::HarshBraking},
        {"ignition_on", EventType::IgnitionOn},
        {"ignition_off", EventType::IgnitionOff},
        {"trip_completed", EventType::TripCompleted},
        {"vehicle_moving", EventType::VehicleMoving},
        {"idle_too_long", EventType::IdleTooLong},
        {"offline", EventType::Offline},
        {"online", EventType::Online}
    };

    auto it = stringMap.find(str);
    if (it == stringMap.end()) {
        throw InputError("Unknown event type: " + str);
    }
    return it->second;
}

std::string severityToString(Severity severity) {
    switch (severity) {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
        case Severity::Critical: return "critical";
    }
    return "info";
}

Severity stringToSeverity(const std::string& str) {
    if (str == "info") return Severity::Info;
    if (str == "warning") return Severity::Warning;
    if (str == "error") return Severity::Error;
    if (str == "critical") return Severity::Critical;
    throw InputError("Unknown severity: " + str);
}

} // namespace fleetsense
