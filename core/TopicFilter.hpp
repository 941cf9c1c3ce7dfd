#pragma once

#include <optional>
#include <string>

namespace fleetsense::topic {

// MQTT filter matching: '+' covers exactly one non-empty level, a trailing
// '#' covers the rest of the topic.
bool matches(const std::string& filter, const std::string& topic);

// Level captured by the first '+' of filter when topic matches it. Empty
// string when the filter matches without a '+' level.
std::optional<std::string> captureVehicle(const std::string& filter, const std::string& topic);

// "<prefix>/<vehicleId>/events"
std::string eventTopic(const std::string& prefix, const std::string& vehicleId);

} // namespace fleetsense::topic
