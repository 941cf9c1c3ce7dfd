#include "LearnedLocation.hpp"
#include "Errors.hpp"

namespace fleetsense {

std::string locationTypeToString(LocationType type) {
    switch (type) {
        case LocationType::Home: return "home";
        case LocationType::Work: return "work";
        case LocationType::Parking: return "parking";
        case LocationType::Frequent: return "frequent";
        case LocationType::Unknown: return "unknown";
    }
    return "unknown";
}

LocationType stringToLocationType(const std::string& str) {
    if (str == "home") return LocationType::Home;
    if (str == "work") return LocationType::Work;
    if (str == "parking") return LocationType::Parking;
    if (str == "frequent") return LocationType::Frequent;
    if (str == "unknown") return LocationType::Unknown;
    throw InputError("Unknown location type: " + str);
}

std::string dayPartToString(DayPart part) {
    switch (part) {
        case DayPart::Morning: return "morning";
        case DayPart::Afternoon: return "afternoon";
        case DayPart::Evening: return "evening";
        case DayPart::Night: return "night";
    }
    return "night";
}

DayPart dayPartForHour(int hour) {
    if (hour >= 5 && hour <= 11) return DayPart::Morning;
    if (hour >= 12 && hour <= 16) return DayPart::Afternoon;
    if (hour >= 17 && hour <= 21) return DayPart::Evening;
    return DayPart::Night;
}

} // namespace fleetsense
