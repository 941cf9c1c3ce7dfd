#include "Trip.hpp"
#include "Errors.hpp"

namespace fleetsense {

std::string tripSourceToString(TripSource source) {
    switch (source) {
        case TripSource::Ignition: return "ignition";
        case TripSource::IdleTimeout: return "idle_timeout";
    }
    return "ignition";
}

TripSource stringToTripSource(const std::string& str) {
    if (str == "ignition") return TripSource::Ignition;
    if (str == "idle_timeout") return TripSource::IdleTimeout;
    throw InputError("Unknown trip source: " + str);
}

} // namespace fleetsense
