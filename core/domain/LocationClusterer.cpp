#include "LocationClusterer.hpp"
#include "../Geo.hpp"
#include "RecordId.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fleetsense::domain {

namespace {

constexpr double kNightFractionForHome = 0.7;
constexpr int kHomeMinVisits = 10;
constexpr int kWorkMinVisits = 15;
constexpr double kWorkFirstHour = 8.0;
constexpr double kWorkLastHour = 18.0;
constexpr double kParkingMaxAvgMinutes = 30.0;
constexpr int kStrongPatternMinVisits = 3;
constexpr double kStrongPatternShare = 0.25;
constexpr double kFullConfidenceVisits = 20.0;

bool isNightHour(int hour) {
    return hour >= 22 || hour < 6;
}

std::string coordinateKey(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(6) << value;
    return ss.str();
}

} // namespace

LocationClusterer::LocationClusterer(LocationConfig config, int utcOffsetMinutes,
                                     std::shared_ptr<ports::ILocationStore> locations,
                                     std::shared_ptr<ports::IPositionStore> positions)
    : config_(config), utcOffsetMinutes_(utcOffsetMinutes),
      locations_(locations), positions_(positions) {
}

LearnedLocation LocationClusterer::observe(const DwellPoint& dwell) {
    LearnedLocation location;
    if (auto existing = nearestCluster(dwell)) {
        location = mergeVisit(*existing, dwell);
    } else {
        location = createCluster(dwell);
        std::cout << "[Locations] New location " << location.id << " for " << dwell.vehicleId
                  << " at " << coordinateKey(dwell.point.lat) << "," << coordinateKey(dwell.point.lon)
                  << std::endl;
    }

    recordPattern(location, dwell);

    if (location.visitCount >= config_.classifyAfterVisits) {
        Timestamp until = dwell.arrival +
            std::chrono::seconds(static_cast<long long>(dwell.durationMinutes * 60.0)) + std::chrono::seconds(1);
        Timestamp since = until - std::chrono::hours(24 * config_.historyWindowDays);
        auto history = positions_->nearby(dwell.vehicleId, location.centroid, location.radiusMeters, since, until);
        auto patterns = locations_->patterns(location.id);

        LocationSignals signals = history.empty() ? signalsFromPatterns(patterns) : signalsFromHistory(history);
        location.locationType = classify(location, patterns, signals);
        if (signals.meanHour) {
            location.typicalArrivalHour = static_cast<int>(std::lround(*signals.meanHour)) % 24;
        }
    }

    if (!location.customLabel) {
        location.confidence = std::min(location.visitCount / kFullConfidenceVisits, 1.0);
    }

    locations_->upsert(location);
    return location;
}

std::optional<LearnedLocation> LocationClusterer::nameLocation(const std::string& locationId,
                                                               const std::string& label) {
    auto location = locations_->find(locationId);
    if (!location) {
        return std::nullopt;
    }
    location->customLabel = label;
    location->confidence = 1.0;
    locations_->upsert(*location);
    return location;
}

LearnedLocation LocationClusterer::mergeVisit(const LearnedLocation& location, const DwellPoint& dwell) {
    LearnedLocation merged = location;
    merged.centroid = Geo::midpoint(location.centroid, dwell.point);
    merged.visitCount = location.visitCount + 1;
    merged.totalDurationMinutes = location.totalDurationMinutes + dwell.durationMinutes;
    merged.firstVisit = std::min(location.firstVisit, dwell.arrival);
    merged.lastVisit = std::max(location.lastVisit, dwell.arrival);
    return merged;
}

LocationType LocationClusterer::classify(const LearnedLocation& location,
                                         const std::vector<VisitPattern>& patterns,
                                         const LocationSignals& signals) const {
    if (location.visitCount < config_.classifyAfterVisits) {
        return location.locationType;
    }

    bool strongMorning = false;
    bool strongEvening = false;
    for (const auto& pattern : patterns) {
        if (pattern.dayPart == DayPart::Morning) {
            strongMorning = isStrong(pattern, location.visitCount);
        } else if (pattern.dayPart == DayPart::Evening) {
            strongEvening = isStrong(pattern, location.visitCount);
        }
    }

    // Errand stops visited both ends of the day
    if (strongMorning && strongEvening) {
        return LocationType::Frequent;
    }

    if (signals.nightFraction > kNightFractionForHome && location.visitCount >= kHomeMinVisits) {
        return LocationType::Home;
    }
    if (signals.meanHour && *signals.meanHour >= kWorkFirstHour && *signals.meanHour <= kWorkLastHour &&
        location.visitCount >= kWorkMinVisits) {
        return LocationType::Work;
    }
    if (location.totalDurationMinutes / location.visitCount < kParkingMaxAvgMinutes) {
        return LocationType::Parking;
    }
    return LocationType::Frequent;
}

LocationSignals LocationClusterer::signalsFromHistory(const std::vector<PositionSample>& history) const {
    LocationSignals signals;
    if (history.empty()) {
        return signals;
    }

    int night = 0;
    double hourSum = 0.0;
    for (const auto& sample : history) {
        int hour = localHourOf(sample.timestamp, utcOffsetMinutes_);
        hourSum += hour;
        if (isNightHour(hour)) {
            ++night;
        }
    }

    signals.nightFraction = static_cast<double>(night) / history.size();
    signals.meanHour = hourSum / history.size();
    return signals;
}

std::optional<LearnedLocation> LocationClusterer::nearestCluster(const DwellPoint& dwell) const {
    std::optional<LearnedLocation> best;
    double bestDistance = 0.0;

    for (auto& candidate : locations_->forVehicle(dwell.vehicleId)) {
        double distance = Geo::distanceMeters(candidate.centroid, dwell.point);
        if (distance > config_.clusterRadiusMeters) {
            continue;
        }
        if (!best || distance < bestDistance || (distance == bestDistance && candidate.id < best->id)) {
            bestDistance = distance;
            best = std::move(candidate);
        }
    }
    return best;
}

LearnedLocation LocationClusterer::createCluster(const DwellPoint& dwell) const {
    LearnedLocation location;
    location.id = RecordId::fromParts({dwell.vehicleId, "location",
                                       std::to_string(toEpochSeconds(dwell.arrival)),
                                       coordinateKey(dwell.point.lat), coordinateKey(dwell.point.lon)});
    location.vehicleId = dwell.vehicleId;
    location.centroid = dwell.point;
    location.radiusMeters = config_.clusterRadiusMeters;
    location.visitCount = 1;
    location.totalDurationMinutes = dwell.durationMinutes;
    location.firstVisit = dwell.arrival;
    location.lastVisit = dwell.arrival;
    location.locationType = LocationType::Unknown;
    return location;
}

void LocationClusterer::recordPattern(const LearnedLocation& location, const DwellPoint& dwell) {
    int hour = localHourOf(dwell.arrival, utcOffsetMinutes_);
    DayPart part = dayPartForHour(hour);

    VisitPattern pattern;
    pattern.locationId = location.id;
    pattern.dayPart = part;
    for (const auto& existing : locations_->patterns(location.id)) {
        if (existing.dayPart == part) {
            pattern = existing;
            break;
        }
    }

    double count = pattern.visitCount;
    pattern.typicalHour = (pattern.typicalHour * count + hour) / (count + 1.0);
    pattern.avgDurationMinutes = (pattern.avgDurationMinutes * count + dwell.durationMinutes) / (count + 1.0);
    pattern.visitCount += 1;
    locations_->upsertPattern(pattern);
}

LocationSignals LocationClusterer::signalsFromPatterns(const std::vector<VisitPattern>& patterns) const {
    LocationSignals signals;
    int total = 0;
    int night = 0;
    double hourSum = 0.0;
    for (const auto& pattern : patterns) {
        total += pattern.visitCount;
        hourSum += pattern.typicalHour * pattern.visitCount;
        if (pattern.dayPart == DayPart::Night) {
            night += pattern.visitCount;
        }
    }
    if (total > 0) {
        signals.nightFraction = static_cast<double>(night) / total;
        signals.meanHour = hourSum / total;
    }
    return signals;
}

bool LocationClusterer::isStrong(const VisitPattern& pattern, int totalVisits) const {
    return pattern.visitCount >= kStrongPatternMinVisits &&
           pattern.visitCount >= kStrongPatternShare * totalVisits;
}

} // namespace fleetsense::domain
