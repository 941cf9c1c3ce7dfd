#include "InsightQueryService.hpp"
#include "../Geo.hpp"
#include <algorithm>
#include <iostream>
#include <map>

namespace fleetsense::domain {

InsightQueryService::InsightQueryService(InsightConfig config,
                                         std::shared_ptr<ports::IEventStore> events,
                                         std::shared_ptr<ports::ITripStore> trips,
                                         std::shared_ptr<ports::ILocationStore> locations,
                                         std::shared_ptr<ports::IHealthStore> health,
                                         std::shared_ptr<ports::IPolicyEngine> policyEngine,
                                         std::shared_ptr<LocationClusterer> clusterer,
                                         std::shared_ptr<IClock> clock)
    : config_(config), events_(events), trips_(trips), locations_(locations), health_(health),
      policyEngine_(policyEngine), clusterer_(clusterer), clock_(clock) {
}

std::vector<VehicleEvent> InsightQueryService::events(const ports::EventFilter& filter) const {
    return events_->query(filter);
}

bool InsightQueryService::acknowledge(const std::string& eventId) {
    return events_->acknowledge(eventId);
}

std::vector<VehicleEvent> InsightQueryService::unacknowledged(const std::optional<std::string>& vehicleId,
                                                              std::size_t limit) const {
    ports::EventFilter filter;
    filter.vehicleId = vehicleId;
    filter.acknowledged = false;
    filter.notExpiredAt = clock_->now();
    filter.limit = limit;
    return events_->query(filter);
}

std::vector<EventStatistic> InsightQueryService::statistics(const std::optional<std::string>& vehicleId,
                                                            int days) const {
    ports::EventFilter filter;
    filter.vehicleId = vehicleId;
    filter.from = clock_->now() - std::chrono::hours(24 * days);

    std::map<std::pair<EventType, Severity>, EventStatistic> rows;
    for (const auto& event : events_->query(filter)) {
        auto& row = rows[{event.type, event.severity}];
        if (row.count == 0) {
            row.type = event.type;
            row.severity = event.severity;
            row.lastOccurrence = event.createdAt;
        }
        ++row.count;
        if (event.acknowledged) {
            ++row.acknowledgedCount;
        }
        row.lastOccurrence = std::max(row.lastOccurrence, event.createdAt);
    }

    std::vector<EventStatistic> result;
    result.reserve(rows.size());
    for (auto& entry : rows) {
        result.push_back(entry.second);
    }
    std::stable_sort(result.begin(), result.end(), [](const EventStatistic& a, const EventStatistic& b) {
        return a.count > b.count;
    });
    return result;
}

std::vector<Trip> InsightQueryService::trips(const std::string& vehicleId, Timestamp from, Timestamp to,
                                             std::optional<TripSource> source) const {
    ports::TripFilter filter;
    filter.vehicleId = vehicleId;
    filter.from = from;
    filter.to = to;
    filter.source = source;
    return trips_->query(filter);
}

std::vector<NearbyLocation> InsightQueryService::nearby(const std::string& vehicleId, const GeoPoint& point,
                                                        std::optional<double> radiusMeters) const {
    double radius = radiusMeters.value_or(config_.locations.nearbyDefaultRadiusMeters);

    std::vector<NearbyLocation> result;
    for (const auto& location : locations_->forVehicle(vehicleId)) {
        double distance = Geo::distanceMeters(point, location.centroid);
        if (distance <= radius) {
            result.push_back(NearbyLocation{location, distance});
        }
    }
    std::sort(result.begin(), result.end(), [](const NearbyLocation& a, const NearbyLocation& b) {
        return a.distanceMeters < b.distanceMeters;
    });
    return result;
}

std::vector<LearnedLocation> InsightQueryService::ranked(const std::string& vehicleId, std::size_t limit) const {
    auto locations = locations_->forVehicle(vehicleId);
    std::sort(locations.begin(), locations.end(), [](const LearnedLocation& a, const LearnedLocation& b) {
        if (a.visitCount != b.visitCount) {
            return a.visitCount > b.visitCount;
        }
        return a.lastVisit > b.lastVisit;
    });
    if (locations.size() > limit) {
        locations.resize(limit);
    }
    return locations;
}

std::optional<LearnedLocation> InsightQueryService::nameLocation(const std::string& locationId,
                                                                 const std::string& label) {
    return clusterer_->nameLocation(locationId, label);
}

std::vector<VisitPattern> InsightQueryService::visitPatterns(const std::string& locationId) const {
    return locations_->patterns(locationId);
}

std::vector<DailyHealthScore> InsightQueryService::health(const std::string& vehicleId,
                                                          const CalendarDate& from,
                                                          const CalendarDate& to) const {
    return health_->range(vehicleId, from, to);
}

std::size_t InsightQueryService::purgeEvents() {
    const auto& retention = policyEngine_->getRetentionPolicy();
    Timestamp now = clock_->now();
    std::size_t removed = events_->purge([&](const VehicleEvent& event) {
        return retention.isPurgeEligible(event, now);
    });
    std::cout << "[Retention] Purged " << removed << " events" << std::endl;
    return removed;
}

} // namespace fleetsense::domain
