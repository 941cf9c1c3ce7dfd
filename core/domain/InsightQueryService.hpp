#pragma once

#include "LocationClusterer.hpp"
#include "../IClock.hpp"
#include "../InsightConfig.hpp"
#include "../ports/IEventStore.hpp"
#include "../ports/IHealthStore.hpp"
#include "../ports/ILocationStore.hpp"
#include "../ports/IPolicyEngine.hpp"
#include "../ports/ITripStore.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fleetsense::domain {

// One row of the per-(type, severity) event rollup.
struct EventStatistic {
    EventType type = EventType::Online;
    Severity severity = Severity::Info;
    std::size_t count = 0;
    std::size_t acknowledgedCount = 0;
    Timestamp lastOccurrence;
};

struct NearbyLocation {
    LearnedLocation location;
    double distanceMeters = 0.0;
};

/**
 * @brief Read side consumed by dashboards and notification collaborators
 *
 * Expiry, statistics windows and retention are measured against the injected
 * clock, never against sample time.
 */
class InsightQueryService {
public:
    InsightQueryService(InsightConfig config,
                        std::shared_ptr<ports::IEventStore> events,
                        std::shared_ptr<ports::ITripStore> trips,
                        std::shared_ptr<ports::ILocationStore> locations,
                        std::shared_ptr<ports::IHealthStore> health,
                        std::shared_ptr<ports::IPolicyEngine> policyEngine,
                        std::shared_ptr<LocationClusterer> clusterer,
                        std::shared_ptr<IClock> clock);

    // Events
    std::vector<VehicleEvent> events(const ports::EventFilter& filter) const;
    bool acknowledge(const std::string& eventId);
    std::vector<VehicleEvent> unacknowledged(const std::optional<std::string>& vehicleId,
                                             std::size_t limit = 50) const;

    /**
     * @brief Event counts over the last `days` days grouped by type and severity
     * @return Rows ordered by count, highest first
     */
    std::vector<EventStatistic> statistics(const std::optional<std::string>& vehicleId,
                                           int days) const;

    // Trips
    std::vector<Trip> trips(const std::string& vehicleId, Timestamp from, Timestamp to,
                            std::optional<TripSource> source = std::nullopt) const;

    // Learned locations
    std::vector<NearbyLocation> nearby(const std::string& vehicleId, const GeoPoint& point,
                                       std::optional<double> radiusMeters = std::nullopt) const;
    std::vector<LearnedLocation> ranked(const std::string& vehicleId, std::size_t limit = 10) const;
    std::optional<LearnedLocation> nameLocation(const std::string& locationId, const std::string& label);
    std::vector<VisitPattern> visitPatterns(const std::string& locationId) const;

    // Daily health, inclusive date range
    std::vector<DailyHealthScore> health(const std::string& vehicleId,
                                         const CalendarDate& from, const CalendarDate& to) const;

    // Deletes retention-eligible events, returns how many.
    std::size_t purgeEvents();

private:
    InsightConfig config_;
    std::shared_ptr<ports::IEventStore> events_;
    std::shared_ptr<ports::ITripStore> trips_;
    std::shared_ptr<ports::ILocationStore> locations_;
    std::shared_ptr<ports::IHealthStore> health_;
    std::shared_ptr<ports::IPolicyEngine> policyEngine_;
    std::shared_ptr<LocationClusterer> clusterer_;
    std::shared_ptr<IClock> clock_;
};

} // namespace fleetsense::domain
