#pragma once

#include "HealthFeatureAggregator.hpp"
#include "HealthScorer.hpp"
#include "TripSyncJob.hpp"
#include "../InsightConfig.hpp"
#include "../ports/IEventStore.hpp"
#include "../ports/IHealthStore.hpp"
#include "../ports/IPolicyEngine.hpp"
#include "../ports/IPositionStore.hpp"
#include "../ports/ITripStore.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fleetsense::domain {

/**
 * @brief Daily health batch over every vehicle active on a date
 *
 * Vehicles are scored in parallel by a fixed pool of workers. A failure on
 * one vehicle is reported in the outcome and never aborts the others.
 * Recomputing a day overwrites the stored feature and score rows.
 */
class HealthBatchDriver {
public:
    struct VehicleOutcome {
        std::string vehicleId;
        CalendarDate date;
        bool success = false;
        std::string error;
        std::optional<DailyHealthScore> score;
    };

    struct Report {
        std::vector<VehicleOutcome> outcomes;

        std::size_t succeeded() const;
        std::size_t failed() const;
    };

    /**
     * @param tripSync Optional. When set, trips of the day are re-segmented
     *                 before features are aggregated.
     */
    HealthBatchDriver(InsightConfig config,
                      std::shared_ptr<ports::IPositionStore> positions,
                      std::shared_ptr<ports::ITripStore> trips,
                      std::shared_ptr<ports::IEventStore> events,
                      std::shared_ptr<ports::IHealthStore> health,
                      std::shared_ptr<ports::IPolicyEngine> policyEngine,
                      std::shared_ptr<TripSyncJob> tripSync = nullptr);

    // Scores one vehicle-day and stores it. Throws on failure.
    DailyHealthScore computeVehicleDay(const std::string& vehicleId, const CalendarDate& date);

    Report runDay(const CalendarDate& date);

    // The `days` dates ending at endDate, oldest first so trends chain.
    Report recomputeRecent(const CalendarDate& endDate, int days);

    // Every date in [from, to], oldest first.
    Report backfill(const CalendarDate& from, const CalendarDate& to);

private:
    DailyHealthFeature buildFeature(const std::string& vehicleId, const CalendarDate& date);

    InsightConfig config_;
    std::shared_ptr<ports::IPositionStore> positions_;
    std::shared_ptr<ports::ITripStore> trips_;
    std::shared_ptr<ports::IEventStore> events_;
    std::shared_ptr<ports::IHealthStore> health_;
    std::shared_ptr<ports::IPolicyEngine> policyEngine_;
    std::shared_ptr<TripSyncJob> tripSync_;

    HealthFeatureAggregator aggregator_;
    HealthScorer scorer_;
};

} // namespace fleetsense::domain
