#pragma once

#include "../HealthRecord.hpp"
#include "../PositionSample.hpp"
#include "../Trip.hpp"
#include "../VehicleEvent.hpp"
#include <string>
#include <vector>

namespace fleetsense::domain {

/**
 * @brief Folds one vehicle-day of samples, trips and events into features
 *
 * Pure: callers pass exactly the day's inputs (samples ascending, trips of the
 * chosen source starting that day, events created that day).
 */
class HealthFeatureAggregator {
public:
    explicit HealthFeatureAggregator(double speedingThresholdKph = 100.0);

    DailyHealthFeature aggregate(const std::string& vehicleId, const CalendarDate& date,
                                 const std::vector<PositionSample>& samples,
                                 const std::vector<Trip>& trips,
                                 const std::vector<VehicleEvent>& events) const;

private:
    void aggregateSamples(const std::vector<PositionSample>& samples, DailyHealthFeature& feature) const;
    static void aggregateTrips(const std::vector<Trip>& trips, DailyHealthFeature& feature);
    static void aggregateEvents(const std::vector<VehicleEvent>& events, DailyHealthFeature& feature);
    static void deriveCompleteness(DailyHealthFeature& feature);

    double speedingThresholdKph_;
};

} // namespace fleetsense::domain
