#pragma once

#include "../HealthRecord.hpp"
#include <optional>
#include <string>
#include <vector>

namespace fleetsense::ports {

class IHealthStore {
public:
    virtual ~IHealthStore() = default;

    // Replaces any existing rows for (vehicle_id, date).
    virtual void upsert(const DailyHealthFeature& feature, const DailyHealthScore& score) = 0;

    virtual std::optional<DailyHealthFeature> feature(const std::string& vehicleId,
                                                      const CalendarDate& date) const = 0;
    virtual std::optional<DailyHealthScore> score(const std::string& vehicleId,
                                                  const CalendarDate& date) const = 0;

    // Most recent scored day strictly before date.
    virtual std::optional<DailyHealthScore> latestBefore(const std::string& vehicleId,
                                                         const CalendarDate& date) const = 0;

    // Inclusive on both ends, ascending by date.
    virtual std::vector<DailyHealthScore> range(const std::string& vehicleId,
                                                const CalendarDate& from,
                                                const CalendarDate& to) const = 0;
};

} // namespace fleetsense::ports
