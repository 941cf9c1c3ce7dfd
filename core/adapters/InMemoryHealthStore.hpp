#pragma once

#include "../ports/IHealthStore.hpp"
#include <cstdint>
#include <map>
#include <mutex>

namespace fleetsense::adapters {

class InMemoryHealthStore : public ports::IHealthStore {
public:
    InMemoryHealthStore() = default;
    ~InMemoryHealthStore() override = default;

    void upsert(const DailyHealthFeature& feature, const DailyHealthScore& score) override;
    std::optional<DailyHealthFeature> feature(const std::string& vehicleId,
                                              const CalendarDate& date) const override;
    std::optional<DailyHealthScore> score(const std::string& vehicleId,
                                          const CalendarDate& date) const override;
    std::optional<DailyHealthScore> latestBefore(const std::string& vehicleId,
                                                 const CalendarDate& date) const override;
    std::vector<DailyHealthScore> range(const std::string& vehicleId,
                                        const CalendarDate& from,
                                        const CalendarDate& to) const override;

private:
    struct Row {
        DailyHealthFeature feature;
        DailyHealthScore score;
    };

    // vehicle -> days since epoch -> row
    std::map<std::string, std::map<std::int64_t, Row>> rows_;
    mutable std::mutex mutex_;
};

} // namespace fleetsense::adapters
