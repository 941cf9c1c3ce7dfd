#pragma once

#include "../ports/IPositionStore.hpp"
#include <cstdint>
#include <map>
#include <mutex>

namespace fleetsense::adapters {

class InMemoryPositionStore : public ports::IPositionStore {
public:
    InMemoryPositionStore() = default;
    ~InMemoryPositionStore() override = default;

    bool append(const PositionSample& sample) override;
    std::vector<PositionSample> range(const std::string& vehicleId,
                                      Timestamp from, Timestamp to) const override;
    std::vector<PositionSample> nearby(const std::string& vehicleId, const GeoPoint& center,
                                       double radiusMeters, Timestamp from, Timestamp to) const override;
    std::vector<std::string> activeVehicles(Timestamp from, Timestamp to) const override;

    std::size_t size() const;

private:
    using Timeline = std::map<std::int64_t, PositionSample>;

    std::map<std::string, Timeline> timelines_;
    mutable std::mutex mutex_;
};

} // namespace fleetsense::adapters
