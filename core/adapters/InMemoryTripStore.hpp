#pragma once

#include "../ports/ITripStore.hpp"
#include <map>
#include <mutex>

namespace fleetsense::adapters {

class InMemoryTripStore : public ports::ITripStore {
public:
    InMemoryTripStore() = default;
    ~InMemoryTripStore() override = default;

    void replaceRange(const std::string& vehicleId, TripSource source,
                      Timestamp from, Timestamp to,
                      const std::vector<Trip>& trips) override;
    std::vector<Trip> query(const ports::TripFilter& filter) const override;

private:
    // vehicle -> trip id -> trip
    std::map<std::string, std::map<std::string, Trip>> trips_;
    mutable std::mutex mutex_;
};

} // namespace fleetsense::adapters
