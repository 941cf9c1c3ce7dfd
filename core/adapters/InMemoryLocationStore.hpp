#pragma once

#include "../ports/ILocationStore.hpp"
#include <map>
#include <mutex>

namespace fleetsense::adapters {

class InMemoryLocationStore : public ports::ILocationStore {
public:
    InMemoryLocationStore() = default;
    ~InMemoryLocationStore() override = default;

    std::vector<LearnedLocation> forVehicle(const std::string& vehicleId) const override;
    std::optional<LearnedLocation> find(const std::string& locationId) const override;
    void upsert(const LearnedLocation& location) override;

    std::vector<VisitPattern> patterns(const std::string& locationId) const override;
    void upsertPattern(const VisitPattern& pattern) override;

private:
    std::map<std::string, LearnedLocation> locations_;
    std::map<std::string, std::map<DayPart, VisitPattern>> patterns_;
    mutable std::mutex mutex_;
};

} // namespace fleetsense::adapters
