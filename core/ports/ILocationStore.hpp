#pragma once

#include "../LearnedLocation.hpp"
#include <optional>
#include <string>
#include <vector>

namespace fleetsense::ports {

class ILocationStore {
public:
    virtual ~ILocationStore() = default;

    virtual std::vector<LearnedLocation> forVehicle(const std::string& vehicleId) const = 0;
    virtual std::optional<LearnedLocation> find(const std::string& locationId) const = 0;
    virtual void upsert(const LearnedLocation& location) = 0;

    virtual std::vector<VisitPattern> patterns(const std::string& locationId) const = 0;
    virtual void upsertPattern(const VisitPattern& pattern) = 0;
};

} // namespace fleetsense::ports
