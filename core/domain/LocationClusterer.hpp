#pragma once

#include "../InsightConfig.hpp"
#include "../LearnedLocation.hpp"
#include "../ports/ILocationStore.hpp"
#include "../ports/IPositionStore.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fleetsense::domain {

// Time-of-day evidence used to classify a cluster.
struct LocationSignals {
    double nightFraction = 0.0;          ///< Share of observations at local hour >= 22 or < 6
    std::optional<double> meanHour;
};

class LocationClusterer {
public:
    LocationClusterer(LocationConfig config, int utcOffsetMinutes,
                      std::shared_ptr<ports::ILocationStore> locations,
                      std::shared_ptr<ports::IPositionStore> positions);

    // Merges a dwell into the nearest cluster in range, or starts a new one.
    LearnedLocation observe(const DwellPoint& dwell);

    // Applies a user label. Returns nullopt for an unknown id.
    std::optional<LearnedLocation> nameLocation(const std::string& locationId, const std::string& label);

    // Equal-weight midpoint merge of one more visit into a cluster.
    static LearnedLocation mergeVisit(const LearnedLocation& location, const DwellPoint& dwell);

    LocationType classify(const LearnedLocation& location,
                          const std::vector<VisitPattern>& patterns,
                          const LocationSignals& signals) const;

    LocationSignals signalsFromHistory(const std::vector<PositionSample>& history) const;

private:
    std::optional<LearnedLocation> nearestCluster(const DwellPoint& dwell) const;
    LearnedLocation createCluster(const DwellPoint& dwell) const;
    void recordPattern(const LearnedLocation& location, const DwellPoint& dwell);
    LocationSignals signalsFromPatterns(const std::vector<VisitPattern>& patterns) const;
    bool isStrong(const VisitPattern& pattern, int totalVisits) const;

    LocationConfig config_;
    int utcOffsetMinutes_;
    std::shared_ptr<ports::ILocationStore> locations_;
    std::shared_ptr<ports::IPositionStore> positions_;
};

} // namespace fleetsense::domain
