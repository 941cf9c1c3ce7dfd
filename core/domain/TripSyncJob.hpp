#pragma once

#include "TripSegmentation.hpp"
#include "../ports/IPolicyEngine.hpp"
#include "../ports/IPositionStore.hpp"
#include "../ports/ITripStore.hpp"
#include <memory>
#include <string>
#include <vector>

namespace fleetsense::domain {

/**
 * @brief Re-segments a vehicle's samples for a time range and stores the trips
 *
 * Each registered strategy writes its own source_method slice, replacing what
 * a previous run stored for the same range, so re-running never duplicates.
 */
class TripSyncJob {
public:
    struct Result {
        std::size_t samples = 0;
        std::size_t ignitionTrips = 0;
        std::size_t idleTimeoutTrips = 0;
    };

    TripSyncJob(TripConfig config,
                std::shared_ptr<ports::IPositionStore> positions,
                std::shared_ptr<ports::ITripStore> trips,
                std::shared_ptr<ports::IPolicyEngine> policyEngine);

    // Trips starting in [from, to).
    Result run(const std::string& vehicleId, Timestamp from, Timestamp to);

    // Pure segmentation of one ordered timeline by every strategy.
    std::vector<Trip> segmentAll(const std::vector<PositionSample>& samples) const;

private:
    TripConfig config_;
    std::shared_ptr<ports::IPositionStore> positions_;
    std::shared_ptr<ports::ITripStore> trips_;
    std::shared_ptr<ports::IPolicyEngine> policyEngine_;
    std::vector<std::unique_ptr<TripSegmentationStrategy>> strategies_;
};

} // namespace fleetsense::domain
