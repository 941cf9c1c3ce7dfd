#include "TripSyncJob.hpp"
#include "RetryRunner.hpp"
#include <iostream>

namespace fleetsense::domain {

namespace {

// Samples loaded on either side of the range so trips crossing its edges
// keep their real boundaries.
constexpr std::chrono::hours kContextWindow{6};

} // namespace

TripSyncJob::TripSyncJob(TripConfig config,
                         std::shared_ptr<ports::IPositionStore> positions,
                         std::shared_ptr<ports::ITripStore> trips,
                         std::shared_ptr<ports::IPolicyEngine> policyEngine)
    : config_(config), positions_(positions), trips_(trips), policyEngine_(policyEngine) {
    strategies_.push_back(std::make_unique<IgnitionTripStrategy>(config_));
    strategies_.push_back(std::make_unique<IdleTimeoutTripStrategy>(config_));
}

TripSyncJob::Result TripSyncJob::run(const std::string& vehicleId, Timestamp from, Timestamp to) {
    const auto& retry = policyEngine_->getRetryPolicy();
    Result result;

    auto samples = runWithRetry(retry, "load samples for " + vehicleId, [&]() {
        return positions_->range(vehicleId, from - kContextWindow, to + kContextWindow);
    });
    samples = prepareForSegmentation(std::move(samples), config_);
    result.samples = samples.size();

    for (const auto& strategy : strategies_) {
        std::vector<Trip> inRange;
        for (auto& trip : strategy->segment(samples)) {
            if (!(trip.startTime < from) && trip.startTime < to) {
                inRange.push_back(std::move(trip));
            }
        }

        runWithRetry(retry, "store trips for " + vehicleId, [&]() {
            trips_->replaceRange(vehicleId, strategy->source(), from, to, inRange);
        });

        if (strategy->source() == TripSource::Ignition) {
            result.ignitionTrips = inRange.size();
        } else {
            result.idleTimeoutTrips = inRange.size();
        }
    }

    std::cout << "[Trips] " << vehicleId << ": " << result.ignitionTrips << " ignition / "
              << result.idleTimeoutTrips << " idle_timeout trips from " << result.samples << " samples"
              << std::endl;
    return result;
}

std::vector<Trip> TripSyncJob::segmentAll(const std::vector<PositionSample>& samples) const {
    auto prepared = prepareForSegmentation(samples, config_);
    std::vector<Trip> all;
    for (const auto& strategy : strategies_) {
        auto trips = strategy->segment(prepared);
        all.insert(all.end(), trips.begin(), trips.end());
    }
    return all;
}

} // namespace fleetsense::domain
