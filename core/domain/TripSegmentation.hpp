#pragma once

#include "../InsightConfig.hpp"
#include "../PositionSample.hpp"
#include "../Trip.hpp"
#include <vector>

namespace fleetsense::domain {

/**
 * @brief One way of cutting a vehicle's timeline into trips
 *
 * Implementations are pure: the same ordered samples always give the same
 * trips. Input is one vehicle, ascending, with unique timestamps.
 */
class TripSegmentationStrategy {
public:
    virtual ~TripSegmentationStrategy() = default;

    virtual TripSource source() const = 0;
    virtual std::vector<Trip> segment(const std::vector<PositionSample>& samples) const = 0;
};

// Trips bounded by ignition transitions, split on long reporting gaps.
class IgnitionTripStrategy : public TripSegmentationStrategy {
public:
    explicit IgnitionTripStrategy(TripConfig config);

    TripSource source() const override { return TripSource::Ignition; }
    std::vector<Trip> segment(const std::vector<PositionSample>& samples) const override;

private:
    TripConfig config_;
};

// Trips over ignition-on samples only, ended by a sustained zero-speed run.
class IdleTimeoutTripStrategy : public TripSegmentationStrategy {
public:
    explicit IdleTimeoutTripStrategy(TripConfig config);

    TripSource source() const override { return TripSource::IdleTimeout; }
    std::vector<Trip> segment(const std::vector<PositionSample>& samples) const override;

private:
    TripConfig config_;
};

class TripBuilder {
public:
    /**
     * @brief Aggregate a closed window of samples into a trip
     * @throws ComputationError when the window has no duration or its
     *         great-circle distance is below the noise floor
     */
    static Trip build(const std::vector<PositionSample>& window, TripSource source, const TripConfig& config);

    // Builds and appends, logging and dropping degenerate windows.
    static void emit(const std::vector<PositionSample>& window, TripSource source,
                     const TripConfig& config, std::vector<Trip>& out);
};

// Sorts, drops duplicate timestamps and (if enabled) GPS spikes.
std::vector<PositionSample> prepareForSegmentation(std::vector<PositionSample> samples, const TripConfig& config);

} // namespace fleetsense::domain
