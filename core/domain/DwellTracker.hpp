#pragma once

#include "../InsightConfig.hpp"
#include "../LearnedLocation.hpp"
#include "../PositionSample.hpp"
#include <optional>
#include <string>

namespace fleetsense::domain {

enum class MotionState {
    Unknown,
    Driving,
    Idling,
    Parked
};

/**
 * @brief Per-vehicle state machine turning samples into dwell episodes
 *
 * Parked spans ignition off to ignition on. Idling spans ignition on at crawl
 * speed until the vehicle moves again; switching the engine off while idling
 * turns the episode into parking without resetting its start. A finished
 * episode long enough to matter is returned as a DwellPoint.
 */
class DwellTracker {
public:
    explicit DwellTracker(LocationConfig config);

    std::optional<DwellPoint> onSample(const PositionSample& sample);

    MotionState currentState() const { return currentState_; }

private:
    struct Episode {
        GeoPoint point;
        Timestamp start;
    };

    std::optional<DwellPoint> closeEpisode(const PositionSample& sample);

    LocationConfig config_;
    MotionState currentState_ = MotionState::Unknown;
    std::optional<Episode> episode_;
};

std::string motionStateToString(MotionState state);

} // namespace fleetsense::domain
