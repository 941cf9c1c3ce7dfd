#include "DwellTracker.hpp"

namespace fleetsense::domain {

DwellTracker::DwellTracker(LocationConfig config)
    : config_(config) {
}

std::optional<DwellPoint> DwellTracker::onSample(const PositionSample& sample) {
    MotionState newState;
    if (!sample.ignitionOn) {
        newState = MotionState::Parked;
    } else if (sample.speedKph < config_.idleDwellSpeedKph) {
        newState = MotionState::Idling;
    } else {
        newState = MotionState::Driving;
    }

    std::optional<DwellPoint> finished;

    switch (currentState_) {
        case MotionState::Unknown:
            // No history: an episode cannot be dated yet
            break;

        case MotionState::Driving:
            if (newState != MotionState::Driving) {
                episode_ = Episode{sample.point(), sample.timestamp};
            }
            break;

        case MotionState::Idling:
            if (newState == MotionState::Driving) {
                finished = closeEpisode(sample);
            }
            break;

        case MotionState::Parked:
            if (newState != MotionState::Parked) {
                finished = closeEpisode(sample);
                if (newState == MotionState::Idling) {
                    episode_ = Episode{sample.point(), sample.timestamp};
                }
            }
            break;
    }

    currentState_ = newState;
    return finished;
}

std::optional<DwellPoint> DwellTracker::closeEpisode(const PositionSample& sample) {
    if (!episode_) {
        return std::nullopt;
    }

    DwellPoint dwell;
    dwell.vehicleId = sample.vehicleId;
    dwell.point = episode_->point;
    dwell.arrival = episode_->start;
    dwell.durationMinutes = minutesBetween(episode_->start, sample.timestamp);
    episode_.reset();

    if (dwell.durationMinutes < config_.minDwellMinutes) {
        return std::nullopt;
    }
    return dwell;
}

std::string motionStateToString(MotionState state) {
    switch (state) {
        case MotionState::Unknown: return "unknown";
        case MotionState::Driving: return "driving";
        case MotionState::Idling: return "idling";
        case MotionState::Parked: return "parked";
    }
    return "unknown";
}

} // namespace fleetsense::domain
