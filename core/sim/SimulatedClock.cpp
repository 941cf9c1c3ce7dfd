#include "SimulatedClock.hpp"

namespace fleetsense::sim {

SimulatedClock::SimulatedClock(Timestamp startTime)
    : simulatedTime_(startTime), realStartTime_(std::chrono::steady_clock::now()) {
}

Timestamp SimulatedClock::now() const {
    if (frozen_) {
        return simulatedTime_;
    }

    // Simulated time plus real time elapsed since the last adjustment
    auto realElapsed = std::chrono::steady_clock::now() - realStartTime_;
    return simulatedTime_ + std::chrono::duration_cast<std::chrono::system_clock::duration>(realElapsed);
}

uint64_t SimulatedClock::epochSeconds() const {
    return static_cast<uint64_t>(toEpochSeconds(now()));
}

std::string SimulatedClock::iso8601() const {
    return formatIso8601(now());
}

void SimulatedClock::advance(std::chrono::seconds duration) {
    simulatedTime_ = now() + duration;
    realStartTime_ = std::chrono::steady_clock::now();
}

void SimulatedClock::setCurrentTime(Timestamp time) {
    simulatedTime_ = time;
    realStartTime_ = std::chrono::steady_clock::now();
}

} // namespace fleetsense::sim
