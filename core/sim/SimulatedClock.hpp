#pragma once

#include "../IClock.hpp"
#include <chrono>
#include <string>

namespace fleetsense::sim {

class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(Timestamp startTime = std::chrono::system_clock::now());
    ~SimulatedClock() override = default;

    // IClock interface
    Timestamp now() const override;
    uint64_t epochSeconds() const override;
    std::string iso8601() const override;

    // Simulation controls
    void advance(std::chrono::seconds duration);
    void setCurrentTime(Timestamp time);

    void freezeTime() { frozen_ = true; }
    void unfreezeTime() { frozen_ = false; }
    bool isFrozen() const { return frozen_; }

private:
    Timestamp simulatedTime_;
    std::chrono::steady_clock::time_point realStartTime_;
    bool frozen_ = false;
};

} // namespace fleetsense::sim
