#include "SampleSequencer.hpp"

namespace fleetsense::domain {

SampleSequencer::SampleSequencer(std::chrono::seconds reorderWindow)
    : reorderWindow_(reorderWindow) {
}

SampleSequencer::Admission SampleSequencer::push(const PositionSample& sample) {
    if (lastReleased_ && !(*lastReleased_ < sample.timestamp)) {
        return *lastReleased_ == sample.timestamp ? Admission::Duplicate : Admission::Late;
    }

    if (!buffer_.emplace(toEpochSeconds(sample.timestamp), sample).second) {
        return Admission::Duplicate;
    }

    if (!newestSeen_ || *newestSeen_ < sample.timestamp) {
        newestSeen_ = sample.timestamp;
    }
    return Admission::Buffered;
}

std::vector<PositionSample> SampleSequencer::drainReady() {
    std::vector<PositionSample> ready;
    if (!newestSeen_) {
        return ready;
    }

    Timestamp horizon = *newestSeen_ - reorderWindow_;
    while (!buffer_.empty()) {
        auto first = buffer_.begin();
        if (horizon < first->second.timestamp) {
            break;
        }
        lastReleased_ = first->second.timestamp;
        ready.push_back(std::move(first->second));
        buffer_.erase(first);
    }
    return ready;
}

std::vector<PositionSample> SampleSequencer::flush() {
    std::vector<PositionSample> ready;
    for (auto& entry : buffer_) {
        lastReleased_ = entry.second.timestamp;
        ready.push_back(std::move(entry.second));
    }
    buffer_.clear();
    return ready;
}

} // namespace fleetsense::domain
