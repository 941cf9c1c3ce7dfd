#include "IngestionPipeline.hpp"
#include "RetryRunner.hpp"
#include "../Errors.hpp"
#include <iostream>

namespace fleetsense::domain {

IngestionPipeline::IngestionPipeline(InsightConfig config,
                                     std::shared_ptr<ports::IPositionStore> positions,
                                     std::shared_ptr<ports::IEventStore> events,
                                     std::shared_ptr<ports::IEventBus> eventBus,
                                     std::shared_ptr<ports::IPolicyEngine> policyEngine,
                                     std::shared_ptr<LocationClusterer> clusterer)
    : config_(config), positions_(positions), events_(events), eventBus_(eventBus),
      policyEngine_(policyEngine), clusterer_(clusterer), detector_(config.detector, policyEngine) {
}

IngestionPipeline::Lane& IngestionPipeline::laneFor(const std::string& vehicleId) {
    std::lock_guard<std::mutex> lock(lanesMutex_);
    auto& lane = lanes_[vehicleId];
    if (!lane) {
        lane = std::make_unique<Lane>(config_.pipeline.reorderWindow, config_.locations);
    }
    return *lane;
}

IngestionPipeline::Outcome IngestionPipeline::ingest(const PositionSample& sample) {
    ++received_;

    try {
        validateSample(sample);
    } catch (const InputError& e) {
        ++rejected_;
        std::cerr << "[Ingest] Rejected sample for '" << sample.vehicleId << "': " << e.what() << std::endl;
        return Outcome::Rejected;
    }

    Lane& lane = laneFor(sample.vehicleId);
    std::lock_guard<std::mutex> lock(lane.mutex);

    bool stored = runWithRetry(policyEngine_->getRetryPolicy(), "append sample for " + sample.vehicleId,
                               [&]() { return positions_->append(sample); });
    if (!stored) {
        ++duplicates_;
        return Outcome::Duplicate;
    }

    switch (lane.sequencer.push(sample)) {
        case SampleSequencer::Admission::Duplicate:
            ++duplicates_;
            return Outcome::Duplicate;
        case SampleSequencer::Admission::Late:
            // Kept for batch jobs; the live detectors already moved past it
            ++late_;
            std::cout << "[Ingest] Late sample for " << sample.vehicleId << " at "
                      << formatIso8601(sample.timestamp) << std::endl;
            return Outcome::Late;
        case SampleSequencer::Admission::Buffered:
            break;
    }

    ++accepted_;
    for (const auto& ready : lane.sequencer.drainReady()) {
        process(lane, ready);
    }
    return Outcome::Accepted;
}

void IngestionPipeline::flush() {
    std::vector<Lane*> lanes;
    {
        std::lock_guard<std::mutex> lock(lanesMutex_);
        for (auto& entry : lanes_) {
            lanes.push_back(entry.second.get());
        }
    }

    for (Lane* lane : lanes) {
        std::lock_guard<std::mutex> lock(lane->mutex);
        for (const auto& ready : lane->sequencer.flush()) {
            process(*lane, ready);
        }
        redriveUnstored(*lane);
    }
}

void IngestionPipeline::process(Lane& lane, const PositionSample& sample) {
    redriveUnstored(lane);

    // Detector state has already moved past this sample, so a failed insert
    // must not lose the event or skip the samples behind it
    for (const auto& event : detector_.evaluate(lane.detectorState, sample)) {
        if (!storeEvent(event)) {
            deferEvent(lane, event);
        }
    }

    if (auto dwell = lane.dwellTracker.onSample(sample)) {
        try {
            clusterer_->observe(*dwell);
            ++dwellsObserved_;
        } catch (const PipelineError& e) {
            std::cerr << "[Ingest] Dwell for " << sample.vehicleId << " not clustered: " << e.what() << std::endl;
        }
    }
}

void IngestionPipeline::redriveUnstored(Lane& lane) {
    while (!lane.unstoredEvents.empty()) {
        if (!storeEvent(lane.unstoredEvents.front())) {
            return;
        }
        lane.unstoredEvents.pop_front();
    }
}

void IngestionPipeline::deferEvent(Lane& lane, const VehicleEvent& event) {
    if (lane.unstoredEvents.size() >= kMaxUnstoredEvents) {
        std::cerr << "[Ingest] Deferred queue full for " << event.vehicleId << ", dropping event "
                  << lane.unstoredEvents.front().id << std::endl;
        lane.unstoredEvents.pop_front();
        ++eventsDropped_;
    }
    lane.unstoredEvents.push_back(event);
    ++eventsDeferred_;
}

bool IngestionPipeline::storeEvent(const VehicleEvent& event) {
    auto cooldown = policyEngine_->getCooldownPolicy().getCooldown(event.type);
    bool inserted = false;
    try {
        inserted = runWithRetry(policyEngine_->getRetryPolicy(), "store event " + event.id,
                                [&]() { return events_->insertWithCooldown(event, cooldown); });
    } catch (const StorageError& e) {
        std::cerr << "[Ingest] Event " << event.id << " (" << eventTypeToString(event.type)
                  << ") deferred: " << e.what() << std::endl;
        return false;
    }

    if (!inserted) {
        ++eventsSuppressed_;
        return true;
    }

    ++eventsStored_;
    std::cout << "[Events] " << event.vehicleId << " " << eventTypeToString(event.type)
              << " (" << severityToString(event.severity) << ") " << event.title << std::endl;
    eventBus_->publish(event);
    return true;
}

IngestionPipeline::Stats IngestionPipeline::stats() const {
    Stats s;
    s.received = received_.load();
    s.accepted = accepted_.load();
    s.duplicates = duplicates_.load();
    s.rejected = rejected_.load();
    s.late = late_.load();
    s.eventsStored = eventsStored_.load();
    s.eventsSuppressed = eventsSuppressed_.load();
    s.eventsDeferred = eventsDeferred_.load();
    s.eventsDropped = eventsDropped_.load();
    s.dwellsObserved = dwellsObserved_.load();
    return s;
}

std::size_t IngestionPipeline::unstoredEvents() const {
    std::vector<Lane*> lanes;
    {
        std::lock_guard<std::mutex> lock(lanesMutex_);
        for (const auto& entry : lanes_) {
            lanes.push_back(entry.second.get());
        }
    }

    std::size_t total = 0;
    for (Lane* lane : lanes) {
        std::lock_guard<std::mutex> lock(lane->mutex);
        total += lane->unstoredEvents.size();
    }
    return total;
}

MotionState IngestionPipeline::motionState(const std::string& vehicleId) const {
    Lane* lane = nullptr;
    {
        std::lock_guard<std::mutex> lock(lanesMutex_);
        auto it = lanes_.find(vehicleId);
        if (it == lanes_.end()) {
            return MotionState::Unknown;
        }
        lane = it->second.get();
    }
    std::lock_guard<std::mutex> lock(lane->mutex);
    return lane->dwellTracker.currentState();
}

std::string outcomeToString(IngestionPipeline::Outcome outcome) {
    switch (outcome) {
        case IngestionPipeline::Outcome::Accepted: return "accepted";
        case IngestionPipeline::Outcome::Duplicate: return "duplicate";
        case IngestionPipeline::Outcome::Rejected: return "rejected";
        case IngestionPipeline::Outcome::Late: return "late";
    }
    return "unknown";
}

} // namespace fleetsense::domain
