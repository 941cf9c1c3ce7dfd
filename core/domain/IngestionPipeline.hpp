#pragma once

#include "DwellTracker.hpp"
#include "EventDetector.hpp"
#include "LocationClusterer.hpp"
#include "SampleSequencer.hpp"
#include "../InsightConfig.hpp"
#include "../ports/IEventBus.hpp"
#include "../ports/IEventStore.hpp"
#include "../ports/IPolicyEngine.hpp"
#include "../ports/IPositionStore.hpp"
#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace fleetsense::domain {

/**
 * @brief Live path from an incoming sample to stored events and learned places
 *
 * Every accepted sample is appended to the position store, then passes through
 * its vehicle's reorder buffer. Released samples are evaluated by the event
 * detector in timestamp order; emitted events go through the cooldown-checked
 * insert and are published on the bus only when stored. The same released
 * samples feed the dwell tracker, whose episodes are clustered.
 *
 * An event the store refuses after retries is parked on its lane and
 * re-inserted before the lane's next sample, so a store outage never stops
 * detection for the samples behind it.
 *
 * Vehicles are independent lanes: samples of different vehicles may be
 * ingested concurrently, samples of one vehicle are serialized.
 */
class IngestionPipeline {
public:
    enum class Outcome {
        Accepted,
        Duplicate,
        Rejected,
        Late
    };

    struct Stats {
        std::size_t received = 0;
        std::size_t accepted = 0;
        std::size_t duplicates = 0;
        std::size_t rejected = 0;
        std::size_t late = 0;
        std::size_t eventsStored = 0;
        std::size_t eventsSuppressed = 0;
        std::size_t eventsDeferred = 0;   ///< Insert failed after retries, parked on the lane
        std::size_t eventsDropped = 0;    ///< Evicted from a full deferred queue
        std::size_t dwellsObserved = 0;
    };

    IngestionPipeline(InsightConfig config,
                      std::shared_ptr<ports::IPositionStore> positions,
                      std::shared_ptr<ports::IEventStore> events,
                      std::shared_ptr<ports::IEventBus> eventBus,
                      std::shared_ptr<ports::IPolicyEngine> policyEngine,
                      std::shared_ptr<LocationClusterer> clusterer);

    Outcome ingest(const PositionSample& sample);

    // Releases everything still held in the reorder buffers.
    void flush();

    Stats stats() const;

    // Events still waiting for the event store to come back.
    std::size_t unstoredEvents() const;

    MotionState motionState(const std::string& vehicleId) const;

private:
    struct Lane {
        std::mutex mutex;
        SampleSequencer sequencer;
        DetectorState detectorState;
        DwellTracker dwellTracker;
        std::deque<VehicleEvent> unstoredEvents;

        Lane(std::chrono::seconds reorderWindow, const LocationConfig& locations)
            : sequencer(reorderWindow), dwellTracker(locations) {}
    };

    Lane& laneFor(const std::string& vehicleId);
    static constexpr std::size_t kMaxUnstoredEvents = 500;

    void process(Lane& lane, const PositionSample& sample);
    void redriveUnstored(Lane& lane);
    void deferEvent(Lane& lane, const VehicleEvent& event);
    bool storeEvent(const VehicleEvent& event);

    InsightConfig config_;
    std::shared_ptr<ports::IPositionStore> positions_;
    std::shared_ptr<ports::IEventStore> events_;
    std::shared_ptr<ports::IEventBus> eventBus_;
    std::shared_ptr<ports::IPolicyEngine> policyEngine_;
    std::shared_ptr<LocationClusterer> clusterer_;
    EventDetector detector_;

    mutable std::mutex lanesMutex_;
    std::map<std::string, std::unique_ptr<Lane>> lanes_;

    std::atomic<std::size_t> received_{0};
    std::atomic<std::size_t> accepted_{0};
    std::atomic<std::size_t> duplicates_{0};
    std::atomic<std::size_t> rejected_{0};
    std::atomic<std::size_t> late_{0};
    std::atomic<std::size_t> eventsStored_{0};
    std::atomic<std::size_t> eventsSuppressed_{0};
    std::atomic<std::size_t> eventsDeferred_{0};
    std::atomic<std::size_t> eventsDropped_{0};
    std::atomic<std::size_t> dwellsObserved_{0};
};

std::string outcomeToString(IngestionPipeline::Outcome outcome);

} // namespace fleetsense::domain
