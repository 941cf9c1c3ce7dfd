#include <gtest/gtest.h>
#include "../core/domain/IngestionPipeline.hpp"
#include "../core/Errors.hpp"
#include "../core/domain/EventBus.hpp"
#include "../core/adapters/DefaultPolicies.hpp"
#include "../core/adapters/InMemoryEventStore.hpp"
#include "../core/adapters/InMemoryLocationStore.hpp"
#include "../core/adapters/InMemoryPositionStore.hpp"
#include "TestSamples.hpp"
#include <memory>
#include <mutex>
#include <thread>

using namespace fleetsense;
using namespace fleetsense::test;

namespace {

class FlakyEventStore : public adapters::InMemoryEventStore {
public:
    void failInserts(int times) {
        std::lock_guard<std::mutex> lock(flakyMutex_);
        remainingFailures_ = times;
    }

    bool insertWithCooldown(const VehicleEvent& event, std::chrono::seconds cooldown) override {
        {
            std::lock_guard<std::mutex> lock(flakyMutex_);
            if (remainingFailures_ != 0) {
                if (remainingFailures_ > 0) {
                    --remainingFailures_;
                }
                throw StorageError("event store unavailable");
            }
        }
        return adapters::InMemoryEventStore::insertWithCooldown(event, cooldown);
    }

private:
    std::mutex flakyMutex_;
    int remainingFailures_ = 0;   // -1 fails forever
};

}  // namespace

class IngestionPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        positions_ = std::make_shared<adapters::InMemoryPositionStore>();
        events_ = std::make_shared<adapters::InMemoryEventStore>();
        locations_ = std::make_shared<adapters::InMemoryLocationStore>();
        eventBus_ = std::make_shared<domain::EventBus>();
        auto policyEngine = std::make_shared<adapters::DefaultPolicyEngine>(config_);
        auto clusterer = std::make_shared<domain::LocationClusterer>(
            config_.locations, config_.utcOffsetMinutes, locations_, positions_);
        pipeline_ = std::make_unique<domain::IngestionPipeline>(
            config_, positions_, events_, eventBus_, policyEngine, clusterer);

        eventBus_->subscribeAll([this](const VehicleEvent& event) {
            published_.push_back(event);
        });
        t0_ = at("2025-01-10T08:00:00Z");
    }

    std::vector<VehicleEvent> storedOfType(EventType type) const {
        ports::EventFilter filter;
        filter.type = type;
        return events_->query(filter);
    }

    InsightConfig config_;
    std::shared_ptr<adapters::InMemoryPositionStore> positions_;
    std::shared_ptr<adapters::InMemoryEventStore> events_;
    std::shared_ptr<adapters::InMemoryLocationStore> locations_;
    std::shared_ptr<domain::EventBus> eventBus_;
    std::unique_ptr<domain::IngestionPipeline> pipeline_;
    std::vector<VehicleEvent> published_;
    Timestamp t0_;
};

TEST_F(IngestionPipelineTest, BatteryDropIsStoredAndPublished) {
    using Outcome = domain::IngestionPipeline::Outcome;
    EXPECT_EQ(pipeline_->ingest(makeSample("V1", t0_, -26.2, 28.04, 0, false, 25.0)), Outcome::Accepted);
    EXPECT_EQ(pipeline_->ingest(makeSample("V1", plusMinutes(t0_, 1), -26.2, 28.04, 0, false, 18.0)), Outcome::Accepted);
    EXPECT_EQ(pipeline_->ingest(makeSample("V1", plusMinutes(t0_, 2), -26.2, 28.04, 0, false, 8.0)), Outcome::Accepted);
    pipeline_->flush();

    EXPECT_TRUE(published_.empty());
    eventBus_->processEvents();

    ASSERT_EQ(published_.size(), 2u);
    EXPECT_EQ(published_[0].type, EventType::LowBattery);
    EXPECT_EQ(published_[1].type, EventType::CriticalBattery);
    EXPECT_EQ(storedOfType(EventType::LowBattery).size(), 1u);
    EXPECT_EQ(storedOfType(EventType::CriticalBattery).size(), 1u);

    auto stats = pipeline_->stats();
    EXPECT_EQ(stats.received, 3u);
    EXPECT_EQ(stats.accepted, 3u);
    EXPECT_EQ(stats.eventsStored, 2u);
}

TEST_F(IngestionPipelineTest, DuplicateAndInvalidSamples) {
    auto sample = makeSample("V1", t0_, -26.2, 28.04, 0, false);
    auto invalid = makeSample("V1", plusMinutes(t0_, 1), 95.0, 28.04, 0, false);

    EXPECT_EQ(pipeline_->ingest(sample), domain::IngestionPipeline::Outcome::Accepted);
    EXPECT_EQ(pipeline_->ingest(sample), domain::IngestionPipeline::Outcome::Duplicate);
    EXPECT_EQ(pipeline_->ingest(invalid), domain::IngestionPipeline::Outcome::Rejected);

    auto stats = pipeline_->stats();
    EXPECT_EQ(stats.duplicates, 1u);
    EXPECT_EQ(stats.rejected, 1u);
    EXPECT_EQ(positions_->size(), 1u);
    EXPECT_EQ(domain::outcomeToString(domain::IngestionPipeline::Outcome::Rejected), "rejected");
}

TEST_F(IngestionPipelineTest, OutOfOrderSamplesInsideWindowAreReordered) {
    pipeline_->ingest(makeSample("V1", t0_, -26.2, 28.04, 0, true));
    pipeline_->ingest(makeSample("V1", plusSeconds(t0_, 20), -26.2, 28.04, 70, true));
    EXPECT_EQ(pipeline_->ingest(makeSample("V1", plusSeconds(t0_, 10), -26.2, 28.04, 35, true)),
              domain::IngestionPipeline::Outcome::Accepted);
    pipeline_->flush();

    auto accel = storedOfType(EventType::RapidAcceleration);
    ASSERT_EQ(accel.size(), 1u);
    EXPECT_EQ(accel[0].createdAt, plusSeconds(t0_, 10));
    EXPECT_TRUE(storedOfType(EventType::HarshBraking).empty());
}

TEST_F(IngestionPipelineTest, LateSampleIsStoredButNotDetected) {
    pipeline_->ingest(makeSample("V1", t0_, -26.2, 28.04, 0, true));
    pipeline_->ingest(makeSample("V1", plusSeconds(t0_, 100), -26.2, 28.04, 0, true));
    pipeline_->ingest(makeSample("V1", plusSeconds(t0_, 200), -26.2, 28.04, 0, true));

    auto outcome = pipeline_->ingest(makeSample("V1", plusSeconds(t0_, 90), -26.2, 28.04, 130, true));
    pipeline_->flush();

    EXPECT_EQ(outcome, domain::IngestionPipeline::Outcome::Late);
    EXPECT_EQ(positions_->size(), 4u);
    EXPECT_EQ(pipeline_->stats().late, 1u);
    EXPECT_TRUE(storedOfType(EventType::Overspeeding).empty());
}

TEST_F(IngestionPipelineTest, CooldownSuppressesRepeatedAlerts) {
    pipeline_->ingest(makeSample("V1", t0_, -26.2, 28.04, 110, true));
    pipeline_->ingest(makeSample("V1", plusMinutes(t0_, 1), -26.2, 28.04, 90, true));
    pipeline_->ingest(makeSample("V1", plusMinutes(t0_, 2), -26.2, 28.04, 110, true));
    pipeline_->flush();
    eventBus_->processEvents();

    auto stats = pipeline_->stats();
    EXPECT_EQ(stats.eventsStored, 1u);
    EXPECT_EQ(stats.eventsSuppressed, 1u);
    EXPECT_EQ(storedOfType(EventType::Overspeeding).size(), 1u);
    EXPECT_EQ(published_.size(), 1u);
}

TEST_F(IngestionPipelineTest, ParkingBetweenDrivesLearnsALocation) {
    for (int minute = 0; minute <= 5; ++minute) {
        pipeline_->ingest(makeSample("V1", plusMinutes(t0_, minute), -26.2 + minute * 0.001, 28.04, 40, true));
    }
    for (int minute = 6; minute <= 26; ++minute) {
        pipeline_->ingest(makeSample("V1", plusMinutes(t0_, minute), -26.194, 28.04, 0, false));
    }
    pipeline_->ingest(makeSample("V1", plusMinutes(t0_, 27), -26.194, 28.04, 30, true));
    pipeline_->flush();

    auto learned = locations_->forVehicle("V1");
    ASSERT_EQ(learned.size(), 1u);
    EXPECT_EQ(learned[0].visitCount, 1);
    EXPECT_DOUBLE_EQ(learned[0].totalDurationMinutes, 21.0);
    EXPECT_EQ(pipeline_->stats().dwellsObserved, 1u);
    EXPECT_EQ(pipeline_->motionState("V1"), domain::MotionState::Driving);
    EXPECT_EQ(pipeline_->motionState("V9"), domain::MotionState::Unknown);
}

TEST_F(IngestionPipelineTest, VehiclesIngestConcurrently) {
    auto feed = [this](const std::string& vehicleId) {
        for (int minute = 0; minute < 50; ++minute) {
            pipeline_->ingest(makeSample(vehicleId, plusMinutes(t0_, minute), -26.2, 28.04, 0, false));
        }
    };

    std::thread first(feed, "V1");
    std::thread second(feed, "V2");
    first.join();
    second.join();
    pipeline_->flush();

    EXPECT_EQ(pipeline_->stats().accepted, 100u);
    EXPECT_EQ(positions_->size(), 100u);
}

class IngestionStoreOutageTest : public ::testing::Test {
protected:
    void SetUp() override {
        positions_ = std::make_shared<adapters::InMemoryPositionStore>();
        events_ = std::make_shared<FlakyEventStore>();
        auto locations = std::make_shared<adapters::InMemoryLocationStore>();
        eventBus_ = std::make_shared<domain::EventBus>();
        // One attempt per insert so a single failure exhausts the retry budget
        auto policyEngine = std::make_shared<adapters::DefaultPolicyEngine>(
            config_, adapters::ExponentialBackoffRetryPolicy(std::chrono::milliseconds(1), 2.0,
                                                             std::chrono::milliseconds(1), 1));
        auto clusterer = std::make_shared<domain::LocationClusterer>(
            config_.locations, config_.utcOffsetMinutes, locations, positions_);
        pipeline_ = std::make_unique<domain::IngestionPipeline>(
            config_, positions_, events_, eventBus_, policyEngine, clusterer);
        t0_ = at("2025-01-10T08:00:00Z");
    }

    std::vector<VehicleEvent> storedOfType(EventType type) const {
        ports::EventFilter filter;
        filter.type = type;
        return events_->query(filter);
    }

    InsightConfig config_;
    std::shared_ptr<adapters::InMemoryPositionStore> positions_;
    std::shared_ptr<FlakyEventStore> events_;
    std::shared_ptr<domain::EventBus> eventBus_;
    std::unique_ptr<domain::IngestionPipeline> pipeline_;
    Timestamp t0_;
};

TEST_F(IngestionStoreOutageTest, FailedInsertDoesNotStopLaterSamples) {
    using Outcome = domain::IngestionPipeline::Outcome;
    EXPECT_EQ(pipeline_->ingest(makeSample("V1", t0_, -26.2, 28.04, 0, false, 50.0)), Outcome::Accepted);
    EXPECT_EQ(pipeline_->ingest(makeSample("V1", plusSeconds(t0_, 10), -26.2, 28.04, 0, false, 15.0)),
              Outcome::Accepted);
    EXPECT_EQ(pipeline_->ingest(makeSample("V1", plusSeconds(t0_, 20), -26.2, 28.04, 0, true, 15.0)),
              Outcome::Accepted);

    events_->failInserts(1);
    ASSERT_NO_THROW(pipeline_->flush());

    auto ignition = storedOfType(EventType::IgnitionOn);
    ASSERT_EQ(ignition.size(), 1u);
    EXPECT_EQ(ignition[0].createdAt, plusSeconds(t0_, 20));

    // The battery event that hit the outage is re-inserted before the next sample
    auto battery = storedOfType(EventType::LowBattery);
    ASSERT_EQ(battery.size(), 1u);
    EXPECT_EQ(battery[0].createdAt, plusSeconds(t0_, 10));

    auto stats = pipeline_->stats();
    EXPECT_EQ(stats.eventsDeferred, 1u);
    EXPECT_EQ(stats.eventsDropped, 0u);
    EXPECT_EQ(stats.eventsStored, 2u);
    EXPECT_EQ(pipeline_->unstoredEvents(), 0u);
}

TEST_F(IngestionStoreOutageTest, DeferredEventsWaitForTheStoreToRecover) {
    events_->failInserts(-1);
    ASSERT_NO_THROW(pipeline_->ingest(makeSample("V1", t0_, -26.2, 28.04, 0, false, 25.0)));
    ASSERT_NO_THROW(pipeline_->ingest(makeSample("V1", plusMinutes(t0_, 1), -26.2, 28.04, 0, false, 18.0)));
    ASSERT_NO_THROW(pipeline_->ingest(makeSample("V1", plusMinutes(t0_, 2), -26.2, 28.04, 0, false, 8.0)));
    ASSERT_NO_THROW(pipeline_->flush());

    EXPECT_EQ(pipeline_->unstoredEvents(), 2u);
    EXPECT_EQ(events_->size(), 0u);
    EXPECT_EQ(positions_->size(), 3u);

    events_->failInserts(0);
    pipeline_->flush();

    EXPECT_EQ(pipeline_->unstoredEvents(), 0u);
    EXPECT_EQ(storedOfType(EventType::LowBattery).size(), 1u);
    EXPECT_EQ(storedOfType(EventType::CriticalBattery).size(), 1u);

    EXPECT_EQ(pipeline_->stats().eventsStored, 2u);
}
