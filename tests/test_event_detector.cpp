#include <gtest/gtest.h>
#include "../core/domain/EventDetector.hpp"
#include "../core/adapters/DefaultPolicies.hpp"
#include "TestSamples.hpp"
#include <algorithm>
#include <memory>

using namespace fleetsense;
using namespace fleetsense::test;

class EventDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        policyEngine_ = std::make_shared<adapters::DefaultPolicyEngine>();
        detector_ = std::make_unique<domain::EventDetector>(DetectorConfig{}, policyEngine_);
        t0_ = at("2025-01-10T08:00:00Z");
    }

    std::vector<VehicleEvent> feed(const PositionSample& sample) {
        return detector_->evaluate(state_, sample);
    }

    static std::vector<VehicleEvent> ofType(const std::vector<VehicleEvent>& events, EventType type) {
        std::vector<VehicleEvent> result;
        std::copy_if(events.begin(), events.end(), std::back_inserter(result),
                     [type](const VehicleEvent& e) { return e.type == type; });
        return result;
    }

    std::shared_ptr<adapters::DefaultPolicyEngine> policyEngine_;
    std::unique_ptr<domain::EventDetector> detector_;
    domain::DetectorState state_;
    Timestamp t0_;
};

TEST_F(EventDetectorTest, BatteryCrossingsEmitOnePerThreshold) {
    auto first = feed(makeSample("V1", t0_, -26.2, 28.04, 0, false, 25.0));
    auto second = feed(makeSample("V1", plusMinutes(t0_, 1), -26.2, 28.04, 0, false, 18.0));
    auto third = feed(makeSample("V1", plusMinutes(t0_, 2), -26.2, 28.04, 0, false, 8.0));

    EXPECT_TRUE(ofType(first, EventType::LowBattery).empty());

    auto low = ofType(second, EventType::LowBattery);
    ASSERT_EQ(low.size(), 1u);
    EXPECT_EQ(low[0].severity, Severity::Warning);
    EXPECT_DOUBLE_EQ(*low[0].valueBefore, 25.0);
    EXPECT_DOUBLE_EQ(*low[0].valueAfter, 18.0);
    EXPECT_DOUBLE_EQ(low[0].metadata["battery_percent"].get<double>(), 18.0);

    auto critical = ofType(third, EventType::CriticalBattery);
    ASSERT_EQ(critical.size(), 1u);
    EXPECT_EQ(critical[0].severity, Severity::Critical);
    EXPECT_TRUE(ofType(third, EventType::LowBattery).empty());
}

TEST_F(EventDetectorTest, BatteryStayingLowDoesNotRefire) {
    feed(makeSample("V1", t0_, -26.2, 28.04, 0, false, 25.0));
    feed(makeSample("V1", plusMinutes(t0_, 1), -26.2, 28.04, 0, false, 18.0));
    auto again = feed(makeSample("V1", plusMinutes(t0_, 20), -26.2, 28.04, 0, false, 17.0));

    EXPECT_TRUE(ofType(again, EventType::LowBattery).empty());
}

TEST_F(EventDetectorTest, IgnitionScenarioEmitsOnOffAndTripCompleted) {
    auto s1 = makeSample("V1", t0_, -26.20, 28.04, 0, false);
    auto s2 = makeSample("V1", plusMinutes(t0_, 1), -26.20, 28.04, 10, true);
    auto s3 = makeSample("V1", plusMinutes(t0_, 2), -26.19, 28.04, 40, true);
    auto s4 = makeSample("V1", plusMinutes(t0_, 3), -26.18, 28.04, 0, false, 76.0);
    s2.odometerMeters = 1000.0;
    s3.odometerMeters = 2000.0;
    s4.odometerMeters = 3000.0;

    EXPECT_TRUE(ofType(feed(s1), EventType::IgnitionOn).empty());

    auto at2 = feed(s2);
    auto on = ofType(at2, EventType::IgnitionOn);
    ASSERT_EQ(on.size(), 1u);
    EXPECT_EQ(on[0].createdAt, s2.timestamp);
    EXPECT_EQ(on[0].expiresAt, s2.timestamp + std::chrono::hours(2));

    auto at3 = feed(s3);
    EXPECT_TRUE(ofType(at3, EventType::IgnitionOn).empty());
    EXPECT_TRUE(ofType(at3, EventType::IgnitionOff).empty());

    auto at4 = feed(s4);
    auto off = ofType(at4, EventType::IgnitionOff);
    auto completed = ofType(at4, EventType::TripCompleted);
    ASSERT_EQ(off.size(), 1u);
    ASSERT_EQ(completed.size(), 1u);

    EXPECT_DOUBLE_EQ(completed[0].metadata["distance_km"].get<double>(), 2.0);
    EXPECT_DOUBLE_EQ(completed[0].metadata["duration_minutes"].get<double>(), 2.0);
    EXPECT_DOUBLE_EQ(completed[0].metadata["final_battery"].get<double>(), 76.0);
    EXPECT_EQ(completed[0].metadata["trip_start"].get<std::string>(), formatIso8601(s2.timestamp));
    EXPECT_EQ(completed[0].expiresAt, s4.timestamp + std::chrono::hours(4));
}

TEST_F(EventDetectorTest, FirstSampleOnlyRunsRulesWithoutHistory) {
    auto events = feed(makeSample("V1", t0_, -26.2, 28.04, 130, true, 50.0));

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, EventType::Overspeeding);
    EXPECT_EQ(events[0].severity, Severity::Error);
    EXPECT_TRUE(events[0].metadata["previous_speed"].is_null());
}

TEST_F(EventDetectorTest, OverspeedSeverityTiers) {
    struct Case { double speed; Severity expected; };
    for (const auto& c : {Case{110, Severity::Warning}, Case{125, Severity::Error}, Case{150, Severity::Critical}}) {
        domain::DetectorState state;
        detector_->evaluate(state, makeSample("V1", t0_, -26.2, 28.04, 90, true));
        auto events = ofType(detector_->evaluate(state, makeSample("V1", plusMinutes(t0_, 1), -26.2, 28.04, c.speed, true)),
                             EventType::Overspeeding);
        ASSERT_EQ(events.size(), 1u) << c.speed;
        EXPECT_EQ(events[0].severity, c.expected) << c.speed;
    }
}

TEST_F(EventDetectorTest, AccelerationAndBrakingUseStrictDeltas) {
    feed(makeSample("V1", t0_, -26.2, 28.04, 10, true));
    auto exactlyThirty = feed(makeSample("V1", plusSeconds(t0_, 30), -26.2, 28.04, 40, true));
    EXPECT_TRUE(ofType(exactlyThirty, EventType::RapidAcceleration).empty());

    auto accel = feed(makeSample("V1", plusSeconds(t0_, 60), -26.2, 28.04, 75, true));
    EXPECT_EQ(ofType(accel, EventType::RapidAcceleration).size(), 1u);

    auto brake = feed(makeSample("V1", plusSeconds(t0_, 90), -26.2, 28.04, 20, true));
    auto harsh = ofType(brake, EventType::HarshBraking);
    ASSERT_EQ(harsh.size(), 1u);
    EXPECT_DOUBLE_EQ(harsh[0].metadata["delta"].get<double>(), 55.0);
}

TEST_F(EventDetectorTest, MovingAgainNeedsIgnitionAndLowPreviousSpeed) {
    feed(makeSample("V1", t0_, -26.2, 28.04, 0, true));
    auto moving = feed(makeSample("V1", plusMinutes(t0_, 1), -26.2, 28.04, 12, true));
    EXPECT_EQ(ofType(moving, EventType::VehicleMoving).size(), 1u);

    auto stillMoving = feed(makeSample("V1", plusMinutes(t0_, 2), -26.2, 28.04, 20, true));
    EXPECT_TRUE(ofType(stillMoving, EventType::VehicleMoving).empty());
}

TEST_F(EventDetectorTest, IdleTooLongFiresAtThreshold) {
    std::vector<VehicleEvent> idle;
    for (int minute = 0; minute <= 35; minute += 5) {
        auto events = feed(makeSample("V1", plusMinutes(t0_, minute), -26.2, 28.04, 0, true, 60.0));
        auto found = ofType(events, EventType::IdleTooLong);
        if (minute < 30) {
            EXPECT_TRUE(found.empty()) << minute;
        }
        idle.insert(idle.end(), found.begin(), found.end());
    }

    ASSERT_FALSE(idle.empty());
    EXPECT_EQ(idle.front().createdAt, plusMinutes(t0_, 30));
    EXPECT_DOUBLE_EQ(idle.front().metadata["idle_minutes"].get<double>(), 30.0);
    EXPECT_EQ(idle.front().metadata["threshold_minutes"].get<int>(), 30);
}

TEST_F(EventDetectorTest, IdleRunResetsWhenVehicleMoves) {
    feed(makeSample("V1", t0_, -26.2, 28.04, 0, true));
    feed(makeSample("V1", plusMinutes(t0_, 20), -26.2, 28.04, 0, true));
    feed(makeSample("V1", plusMinutes(t0_, 21), -26.2, 28.04, 30, true));
    feed(makeSample("V1", plusMinutes(t0_, 22), -26.2, 28.04, 0, true));
    auto events = feed(makeSample("V1", plusMinutes(t0_, 40), -26.2, 28.04, 0, true));

    EXPECT_TRUE(ofType(events, EventType::IdleTooLong).empty());
}

TEST_F(EventDetectorTest, ConnectivityTransitions) {
    auto online = makeSample("V1", t0_, -26.2, 28.04, 0, false);
    auto offline = makeSample("V1", plusMinutes(t0_, 1), -26.2, 28.04, 0, false);
    offline.isOnline = false;
    auto back = makeSample("V1", plusMinutes(t0_, 31), -26.2, 28.04, 0, false);

    feed(online);
    auto down = ofType(feed(offline), EventType::Offline);
    ASSERT_EQ(down.size(), 1u);
    EXPECT_EQ(down[0].severity, Severity::Warning);

    auto up = ofType(feed(back), EventType::Online);
    ASSERT_EQ(up.size(), 1u);
    EXPECT_DOUBLE_EQ(up[0].metadata["offline_minutes"].get<double>(), 30.0);
}

TEST_F(EventDetectorTest, EventIdsAreDeterministic) {
    domain::DetectorState other;
    auto sample = makeSample("V1", t0_, -26.2, 28.04, 130, true);

    auto a = feed(sample);
    auto b = detector_->evaluate(other, sample);

    ASSERT_EQ(a.size(), 1u);
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(a[0].id, b[0].id);
    EXPECT_EQ(a[0].id.size(), 36u);
}

TEST_F(EventDetectorTest, ListsEveryRule) {
    auto names = detector_->ruleNames();
    EXPECT_EQ(names.size(), 8u);
    EXPECT_NE(std::find(names.begin(), names.end(), "ignition"), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), "idle"), names.end());
}
