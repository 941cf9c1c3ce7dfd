#include <gtest/gtest.h>
#include "../core/domain/LocationClusterer.hpp"
#include "../core/domain/DwellTracker.hpp"
#include "../core/adapters/InMemoryLocationStore.hpp"
#include "../core/adapters/InMemoryPositionStore.hpp"
#include "../core/Geo.hpp"
#include "TestSamples.hpp"
#include <cmath>
#include <memory>

using namespace fleetsense;
using namespace fleetsense::test;

class LocationClustererTest : public ::testing::Test {
protected:
    void SetUp() override {
        locations_ = std::make_shared<adapters::InMemoryLocationStore>();
        positions_ = std::make_shared<adapters::InMemoryPositionStore>();
        clusterer_ = std::make_unique<domain::LocationClusterer>(config_, 0, locations_, positions_);
        day0_ = at("2025-01-01T00:00:00Z");
    }

    DwellPoint dwellAt(double lat, double lon, Timestamp arrival, double minutes = 20.0) const {
        DwellPoint dwell;
        dwell.vehicleId = "V1";
        dwell.point = GeoPoint{lat, lon};
        dwell.arrival = arrival;
        dwell.durationMinutes = minutes;
        return dwell;
    }

    LearnedLocation locationWith(int visits, double totalMinutes) const {
        LearnedLocation location;
        location.id = "loc";
        location.vehicleId = "V1";
        location.visitCount = visits;
        location.totalDurationMinutes = totalMinutes;
        return location;
    }

    LocationConfig config_;
    Timestamp day0_;
    std::shared_ptr<adapters::InMemoryLocationStore> locations_;
    std::shared_ptr<adapters::InMemoryPositionStore> positions_;
    std::unique_ptr<domain::LocationClusterer> clusterer_;
};

TEST_F(LocationClustererTest, MidpointMergeIsOrderIndependent) {
    GeoPoint a{-26.2000, 28.0400};
    GeoPoint b{-26.2003, 28.0402};

    auto ab = Geo::midpoint(a, b);
    auto ba = Geo::midpoint(b, a);
    EXPECT_DOUBLE_EQ(ab.lat, ba.lat);
    EXPECT_DOUBLE_EQ(ab.lon, ba.lon);

    LearnedLocation location = locationWith(1, 20.0);
    location.centroid = a;
    location.firstVisit = day0_;
    location.lastVisit = day0_;
    auto merged = domain::LocationClusterer::mergeVisit(location, dwellAt(b.lat, b.lon, plusMinutes(day0_, 60), 10.0));

    EXPECT_DOUBLE_EQ(merged.centroid.lat, ab.lat);
    EXPECT_DOUBLE_EQ(merged.centroid.lon, ab.lon);
    EXPECT_EQ(merged.visitCount, 2);
    EXPECT_DOUBLE_EQ(merged.totalDurationMinutes, 30.0);
    EXPECT_EQ(merged.firstVisit, day0_);
    EXPECT_EQ(merged.lastVisit, plusMinutes(day0_, 60));
}

TEST_F(LocationClustererTest, MidpointAcrossAntimeridianStaysNearby) {
    GeoPoint east{-16.5000, 179.9999};
    GeoPoint west{-16.5000, -179.9999};
    ASSERT_LT(Geo::distanceMeters(east, west), 25.0);

    auto ew = Geo::midpoint(east, west);
    auto we = Geo::midpoint(west, east);
    EXPECT_DOUBLE_EQ(ew.lon, we.lon);
    EXPECT_NEAR(std::abs(ew.lon), 180.0, 1e-9);
    EXPECT_DOUBLE_EQ(ew.lat, -16.5);
    EXPECT_LT(Geo::distanceMeters(ew, east), 15.0);
    EXPECT_LT(Geo::distanceMeters(ew, west), 15.0);

    LearnedLocation location = locationWith(1, 20.0);
    location.centroid = east;
    location.firstVisit = day0_;
    location.lastVisit = day0_;
    auto merged = domain::LocationClusterer::mergeVisit(
        location, dwellAt(west.lat, west.lon, plusMinutes(day0_, 60), 10.0));
    EXPECT_LT(Geo::distanceMeters(merged.centroid, east), 15.0);
    EXPECT_EQ(merged.visitCount, 2);

    GeoPoint nearDateline{10.0, 170.0};
    GeoPoint pastDateline{10.0, -170.0};
    EXPECT_NEAR(std::abs(Geo::midpoint(nearDateline, pastDateline).lon), 180.0, 1e-9);
    EXPECT_DOUBLE_EQ(Geo::midpoint(GeoPoint{0.0, -10.0}, GeoPoint{0.0, 30.0}).lon, 10.0);
}

TEST_F(LocationClustererTest, MorningAndEveningRoutineIsFrequent) {
    for (int day = 0; day < 10; ++day) {
        Timestamp midnight = day0_ + std::chrono::hours(24 * day);
        double jitter = (day % 2 == 0) ? 0.0002 : -0.0002;
        clusterer_->observe(dwellAt(-26.2000 + jitter, 28.0400, midnight + std::chrono::hours(8)));
        clusterer_->observe(dwellAt(-26.2000 - jitter, 28.0400, midnight + std::chrono::hours(18)));
    }

    auto learned = locations_->forVehicle("V1");
    ASSERT_EQ(learned.size(), 1u);
    EXPECT_EQ(learned[0].visitCount, 20);
    EXPECT_DOUBLE_EQ(learned[0].totalDurationMinutes, 400.0);
    EXPECT_EQ(learned[0].locationType, LocationType::Frequent);
    EXPECT_DOUBLE_EQ(learned[0].confidence, 1.0);

    auto patterns = locations_->patterns(learned[0].id);
    ASSERT_EQ(patterns.size(), 2u);
    for (const auto& pattern : patterns) {
        EXPECT_EQ(pattern.visitCount, 10);
        EXPECT_DOUBLE_EQ(pattern.avgDurationMinutes, 20.0);
    }
}

TEST_F(LocationClustererTest, OvernightStaysBecomeHome) {
    LearnedLocation last;
    for (int day = 0; day < 12; ++day) {
        Timestamp arrival = day0_ + std::chrono::hours(24 * day + 23);
        last = clusterer_->observe(dwellAt(-26.1000, 28.0000, arrival, 480.0));
    }

    EXPECT_EQ(last.visitCount, 12);
    EXPECT_EQ(last.locationType, LocationType::Home);
    ASSERT_TRUE(last.typicalArrivalHour.has_value());
    EXPECT_EQ(*last.typicalArrivalHour, 23);
    EXPECT_DOUBLE_EQ(last.confidence, 12.0 / 20.0);
}

TEST_F(LocationClustererTest, TypeStaysUnknownUntilEnoughVisits) {
    auto first = clusterer_->observe(dwellAt(-26.1, 28.0, day0_ + std::chrono::hours(23)));
    auto second = clusterer_->observe(dwellAt(-26.1, 28.0, day0_ + std::chrono::hours(47)));

    EXPECT_EQ(first.locationType, LocationType::Unknown);
    EXPECT_EQ(second.locationType, LocationType::Unknown);
    EXPECT_EQ(second.id, first.id);
    EXPECT_FALSE(second.typicalArrivalHour.has_value());
}

TEST_F(LocationClustererTest, DistantDwellStartsNewCluster) {
    auto home = clusterer_->observe(dwellAt(-26.1000, 28.0000, day0_));
    auto shop = clusterer_->observe(dwellAt(-26.1010, 28.0000, plusMinutes(day0_, 120)));

    EXPECT_NE(home.id, shop.id);
    EXPECT_EQ(locations_->forVehicle("V1").size(), 2u);
    EXPECT_TRUE(locations_->forVehicle("V2").empty());
}

TEST_F(LocationClustererTest, NamingPinsConfidence) {
    auto location = clusterer_->observe(dwellAt(-26.1, 28.0, day0_));

    auto named = clusterer_->nameLocation(location.id, "Depot");
    ASSERT_TRUE(named.has_value());
    EXPECT_EQ(*named->customLabel, "Depot");
    EXPECT_DOUBLE_EQ(named->confidence, 1.0);

    auto again = clusterer_->observe(dwellAt(-26.1, 28.0, plusMinutes(day0_, 600)));
    EXPECT_DOUBLE_EQ(again.confidence, 1.0);
    EXPECT_EQ(*again.customLabel, "Depot");

    EXPECT_FALSE(clusterer_->nameLocation("missing", "Nowhere").has_value());
}

TEST_F(LocationClustererTest, DaytimeHistoryWithManyVisitsIsWork) {
    std::vector<PositionSample> history;
    for (int hour = 9; hour <= 17; ++hour) {
        history.push_back(makeSample("V1", day0_ + std::chrono::hours(hour), -26.1, 28.0, 0, false));
    }

    auto signals = clusterer_->signalsFromHistory(history);
    ASSERT_TRUE(signals.meanHour.has_value());
    EXPECT_DOUBLE_EQ(*signals.meanHour, 13.0);
    EXPECT_DOUBLE_EQ(signals.nightFraction, 0.0);

    EXPECT_EQ(clusterer_->classify(locationWith(15, 15 * 240.0), {}, signals), LocationType::Work);
    EXPECT_EQ(clusterer_->classify(locationWith(5, 5 * 240.0), {}, signals), LocationType::Frequent);
}

TEST_F(LocationClustererTest, ShortStopsAreParking) {
    domain::LocationSignals none;
    EXPECT_EQ(clusterer_->classify(locationWith(5, 50.0), {}, none), LocationType::Parking);
}

class DwellTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        t0_ = at("2025-01-10T08:00:00Z");
    }

    std::vector<DwellPoint> run(const std::vector<PositionSample>& samples) {
        std::vector<DwellPoint> dwells;
        for (const auto& sample : samples) {
            if (auto dwell = tracker_.onSample(sample)) {
                dwells.push_back(*dwell);
            }
        }
        return dwells;
    }

    std::vector<PositionSample> driveParkDrive(int parkMinutes) const {
        std::vector<PositionSample> samples;
        for (int minute = 0; minute <= 5; ++minute) {
            samples.push_back(makeSample("V1", plusMinutes(t0_, minute), -26.2 + minute * 0.01, 28.04, 40, true));
        }
        for (int minute = 6; minute < 6 + parkMinutes; ++minute) {
            samples.push_back(makeSample("V1", plusMinutes(t0_, minute), -26.14, 28.04, 0, false));
        }
        samples.push_back(makeSample("V1", plusMinutes(t0_, 6 + parkMinutes), -26.14, 28.04, 30, true));
        return samples;
    }

    Timestamp t0_;
    domain::DwellTracker tracker_{LocationConfig{}};
};

TEST_F(DwellTrackerTest, ParkBetweenDrivesIsADwell) {
    auto dwells = run(driveParkDrive(20));

    ASSERT_EQ(dwells.size(), 1u);
    EXPECT_EQ(dwells[0].vehicleId, "V1");
    EXPECT_EQ(dwells[0].arrival, plusMinutes(t0_, 6));
    EXPECT_DOUBLE_EQ(dwells[0].durationMinutes, 20.0);
    EXPECT_DOUBLE_EQ(dwells[0].point.lat, -26.14);
    EXPECT_EQ(tracker_.currentState(), domain::MotionState::Driving);
}

TEST_F(DwellTrackerTest, ShortParkIsIgnored) {
    EXPECT_TRUE(run(driveParkDrive(5)).empty());
}

TEST_F(DwellTrackerTest, IdleThenEngineOffKeepsEpisodeStart) {
    std::vector<PositionSample> samples{
        makeSample("V1", t0_, -26.20, 28.04, 40, true),
        makeSample("V1", plusMinutes(t0_, 6), -26.19, 28.04, 0, true),
        makeSample("V1", plusMinutes(t0_, 10), -26.19, 28.04, 0, false),
        makeSample("V1", plusMinutes(t0_, 30), -26.19, 28.04, 35, true),
    };

    auto dwells = run(samples);

    ASSERT_EQ(dwells.size(), 1u);
    EXPECT_EQ(dwells[0].arrival, plusMinutes(t0_, 6));
    EXPECT_DOUBLE_EQ(dwells[0].durationMinutes, 24.0);
}

TEST_F(DwellTrackerTest, FirstSampleCannotCloseAnEpisode) {
    std::vector<PositionSample> samples{
        makeSample("V1", t0_, -26.19, 28.04, 0, false),
        makeSample("V1", plusMinutes(t0_, 60), -26.19, 28.04, 35, true),
    };

    EXPECT_TRUE(run(samples).empty());
    EXPECT_EQ(domain::motionStateToString(tracker_.currentState()), "driving");
}
