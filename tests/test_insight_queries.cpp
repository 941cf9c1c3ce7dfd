#include <gtest/gtest.h>
#include "../core/domain/InsightQueryService.hpp"
#include "../core/adapters/DefaultPolicies.hpp"
#include "../core/adapters/InMemoryEventStore.hpp"
#include "../core/adapters/InMemoryHealthStore.hpp"
#include "../core/adapters/InMemoryLocationStore.hpp"
#include "../core/adapters/InMemoryPositionStore.hpp"
#include "../core/adapters/InMemoryTripStore.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include "TestSamples.hpp"
#include <memory>

using namespace fleetsense;
using namespace fleetsense::test;

class InsightQueryTest : public ::testing::Test {
protected:
    void SetUp() override {
        events_ = std::make_shared<adapters::InMemoryEventStore>();
        trips_ = std::make_shared<adapters::InMemoryTripStore>();
        locations_ = std::make_shared<adapters::InMemoryLocationStore>();
        health_ = std::make_shared<adapters::InMemoryHealthStore>();
        auto positions = std::make_shared<adapters::InMemoryPositionStore>();
        auto policyEngine = std::make_shared<adapters::DefaultPolicyEngine>(config_);
        auto clusterer = std::make_shared<domain::LocationClusterer>(config_.locations, 0, locations_, positions);

        now_ = at("2025-03-01T12:00:00Z");
        clock_ = std::make_shared<sim::SimulatedClock>(now_);
        clock_->freezeTime();

        queries_ = std::make_unique<domain::InsightQueryService>(
            config_, events_, trips_, locations_, health_, policyEngine, clusterer, clock_);
    }

    VehicleEvent storeEvent(const std::string& id, EventType type, Severity severity,
                            Timestamp createdAt, std::chrono::hours lifetime = std::chrono::hours(24),
                            const std::string& vehicleId = "V1") {
        VehicleEvent e;
        e.id = id;
        e.vehicleId = vehicleId;
        e.type = type;
        e.severity = severity;
        e.createdAt = createdAt;
        e.expiresAt = createdAt + lifetime;
        EXPECT_TRUE(events_->insertWithCooldown(e, std::chrono::seconds(0)));
        return e;
    }

    LearnedLocation storeLocation(const std::string& id, double lat, double lon, int visits,
                                  Timestamp lastVisit) {
        LearnedLocation location;
        location.id = id;
        location.vehicleId = "V1";
        location.centroid = GeoPoint{lat, lon};
        location.visitCount = visits;
        location.firstVisit = lastVisit - std::chrono::hours(24 * 10);
        location.lastVisit = lastVisit;
        locations_->upsert(location);
        return location;
    }

    InsightConfig config_;
    Timestamp now_;
    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<adapters::InMemoryEventStore> events_;
    std::shared_ptr<adapters::InMemoryTripStore> trips_;
    std::shared_ptr<adapters::InMemoryLocationStore> locations_;
    std::shared_ptr<adapters::InMemoryHealthStore> health_;
    std::unique_ptr<domain::InsightQueryService> queries_;
};

TEST_F(InsightQueryTest, UnacknowledgedSkipsExpiredAndAcknowledged) {
    storeEvent("e1", EventType::LowBattery, Severity::Warning, now_ - std::chrono::hours(1));
    storeEvent("e2", EventType::Overspeeding, Severity::Warning, now_ - std::chrono::hours(2));
    storeEvent("e3", EventType::IgnitionOn, Severity::Info, now_ - std::chrono::hours(3), std::chrono::hours(2));
    storeEvent("e4", EventType::Offline, Severity::Warning, now_ - std::chrono::minutes(30),
               std::chrono::hours(24), "V2");

    ASSERT_TRUE(queries_->acknowledge("e2"));
    EXPECT_TRUE(queries_->acknowledge("e2"));
    EXPECT_FALSE(queries_->acknowledge("missing"));

    auto open = queries_->unacknowledged(std::string("V1"));
    ASSERT_EQ(open.size(), 1u);
    EXPECT_EQ(open[0].id, "e1");

    auto fleet = queries_->unacknowledged(std::nullopt, 1);
    ASSERT_EQ(fleet.size(), 1u);
    EXPECT_EQ(fleet[0].id, "e4");
}

TEST_F(InsightQueryTest, StatisticsGroupByTypeAndSeverityWithinWindow) {
    storeEvent("o1", EventType::Overspeeding, Severity::Warning, now_ - std::chrono::hours(1));
    storeEvent("o2", EventType::Overspeeding, Severity::Warning, now_ - std::chrono::hours(5));
    storeEvent("o3", EventType::Overspeeding, Severity::Error, now_ - std::chrono::hours(6));
    storeEvent("b1", EventType::LowBattery, Severity::Warning, now_ - std::chrono::hours(30));
    storeEvent("old", EventType::LowBattery, Severity::Warning, now_ - std::chrono::hours(24 * 8));
    queries_->acknowledge("o2");

    auto rows = queries_->statistics(std::string("V1"), 7);
    ASSERT_EQ(rows.size(), 3u);

    EXPECT_EQ(rows[0].type, EventType::Overspeeding);
    EXPECT_EQ(rows[0].severity, Severity::Warning);
    EXPECT_EQ(rows[0].count, 2u);
    EXPECT_EQ(rows[0].acknowledgedCount, 1u);
    EXPECT_EQ(rows[0].lastOccurrence, now_ - std::chrono::hours(1));

    std::size_t total = 0;
    for (const auto& row : rows) total += row.count;
    EXPECT_EQ(total, 4u);

    EXPECT_EQ(queries_->statistics(std::string("V1"), 1).size(), 2u);
}

TEST_F(InsightQueryTest, PurgeAppliesEveryRetentionRule) {
    storeEvent("fresh", EventType::LowBattery, Severity::Warning, now_ - std::chrono::hours(1));
    storeEvent("acked-expired", EventType::IgnitionOn, Severity::Info, now_ - std::chrono::hours(3),
               std::chrono::hours(2));
    storeEvent("expired-open", EventType::Overspeeding, Severity::Warning, now_ - std::chrono::hours(30));
    storeEvent("old-info", EventType::Online, Severity::Info, now_ - std::chrono::hours(24 * 8));
    storeEvent("ancient", EventType::CriticalBattery, Severity::Critical, now_ - std::chrono::hours(24 * 31));
    queries_->acknowledge("acked-expired");

    EXPECT_EQ(queries_->purgeEvents(), 3u);

    EXPECT_TRUE(events_->find("fresh").has_value());
    EXPECT_TRUE(events_->find("expired-open").has_value());
    EXPECT_FALSE(events_->find("acked-expired").has_value());
    EXPECT_FALSE(events_->find("old-info").has_value());
    EXPECT_FALSE(events_->find("ancient").has_value());

    EXPECT_EQ(queries_->purgeEvents(), 0u);
}

TEST_F(InsightQueryTest, ExpiryAndRetentionFollowTheClock) {
    storeEvent("alert", EventType::Overspeeding, Severity::Warning, now_ - std::chrono::hours(1),
               std::chrono::hours(4));
    storeEvent("status", EventType::Online, Severity::Info, now_ - std::chrono::hours(1));

    EXPECT_EQ(queries_->unacknowledged(std::string("V1")).size(), 2u);
    EXPECT_EQ(queries_->statistics(std::string("V1"), 1).size(), 2u);
    EXPECT_EQ(queries_->purgeEvents(), 0u);

    // Past the alert's expiry but inside the one-day window
    clock_->advance(std::chrono::hours(5));
    auto open = queries_->unacknowledged(std::string("V1"));
    ASSERT_EQ(open.size(), 1u);
    EXPECT_EQ(open[0].id, "status");
    EXPECT_EQ(queries_->statistics(std::string("V1"), 1).size(), 2u);
    EXPECT_EQ(queries_->purgeEvents(), 0u);

    // Both out of the daily window, the Info event past its shorter retention
    clock_->advance(std::chrono::hours(24 * 7));
    EXPECT_TRUE(queries_->statistics(std::string("V1"), 1).empty());
    EXPECT_EQ(queries_->purgeEvents(), 1u);
    EXPECT_FALSE(events_->find("status").has_value());
    EXPECT_TRUE(events_->find("alert").has_value());
}

TEST_F(InsightQueryTest, NearbyIsNearestFirstWithinRadius) {
    storeLocation("far", -26.2000, 28.0400, 3, now_);
    storeLocation("near", -26.2003, 28.0400, 5, now_);
    storeLocation("out", -26.2100, 28.0400, 9, now_);

    GeoPoint probe{-26.2004, 28.0400};
    auto hits = queries_->nearby("V1", probe);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].location.id, "near");
    EXPECT_EQ(hits[1].location.id, "far");
    EXPECT_LT(hits[0].distanceMeters, hits[1].distanceMeters);
    EXPECT_LE(hits[1].distanceMeters, config_.locations.nearbyDefaultRadiusMeters);

    EXPECT_EQ(queries_->nearby("V1", probe, 2000.0).size(), 3u);
    EXPECT_TRUE(queries_->nearby("V2", probe).empty());
}

TEST_F(InsightQueryTest, RankedByVisitsThenRecency) {
    storeLocation("a", -26.20, 28.04, 4, now_ - std::chrono::hours(5));
    storeLocation("b", -26.21, 28.04, 7, now_ - std::chrono::hours(48));
    storeLocation("c", -26.22, 28.04, 4, now_ - std::chrono::hours(1));

    auto ranked = queries_->ranked("V1");
    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(ranked[0].id, "b");
    EXPECT_EQ(ranked[1].id, "c");
    EXPECT_EQ(ranked[2].id, "a");

    EXPECT_EQ(queries_->ranked("V1", 1).size(), 1u);
}

TEST_F(InsightQueryTest, NamingPinsLabelAndConfidence) {
    storeLocation("depot", -26.20, 28.04, 2, now_);

    auto named = queries_->nameLocation("depot", "North depot");
    ASSERT_TRUE(named.has_value());
    EXPECT_EQ(named->customLabel.value_or(""), "North depot");
    EXPECT_DOUBLE_EQ(named->confidence, 1.0);

    auto stored = locations_->find("depot");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->customLabel.value_or(""), "North depot");

    EXPECT_FALSE(queries_->nameLocation("nowhere", "x").has_value());
}

TEST_F(InsightQueryTest, VisitPatternsPassThrough) {
    storeLocation("home", -26.20, 28.04, 6, now_);
    VisitPattern evening;
    evening.locationId = "home";
    evening.dayPart = DayPart::Evening;
    evening.visitCount = 6;
    evening.typicalHour = 18.5;
    evening.avgDurationMinutes = 600.0;
    locations_->upsertPattern(evening);

    auto patterns = queries_->visitPatterns("home");
    ASSERT_EQ(patterns.size(), 1u);
    EXPECT_EQ(patterns[0].dayPart, DayPart::Evening);
    EXPECT_DOUBLE_EQ(patterns[0].typicalHour, 18.5);
    EXPECT_TRUE(queries_->visitPatterns("other").empty());
}

TEST_F(InsightQueryTest, TripsFilterBySource) {
    auto start = at("2025-03-01T08:00:00Z");
    Trip ignition;
    ignition.id = "t-ign";
    ignition.vehicleId = "V1";
    ignition.startTime = start;
    ignition.endTime = start + std::chrono::minutes(20);
    ignition.sourceMethod = TripSource::Ignition;
    Trip idle = ignition;
    idle.id = "t-idle";
    idle.sourceMethod = TripSource::IdleTimeout;

    trips_->replaceRange("V1", TripSource::Ignition, start, start + std::chrono::hours(1), {ignition});
    trips_->replaceRange("V1", TripSource::IdleTimeout, start, start + std::chrono::hours(1), {idle});

    auto from = start - std::chrono::hours(1);
    auto to = start + std::chrono::hours(1);
    EXPECT_EQ(queries_->trips("V1", from, to).size(), 2u);

    auto onlyIdle = queries_->trips("V1", from, to, TripSource::IdleTimeout);
    ASSERT_EQ(onlyIdle.size(), 1u);
    EXPECT_EQ(onlyIdle[0].id, "t-idle");

    EXPECT_TRUE(queries_->trips("V1", to, to + std::chrono::hours(1)).empty());
}

TEST_F(InsightQueryTest, HealthRangeIsInclusive) {
    auto first = CalendarDate::parse("2025-02-26");
    for (int i = 0; i < 4; ++i) {
        DailyHealthFeature feature;
        feature.vehicleId = "V1";
        feature.date = first.addDays(i);
        DailyHealthScore score;
        score.vehicleId = "V1";
        score.date = feature.date;
        score.healthScore = 80 + i;
        health_->upsert(feature, score);
    }

    auto rows = queries_->health("V1", first.addDays(1), first.addDays(2));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].healthScore, 81);
    EXPECT_EQ(rows[1].healthScore, 82);
}
