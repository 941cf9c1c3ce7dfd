#include <gtest/gtest.h>
#include "../platform/desktop/TomlConfig.hpp"
#include <map>

using namespace fleetsense;

TEST(TomlConfigTest, ParsesEverySection) {
    auto config = TomlConfig::loadFromString(R"(
# FleetSense test configuration
[detector]
low_battery_pct = 25
overspeed_kph = 90.5
cooldown_minutes = 3

[trips]
max_sample_gap_seconds = 240
spike_filter = false

[locations]
cluster_radius_m = 75
utc_offset_minutes = 120

[health]
workers = 8
trip_source = "ignition"

[pipeline]
reorder_window_seconds = 10

[retention]
max_age_days = 60

[mqtt]
host = "broker.example.com"   # trailing comment
port = 8883
use_tls = true
ca_path = "/etc/ssl/ca#1.pem"
position_topic = "fleet/+/positions"
)");

    EXPECT_DOUBLE_EQ(config.detector.lowBatteryPct, 25.0);
    EXPECT_DOUBLE_EQ(config.detector.overspeedKph, 90.5);
    EXPECT_EQ(config.detector.defaultCooldown, std::chrono::minutes(3));
    EXPECT_EQ(config.detector.movingCooldown, std::chrono::minutes(10));
    EXPECT_EQ(config.trips.maxSampleGap, std::chrono::seconds(240));
    EXPECT_FALSE(config.trips.spikeFilterEnabled);
    EXPECT_DOUBLE_EQ(config.locations.clusterRadiusMeters, 75.0);
    EXPECT_EQ(config.utcOffsetMinutes, 120);
    EXPECT_EQ(config.health.workerCount, 8);
    EXPECT_EQ(config.health.tripSource, TripSource::Ignition);
    EXPECT_EQ(config.pipeline.reorderWindow, std::chrono::seconds(10));
    EXPECT_EQ(config.retention.maxAgeDays, 60);
    EXPECT_EQ(config.mqtt.host, "broker.example.com");
    EXPECT_EQ(config.mqtt.port, 8883);
    EXPECT_TRUE(config.mqtt.useTls);
    EXPECT_EQ(config.mqtt.caPath, "/etc/ssl/ca#1.pem");
    EXPECT_TRUE(config.mqtt.isConfigured());
    EXPECT_TRUE(config.validate().empty());
}

TEST(TomlConfigTest, EmptyInputGivesDefaults) {
    auto config = TomlConfig::loadFromString("");

    EXPECT_DOUBLE_EQ(config.detector.criticalBatteryPct, 10.0);
    EXPECT_EQ(config.health.tripSource, TripSource::IdleTimeout);
    EXPECT_EQ(config.health.recomputeDays, 2);
    EXPECT_FALSE(config.mqtt.isConfigured());
    EXPECT_TRUE(config.validate().empty());
}

TEST(TomlConfigTest, UnknownKeysAreIgnored) {
    auto config = TomlConfig::loadFromString("[detector]\nfoo = 1\n[nowhere]\nbar = 2\n");
    EXPECT_DOUBLE_EQ(config.detector.lowBatteryPct, 20.0);
}

TEST(TomlConfigTest, BadValuesThrow) {
    EXPECT_THROW(TomlConfig::loadFromString("[detector]\nlow_battery_pct = low\n"), ConfigError);
    EXPECT_THROW(TomlConfig::loadFromString("[health]\nworkers = 4x\n"), ConfigError);
    EXPECT_THROW(TomlConfig::loadFromString("[health]\ntrip_source = gps\n"), ConfigError);
    EXPECT_THROW(TomlConfig::loadFromString("[mqtt]\nport = 70000\n"), ConfigError);
    EXPECT_THROW(TomlConfig::loadFromString("[trips]\nspike_filter = maybe\n"), ConfigError);
    EXPECT_THROW(TomlConfig::loadFromFile("/nonexistent/fleetsense.toml"), ConfigError);
}

TEST(TomlConfigTest, ValidateReportsInconsistentThresholds) {
    auto config = TomlConfig::loadFromString(
        "[detector]\nlow_battery_pct = 10\ncritical_battery_pct = 15\n[health]\nrecompute_days = 7\n");

    auto problems = config.validate();
    EXPECT_EQ(problems.size(), 2u);
}

TEST(TomlConfigTest, EnvironmentOverridesFile) {
    auto config = TomlConfig::loadFromString("[mqtt]\nhost = \"file-host\"\nport = 1883\n");
    std::map<std::string, std::string> env{
        {"FLEETSENSE_MQTT_HOST", "env-host"},
        {"FLEETSENSE_MQTT_PORT", "8884"},
        {"FLEETSENSE_HEALTH_WORKERS", "2"},
    };

    TomlConfig::applyEnvironment(config, [&env](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    });

    EXPECT_EQ(config.mqtt.host, "env-host");
    EXPECT_EQ(config.mqtt.port, 8884);
    EXPECT_EQ(config.health.workerCount, 2);
    EXPECT_EQ(config.utcOffsetMinutes, 0);

    env["FLEETSENSE_UTC_OFFSET_MINUTES"] = "east";
    EXPECT_THROW(TomlConfig::applyEnvironment(config, [&env](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    }), ConfigError);
}
