/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the FleetSense CLI
 *
 * Supported Sections:
 * - [detector]: event thresholds and cooldowns
 * - [trips]: segmentation gap, idle timeout, noise floor and spike filter
 * - [locations]: clustering radius, dwell threshold, history window, UTC offset
 * - [health]: batch workers, recompute window, trip source
 * - [pipeline]: reorder window
 * - [retention]: event purge ages
 * - [mqtt]: broker connection and topics
 *
 * Values from the file may be overridden by FLEETSENSE_* environment
 * variables, see applyEnvironment().
 *
 * @note Flat `key = value` subset of TOML: no arrays or inline tables
 */

#pragma once

#include <cstdlib>
#include <functional>
#include <string>
#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>
#include "Errors.hpp"
#include "InsightConfig.hpp"

namespace fleetsense {

class TomlConfig {
public:
    using EnvLookup = std::function<const char*(const char*)>;

    /**
     * @brief Load and parse a TOML configuration file
     * @throws ConfigError if the file cannot be read or a value does not parse
     */
    static InsightConfig loadFromFile(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            throw ConfigError("Could not open config file: " + filename);
        }

        InsightConfig config = parse(file);
        warnMissingTlsFiles(config.mqtt);
        return config;
    }

    static InsightConfig loadFromString(const std::string& text) {
        std::istringstream stream(text);
        return parse(stream);
    }

    /**
     * @brief Apply FLEETSENSE_* environment overrides
     *
     * FLEETSENSE_MQTT_HOST, FLEETSENSE_MQTT_PORT, FLEETSENSE_MQTT_USERNAME,
     * FLEETSENSE_MQTT_PASSWORD, FLEETSENSE_UTC_OFFSET_MINUTES and
     * FLEETSENSE_HEALTH_WORKERS.
     */
    static void applyEnvironment(InsightConfig& config, const EnvLookup& lookup = defaultLookup) {
        if (const char* v = lookup("FLEETSENSE_MQTT_HOST")) config.mqtt.host = v;
        if (const char* v = lookup("FLEETSENSE_MQTT_PORT")) config.mqtt.port = toPort("FLEETSENSE_MQTT_PORT", v);
        if (const char* v = lookup("FLEETSENSE_MQTT_USERNAME")) config.mqtt.username = v;
        if (const char* v = lookup("FLEETSENSE_MQTT_PASSWORD")) config.mqtt.password = v;
        if (const char* v = lookup("FLEETSENSE_UTC_OFFSET_MINUTES")) {
            config.utcOffsetMinutes = toInt("FLEETSENSE_UTC_OFFSET_MINUTES", v);
        }
        if (const char* v = lookup("FLEETSENSE_HEALTH_WORKERS")) {
            config.health.workerCount = toInt("FLEETSENSE_HEALTH_WORKERS", v);
        }
    }

private:
    static const char* defaultLookup(const char* name) {
        return std::getenv(name);
    }

    static InsightConfig parse(std::istream& input) {
        InsightConfig config;

        std::string currentSection;
        std::string line;
        while (std::getline(input, line)) {
            // Remove comments, keeping '#' inside quoted values
            size_t commentPos = findComment(line);
            if (commentPos != std::string::npos) {
                line = line.substr(0, commentPos);
            }

            trim(line);
            if (line.empty()) {
                continue;
            }

            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                }
                continue;
            }

            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                std::cerr << "[Config] Ignoring malformed line: " << line << std::endl;
                continue;
            }

            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);
            unquote(value);

            if (!applyKey(config, currentSection, key, value)) {
                std::cerr << "[Config] Unknown key " << currentSection << "." << key << std::endl;
            }
        }

        return config;
    }

    static bool applyKey(InsightConfig& config, const std::string& section,
                         const std::string& key, const std::string& value) {
        const std::string name = section + "." + key;

        if (section == "detector") {
            auto& d = config.detector;
            if (key == "low_battery_pct") d.lowBatteryPct = toDouble(name, value);
            else if (key == "critical_battery_pct") d.criticalBatteryPct = toDouble(name, value);
            else if (key == "overspeed_kph") d.overspeedKph = toDouble(name, value);
            else if (key == "overspeed_error_kph") d.overspeedErrorKph = toDouble(name, value);
            else if (key == "overspeed_critical_kph") d.overspeedCriticalKph = toDouble(name, value);
            else if (key == "rapid_acceleration_delta_kph") d.rapidAccelerationDeltaKph = toDouble(name, value);
            else if (key == "harsh_braking_delta_kph") d.harshBrakingDeltaKph = toDouble(name, value);
            else if (key == "moving_speed_kph") d.movingSpeedKph = toDouble(name, value);
            else if (key == "idle_speed_kph") d.idleSpeedKph = toDouble(name, value);
            else if (key == "idle_threshold_minutes") d.idleThreshold = std::chrono::minutes(toInt(name, value));
            else if (key == "idle_lookback_minutes") d.idleLookback = std::chrono::minutes(toInt(name, value));
            else if (key == "cooldown_minutes") d.defaultCooldown = std::chrono::minutes(toInt(name, value));
            else if (key == "moving_cooldown_minutes") d.movingCooldown = std::chrono::minutes(toInt(name, value));
            else return false;
        } else if (section == "trips") {
            auto& t = config.trips;
            if (key == "max_sample_gap_seconds") t.maxSampleGap = std::chrono::seconds(toInt(name, value));
            else if (key == "idle_timeout_seconds") t.idleTimeout = std::chrono::seconds(toInt(name, value));
            else if (key == "noise_floor_km") t.noiseFloorKm = toDouble(name, value);
            else if (key == "spike_filter") t.spikeFilterEnabled = toBool(name, value);
            else if (key == "spike_max_jump_km") t.spikeMaxJumpKm = toDouble(name, value);
            else if (key == "spike_max_speed_kph") t.spikeMaxSpeedKph = toDouble(name, value);
            else return false;
        } else if (section == "locations") {
            auto& l = config.locations;
            if (key == "cluster_radius_m") l.clusterRadiusMeters = toDouble(name, value);
            else if (key == "min_dwell_minutes") l.minDwellMinutes = toDouble(name, value);
            else if (key == "idle_dwell_speed_kph") l.idleDwellSpeedKph = toDouble(name, value);
            else if (key == "history_window_days") l.historyWindowDays = toInt(name, value);
            else if (key == "classify_after_visits") l.classifyAfterVisits = toInt(name, value);
            else if (key == "nearby_radius_m") l.nearbyDefaultRadiusMeters = toDouble(name, value);
            else if (key == "utc_offset_minutes") config.utcOffsetMinutes = toInt(name, value);
            else return false;
        } else if (section == "health") {
            auto& h = config.health;
            if (key == "workers") h.workerCount = toInt(name, value);
            else if (key == "recompute_days") h.recomputeDays = toInt(name, value);
            else if (key == "trip_source") {
                try {
                    h.tripSource = stringToTripSource(value);
                } catch (const InputError& e) {
                    throw ConfigError(name + ": " + e.what());
                }
            }
            else return false;
        } else if (section == "pipeline") {
            if (key == "reorder_window_seconds") config.pipeline.reorderWindow = std::chrono::seconds(toInt(name, value));
            else return false;
        } else if (section == "retention") {
            if (key == "max_age_days") config.retention.maxAgeDays = toInt(name, value);
            else if (key == "info_max_age_days") config.retention.infoMaxAgeDays = toInt(name, value);
            else return false;
        } else if (section == "mqtt") {
            auto& m = config.mqtt;
            if (key == "host") m.host = value;
            else if (key == "port") m.port = toPort(name, value);
            else if (key == "client_id") m.clientId = value;
            else if (key == "username") m.username = value;
            else if (key == "password") m.password = value;
            else if (key == "use_tls") m.useTls = toBool(name, value);
            else if (key == "ca_path") m.caPath = value;
            else if (key == "cert_path") m.certPath = value;
            else if (key == "key_path") m.keyPath = value;
            else if (key == "position_topic") m.positionTopic = value;
            else if (key == "event_topic_prefix") m.eventTopicPrefix = value;
            else return false;
        } else {
            return false;
        }
        return true;
    }

    static void warnMissingTlsFiles(const MqttConfig& mqtt) {
        namespace fs = std::filesystem;

        for (const auto* path : {&mqtt.caPath, &mqtt.certPath, &mqtt.keyPath}) {
            if (!path->empty() && !fs::exists(*path)) {
                std::cerr << "[Config] Warning: TLS file not found: " << *path << std::endl;
            }
        }
    }

    static int toInt(const std::string& name, const std::string& value) {
        try {
            size_t used = 0;
            int result = std::stoi(value, &used);
            if (used != value.size()) {
                throw ConfigError(name + ": trailing characters in '" + value + "'");
            }
            return result;
        } catch (const std::logic_error&) {
            throw ConfigError(name + ": expected an integer, got '" + value + "'");
        }
    }

    static double toDouble(const std::string& name, const std::string& value) {
        try {
            size_t used = 0;
            double result = std::stod(value, &used);
            if (used != value.size()) {
                throw ConfigError(name + ": trailing characters in '" + value + "'");
            }
            return result;
        } catch (const std::logic_error&) {
            throw ConfigError(name + ": expected a number, got '" + value + "'");
        }
    }

    static bool toBool(const std::string& name, const std::string& value) {
        if (value == "true" || value == "1") return true;
        if (value == "false" || value == "0") return false;
        throw ConfigError(name + ": expected true or false, got '" + value + "'");
    }

    static std::uint16_t toPort(const std::string& name, const std::string& value) {
        int port = toInt(name, value);
        if (port <= 0 || port > 65535) {
            throw ConfigError(name + ": port out of range: " + value);
        }
        return static_cast<std::uint16_t>(port);
    }

    static size_t findComment(const std::string& line) {
        bool quoted = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') {
                quoted = !quoted;
            } else if (line[i] == '#' && !quoted) {
                return i;
            }
        }
        return std::string::npos;
    }

    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }

    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
};

} // namespace fleetsense
