/**
 * @file main_cli.cpp
 * @brief Command-line front end for the FleetSense insight pipeline
 *
 * Replays JSON-lines position files or listens on MQTT, then runs trip
 * sync, the daily health batch and event retention over the in-memory
 * stores, printing JSON summaries on stdout.
 */

#include "InsightConfig.hpp"
#include "IClock.hpp"
#include "JsonCodec.hpp"
#include "PahoMqttClient.hpp"
#include "TomlConfig.hpp"
#include "adapters/DefaultPolicies.hpp"
#include "adapters/InMemoryEventStore.hpp"
#include "adapters/InMemoryHealthStore.hpp"
#include "adapters/InMemoryLocationStore.hpp"
#include "adapters/InMemoryPositionStore.hpp"
#include "adapters/InMemoryTripStore.hpp"
#include "adapters/MqttTransportAdapter.hpp"
#include "domain/EventBus.hpp"
#include "domain/HealthBatchDriver.hpp"
#include "domain/IngestionPipeline.hpp"
#include "domain/InsightQueryService.hpp"
#include "domain/LocationClusterer.hpp"
#include "domain/TelemetryBridge.hpp"
#include "domain/TripSyncJob.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <filesystem>
#include <fstream>
#include <optional>
#include <thread>
#include <chrono>
#include <signal.h>

using namespace fleetsense;

/// Global flag for graceful shutdown coordination
static volatile sig_atomic_t g_running = 1;

void signalHandler(int signal) {
    (void)signal;
    g_running = 0;
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config <file>          Configuration file (default: fleetsense.toml)\n"
              << "  --replay <file.jsonl>    Ingest position samples, one JSON object per line\n"
              << "  --listen                 Subscribe to MQTT positions until Ctrl+C\n"
              << "  --health-date <date>     Score one local date (YYYY-MM-DD)\n"
              << "  --recompute-days <n>     Re-score the last n days ending yesterday\n"
              << "  --purge                  Apply event retention before printing\n"
              << "  --help                   Show this help message\n"
              << "\nSample line:\n"
              << "  {\"vehicle_id\":\"V1\",\"timestamp\":\"2025-01-10T08:00:00Z\",\"latitude\":-26.2,"
              << "\"longitude\":28.04,\"speed\":0,\"ignition_on\":true,\"battery_percent\":80}\n"
              << std::endl;
}

struct CliOptions {
    std::string configFile = "fleetsense.toml";
    bool configExplicit = false;
    std::optional<std::string> replayFile;
    bool listen = false;
    bool purge = false;
    std::optional<CalendarDate> healthDate;
    std::optional<int> recomputeDays;
};

// Everything one run of the CLI wires together.
struct Services {
    std::shared_ptr<adapters::InMemoryPositionStore> positions;
    std::shared_ptr<adapters::InMemoryEventStore> events;
    std::shared_ptr<adapters::InMemoryTripStore> trips;
    std::shared_ptr<adapters::InMemoryLocationStore> locations;
    std::shared_ptr<adapters::InMemoryHealthStore> health;
    std::shared_ptr<adapters::DefaultPolicyEngine> policyEngine;
    std::shared_ptr<domain::EventBus> eventBus;
    std::shared_ptr<domain::LocationClusterer> clusterer;
    std::shared_ptr<domain::IngestionPipeline> pipeline;
    std::shared_ptr<domain::TripSyncJob> tripSync;
    std::shared_ptr<domain::HealthBatchDriver> healthDriver;
    std::shared_ptr<domain::InsightQueryService> queries;
};

Services buildServices(const InsightConfig& config, std::shared_ptr<IClock> clock) {
    Services s;
    s.positions = std::make_shared<adapters::InMemoryPositionStore>();
    s.events = std::make_shared<adapters::InMemoryEventStore>();
    s.trips = std::make_shared<adapters::InMemoryTripStore>();
    s.locations = std::make_shared<adapters::InMemoryLocationStore>();
    s.health = std::make_shared<adapters::InMemoryHealthStore>();
    s.policyEngine = std::make_shared<adapters::DefaultPolicyEngine>(config);
    s.eventBus = std::make_shared<domain::EventBus>();

    s.clusterer = std::make_shared<domain::LocationClusterer>(
        config.locations, config.utcOffsetMinutes, s.locations, s.positions);
    s.pipeline = std::make_shared<domain::IngestionPipeline>(
        config, s.positions, s.events, s.eventBus, s.policyEngine, s.clusterer);
    s.tripSync = std::make_shared<domain::TripSyncJob>(config.trips, s.positions, s.trips, s.policyEngine);
    s.healthDriver = std::make_shared<domain::HealthBatchDriver>(
        config, s.positions, s.trips, s.events, s.health, s.policyEngine, s.tripSync);
    s.queries = std::make_shared<domain::InsightQueryService>(
        config, s.events, s.trips, s.locations, s.health, s.policyEngine, s.clusterer, clock);
    return s;
}

struct ReplaySpan {
    std::optional<Timestamp> first;
    std::optional<Timestamp> last;
    std::size_t lines = 0;
    std::size_t decodeErrors = 0;
};

ReplaySpan replayFile(const std::string& path, Services& services) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open replay file: " + path);
    }

    ReplaySpan span;
    std::string line;
    while (g_running && std::getline(file, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        ++span.lines;
        try {
            auto sample = JsonCodec::deserializeSample(line);
            services.pipeline->ingest(sample);
            if (!span.first || sample.timestamp < *span.first) span.first = sample.timestamp;
            if (!span.last || *span.last < sample.timestamp) span.last = sample.timestamp;
        } catch (const InputError& e) {
            ++span.decodeErrors;
            std::cerr << "[Ingest] Line " << span.lines << " skipped: " << e.what() << std::endl;
        }
    }

    services.pipeline->flush();
    services.eventBus->processEvents();
    return span;
}

void runListener(const InsightConfig& config, Services& services) {
    auto mqttClient = std::make_shared<PahoMqttClient>();
    auto transport = std::make_shared<adapters::MqttTransportAdapter>(mqttClient);
    domain::TelemetryBridge bridge(config.mqtt, transport, services.eventBus, services.policyEngine,
                                   services.pipeline);
    bridge.start();

    auto credentials = ports::BrokerCredentials::fromConfig(config.mqtt);
    if (!transport->connect(credentials)) {
        throw std::runtime_error("MQTT connection to " + config.mqtt.host + " could not be started");
    }

    std::cout << "Listening on " << config.mqtt.positionTopic << ". Press Ctrl+C to stop." << std::endl;
    while (g_running) {
        bridge.processEvents();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "Stopping listener..." << std::endl;
    services.pipeline->flush();
    bridge.processEvents();
    bridge.stop();
    transport->disconnect();

    auto stats = bridge.stats();
    std::cout << "[MQTT] " << stats.messagesReceived << " messages, " << stats.decodeErrors
              << " undecodable, " << stats.eventsPublished << " events published, "
              << bridge.pendingRetries() << " pending" << std::endl;
}

nlohmann::json buildSummary(const Services& services, const std::vector<std::string>& vehicles,
                            Timestamp from, Timestamp to, const InsightConfig& config) {
    nlohmann::json summary;

    auto stats = services.pipeline->stats();
    summary["ingest"] = {
        {"received", stats.received},
        {"accepted", stats.accepted},
        {"duplicates", stats.duplicates},
        {"rejected", stats.rejected},
        {"late", stats.late},
        {"events_stored", stats.eventsStored},
        {"events_suppressed", stats.eventsSuppressed},
        {"events_deferred", stats.eventsDeferred},
        {"events_dropped", stats.eventsDropped},
        {"dwells_observed", stats.dwellsObserved}
    };

    auto fromDate = CalendarDate::localDateOf(from, config.utcOffsetMinutes);
    auto toDate = CalendarDate::localDateOf(to, config.utcOffsetMinutes);

    nlohmann::json perVehicle = nlohmann::json::array();
    for (const auto& vehicle : vehicles) {
        nlohmann::json v;
        v["vehicle_id"] = vehicle;

        nlohmann::json trips = nlohmann::json::array();
        for (const auto& trip : services.queries->trips(vehicle, from, to)) {
            trips.push_back(JsonCodec::tripToJson(trip));
        }
        v["trips"] = trips;

        nlohmann::json eventStats = nlohmann::json::array();
        for (const auto& row : services.queries->statistics(vehicle, config.retention.maxAgeDays)) {
            eventStats.push_back({
                {"type", eventTypeToString(row.type)},
                {"severity", severityToString(row.severity)},
                {"count", row.count},
                {"acknowledged", row.acknowledgedCount},
                {"last_occurrence", formatIso8601(row.lastOccurrence)}
            });
        }
        v["event_statistics"] = eventStats;

        nlohmann::json locations = nlohmann::json::array();
        for (const auto& location : services.queries->ranked(vehicle)) {
            locations.push_back(JsonCodec::locationToJson(location));
        }
        v["locations"] = locations;

        nlohmann::json health = nlohmann::json::array();
        for (const auto& score : services.queries->health(vehicle, fromDate, toDate)) {
            health.push_back(JsonCodec::healthToJson(score));
        }
        v["health"] = health;

        perVehicle.push_back(v);
    }
    summary["vehicles"] = perVehicle;
    return summary;
}

int main(int argc, char* argv[]) {
    // Install signal handlers for graceful shutdown
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](const char* flag) -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(std::string(flag) + " needs a value");
            }
            return argv[++i];
        };

        try {
            if (arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--config") {
                options.configFile = needValue("--config");
                options.configExplicit = true;
            } else if (arg == "--replay") {
                options.replayFile = needValue("--replay");
            } else if (arg == "--listen") {
                options.listen = true;
            } else if (arg == "--purge") {
                options.purge = true;
            } else if (arg == "--health-date") {
                options.healthDate = CalendarDate::parse(needValue("--health-date"));
            } else if (arg == "--recompute-days") {
                options.recomputeDays = std::stoi(needValue("--recompute-days"));
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }

    if (!options.replayFile && !options.listen) {
        printUsage(argv[0]);
        return 1;
    }

    InsightConfig config;
    try {
        if (options.configExplicit || std::filesystem::exists(options.configFile)) {
            config = TomlConfig::loadFromFile(options.configFile);
        } else {
            std::cout << "[Config] " << options.configFile << " not found, using defaults" << std::endl;
        }
        TomlConfig::applyEnvironment(config);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    auto problems = config.validate();
    if (options.listen && !config.mqtt.isConfigured()) {
        problems.push_back("mqtt.host is required for --listen");
    }
    if (!problems.empty()) {
        std::cerr << "Error: invalid configuration" << std::endl;
        for (const auto& problem : problems) {
            std::cerr << "  " << problem << std::endl;
        }
        return 1;
    }

    auto clock = std::make_shared<SystemClock>();
    Services services = buildServices(config, clock);

    std::optional<Timestamp> first;
    std::optional<Timestamp> last;

    try {
        if (options.replayFile) {
            auto span = replayFile(*options.replayFile, services);
            first = span.first;
            last = span.last;
            std::cout << "[Ingest] Replayed " << span.lines << " lines, " << span.decodeErrors
                      << " undecodable" << std::endl;
        }

        if (options.listen) {
            Timestamp started = clock->now();
            runListener(config, services);
            if (!first) first = started;
            last = clock->now();
        }

        if (!first || !last) {
            std::cout << "No samples ingested." << std::endl;
            return 0;
        }

        Timestamp to = *last + std::chrono::seconds(1);
        auto vehicles = services.positions->activeVehicles(*first, to);
        for (const auto& vehicle : vehicles) {
            services.tripSync->run(vehicle, *first, to);
        }

        auto firstDate = CalendarDate::localDateOf(*first, config.utcOffsetMinutes);
        auto lastDate = CalendarDate::localDateOf(*last, config.utcOffsetMinutes);
        if (options.healthDate) {
            services.healthDriver->runDay(*options.healthDate);
        } else if (options.recomputeDays) {
            auto yesterday = CalendarDate::localDateOf(clock->now(), config.utcOffsetMinutes).addDays(-1);
            services.healthDriver->recomputeRecent(yesterday, *options.recomputeDays);
        } else {
            services.healthDriver->backfill(firstDate, lastDate);
        }

        if (options.purge) {
            services.queries->purgeEvents();
        }

        auto summary = buildSummary(services, vehicles, *first, to, config);
        std::cout << summary.dump(2) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
