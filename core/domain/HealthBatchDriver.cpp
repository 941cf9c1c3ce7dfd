#include "HealthBatchDriver.hpp"
#include "RetryRunner.hpp"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <iterator>
#include <thread>

namespace fleetsense::domain {

std::size_t HealthBatchDriver::Report::succeeded() const {
    return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(),
        [](const VehicleOutcome& o) { return o.success; }));
}

std::size_t HealthBatchDriver::Report::failed() const {
    return outcomes.size() - succeeded();
}

HealthBatchDriver::HealthBatchDriver(InsightConfig config,
                                     std::shared_ptr<ports::IPositionStore> positions,
                                     std::shared_ptr<ports::ITripStore> trips,
                                     std::shared_ptr<ports::IEventStore> events,
                                     std::shared_ptr<ports::IHealthStore> health,
                                     std::shared_ptr<ports::IPolicyEngine> policyEngine,
                                     std::shared_ptr<TripSyncJob> tripSync)
    : config_(config), positions_(positions), trips_(trips), events_(events), health_(health),
      policyEngine_(policyEngine), tripSync_(tripSync), aggregator_(config.detector.overspeedKph) {
}

DailyHealthFeature HealthBatchDriver::buildFeature(const std::string& vehicleId, const CalendarDate& date) {
    const auto& retry = policyEngine_->getRetryPolicy();
    Timestamp dayStart = date.startOfDay(config_.utcOffsetMinutes);
    Timestamp dayEnd = date.addDays(1).startOfDay(config_.utcOffsetMinutes);

    if (tripSync_) {
        tripSync_->run(vehicleId, dayStart, dayEnd);
    }

    auto samples = runWithRetry(retry, "load samples for " + vehicleId, [&]() {
        return positions_->range(vehicleId, dayStart, dayEnd);
    });

    ports::TripFilter tripFilter;
    tripFilter.vehicleId = vehicleId;
    tripFilter.from = dayStart;
    tripFilter.to = dayEnd;
    tripFilter.source = config_.health.tripSource;
    auto trips = runWithRetry(retry, "load trips for " + vehicleId, [&]() {
        return trips_->query(tripFilter);
    });

    ports::EventFilter eventFilter;
    eventFilter.vehicleId = vehicleId;
    eventFilter.from = dayStart;
    eventFilter.to = dayEnd;
    auto events = runWithRetry(retry, "load events for " + vehicleId, [&]() {
        return events_->query(eventFilter);
    });

    return aggregator_.aggregate(vehicleId, date, samples, trips, events);
}

DailyHealthScore HealthBatchDriver::computeVehicleDay(const std::string& vehicleId, const CalendarDate& date) {
    const auto& retry = policyEngine_->getRetryPolicy();

    auto feature = buildFeature(vehicleId, date);

    auto previous = runWithRetry(retry, "load previous score for " + vehicleId, [&]() {
        return health_->latestBefore(vehicleId, date);
    });
    std::optional<int> previousScore;
    if (previous) {
        previousScore = previous->healthScore;
    }

    auto score = scorer_.score(feature, previousScore);

    runWithRetry(retry, "store health for " + vehicleId, [&]() {
        health_->upsert(feature, score);
    });
    return score;
}

HealthBatchDriver::Report HealthBatchDriver::runDay(const CalendarDate& date) {
    Timestamp dayStart = date.startOfDay(config_.utcOffsetMinutes);
    Timestamp dayEnd = date.addDays(1).startOfDay(config_.utcOffsetMinutes);

    Report report;
    std::vector<std::string> vehicles;
    try {
        vehicles = runWithRetry(policyEngine_->getRetryPolicy(), "list active vehicles", [&]() {
            return positions_->activeVehicles(dayStart, dayEnd);
        });
    } catch (const StorageError& e) {
        std::cerr << "[Health] Cannot list vehicles for " << date.toString() << ": " << e.what() << std::endl;
        throw;
    }

    report.outcomes.resize(vehicles.size());
    std::atomic<std::size_t> next{0};

    auto worker = [&]() {
        while (true) {
            std::size_t index = next.fetch_add(1);
            if (index >= vehicles.size()) {
                return;
            }
            auto& outcome = report.outcomes[index];
            outcome.vehicleId = vehicles[index];
            outcome.date = date;
            try {
                outcome.score = computeVehicleDay(vehicles[index], date);
                outcome.success = true;
            } catch (const std::exception& e) {
                outcome.error = e.what();
                std::cerr << "[Health] " << vehicles[index] << " " << date.toString()
                          << " failed: " << e.what() << std::endl;
            }
        }
    };

    std::size_t workerCount = std::min<std::size_t>(
        static_cast<std::size_t>(std::max(1, config_.health.workerCount)), std::max<std::size_t>(1, vehicles.size()));
    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (std::size_t i = 0; i < workerCount; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    std::cout << "[Health] " << date.toString() << ": " << report.succeeded() << " scored, "
              << report.failed() << " failed" << std::endl;
    return report;
}

HealthBatchDriver::Report HealthBatchDriver::recomputeRecent(const CalendarDate& endDate, int days) {
    if (days <= 0) {
        return Report{};
    }
    return backfill(endDate.addDays(-(days - 1)), endDate);
}

HealthBatchDriver::Report HealthBatchDriver::backfill(const CalendarDate& from, const CalendarDate& to) {
    Report combined;
    for (auto date = from; date <= to; date = date.addDays(1)) {
        auto report = runDay(date);
        combined.outcomes.insert(combined.outcomes.end(),
                                 std::make_move_iterator(report.outcomes.begin()),
                                 std::make_move_iterator(report.outcomes.end()));
    }
    return combined;
}

} // namespace fleetsense::domain
