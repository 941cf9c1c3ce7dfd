#include "HealthFeatureAggregator.hpp"
#include "../Geo.hpp"
#include <algorithm>
#include <cmath>

namespace fleetsense::domain {

namespace {

constexpr double kImpossibleSpeedKph = 220.0;
constexpr double kImpossibleMinKm = 1.0;
constexpr double kDriftMaxSpeedKph = 3.0;
constexpr double kDriftMinKm = 0.2;
constexpr double kDriftMaxSeconds = 600.0;
constexpr int kLowSampleThreshold = 24;
constexpr int kMinExpectedPoints = 24;
constexpr int kMaxExpectedPoints = 1440;
constexpr int kDefaultExpectedPoints = 288;

} // namespace

HealthFeatureAggregator::HealthFeatureAggregator(double speedingThresholdKph)
    : speedingThresholdKph_(speedingThresholdKph) {
}

DailyHealthFeature HealthFeatureAggregator::aggregate(const std::string& vehicleId, const CalendarDate& date,
                                                      const std::vector<PositionSample>& samples,
                                                      const std::vector<Trip>& trips,
                                                      const std::vector<VehicleEvent>& events) const {
    DailyHealthFeature feature;
    feature.vehicleId = vehicleId;
    feature.date = date;

    aggregateSamples(samples, feature);
    aggregateTrips(trips, feature);
    aggregateEvents(events, feature);
    deriveCompleteness(feature);
    return feature;
}

void HealthFeatureAggregator::aggregateSamples(const std::vector<PositionSample>& samples,
                                               DailyHealthFeature& feature) const {
    feature.pointsCount = static_cast<int>(samples.size());
    feature.transitionCount = std::max(0, feature.pointsCount - 1);

    double batterySum = 0.0;
    int batteryCount = 0;
    int speeding = 0;
    for (const auto& sample : samples) {
        if (sample.speedKph > speedingThresholdKph_) {
            ++speeding;
        }
        if (sample.batteryPercent) {
            batterySum += *sample.batteryPercent;
            ++batteryCount;
            feature.minBatteryPercent = feature.minBatteryPercent
                ? std::min(*feature.minBatteryPercent, *sample.batteryPercent)
                : *sample.batteryPercent;
        }
    }
    if (batteryCount > 0) {
        feature.avgBatteryPercent = batterySum / batteryCount;
    }
    if (!samples.empty()) {
        feature.speedingExposurePct = 100.0 * speeding / samples.size();
    }

    double intervalSum = 0.0;
    int intervalCount = 0;
    int drift = 0;
    for (size_t i = 1; i < samples.size(); ++i) {
        const auto& prev = samples[i - 1];
        const auto& cur = samples[i];
        double seconds = std::chrono::duration<double>(cur.timestamp - prev.timestamp).count();
        double minutes = seconds / 60.0;
        double km = Geo::distanceKm(prev.point(), cur.point());

        feature.maxGapMinutes = std::max(feature.maxGapMinutes, minutes);
        if (seconds > 0.0) {
            intervalSum += minutes;
            ++intervalCount;

            double impliedKph = km / (seconds / 3600.0);
            if (impliedKph > kImpossibleSpeedKph && km > kImpossibleMinKm) {
                ++feature.impossibleJumpCount;
            }
            if (cur.speedKph < kDriftMaxSpeedKph && km > kDriftMinKm && seconds <= kDriftMaxSeconds) {
                ++drift;
            }
        }
    }

    if (intervalCount > 0) {
        feature.avgSamplingIntervalMinutes = intervalSum / intervalCount;
    }
    if (feature.transitionCount > 0) {
        feature.gpsDriftRatio = static_cast<double>(drift) / feature.transitionCount;
    }
}

void HealthFeatureAggregator::aggregateTrips(const std::vector<Trip>& trips, DailyHealthFeature& feature) {
    feature.tripCount = static_cast<int>(trips.size());
    for (const auto& trip : trips) {
        feature.distanceKm += trip.distanceKm;
        feature.movingMinutes += trip.durationMinutes;
    }
}

void HealthFeatureAggregator::aggregateEvents(const std::vector<VehicleEvent>& events, DailyHealthFeature& feature) {
    double idleSum = 0.0;
    int idleWithMinutes = 0;

    for (const auto& event : events) {
        switch (event.type) {
            case EventType::IdleTooLong: {
                ++feature.idleEventCount;
                auto it = event.metadata.find("idle_minutes");
                if (it != event.metadata.end() && it->is_number()) {
                    idleSum += it->get<double>();
                    ++idleWithMinutes;
                }
                break;
            }
            case EventType::Overspeeding:
                ++feature.overspeedEventCount;
                break;
            case EventType::HarshBraking:
            case EventType::RapidAcceleration:
                ++feature.harshEventCount;
                break;
            case EventType::Offline:
                ++feature.offlineEventCount;
                break;
            default:
                break;
        }
    }

    if (idleWithMinutes > 0) {
        feature.idleMinutes = idleSum / idleWithMinutes;
    }
}

void HealthFeatureAggregator::deriveCompleteness(DailyHealthFeature& feature) {
    feature.lowSampleDay = feature.pointsCount < kLowSampleThreshold;

    if (feature.avgSamplingIntervalMinutes && *feature.avgSamplingIntervalMinutes > 0.0) {
        double expected = 1440.0 / *feature.avgSamplingIntervalMinutes;
        feature.expectedPoints = static_cast<int>(std::lround(
            std::clamp(expected, static_cast<double>(kMinExpectedPoints), static_cast<double>(kMaxExpectedPoints))));
    } else {
        feature.expectedPoints = kDefaultExpectedPoints;
    }

    feature.dataCompletenessPct = std::clamp(100.0 * feature.pointsCount / feature.expectedPoints, 0.0, 100.0);
}

} // namespace fleetsense::domain
