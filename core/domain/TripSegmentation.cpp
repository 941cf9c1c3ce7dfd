#include "TripSegmentation.hpp"
#include "../Errors.hpp"
#include "../Geo.hpp"
#include "RecordId.hpp"
#include <algorithm>
#include <iostream>

namespace fleetsense::domain {

IgnitionTripStrategy::IgnitionTripStrategy(TripConfig config)
    : config_(config) {
}

std::vector<Trip> IgnitionTripStrategy::segment(const std::vector<PositionSample>& samples) const {
    std::vector<Trip> trips;
    std::vector<PositionSample> window;
    bool open = false;

    for (size_t i = 0; i < samples.size(); ++i) {
        const auto& sample = samples[i];

        if (!open) {
            if (sample.ignitionOn && (i == 0 || !samples[i - 1].ignitionOn)) {
                window = {sample};
                open = true;
            }
            continue;
        }

        bool gap = sample.timestamp - window.back().timestamp > config_.maxSampleGap;

        if (sample.ignitionOn) {
            if (gap) {
                TripBuilder::emit(window, source(), config_, trips);
                window = {sample};
            } else {
                window.push_back(sample);
            }
            continue;
        }

        // Ignition off closes the run. After a long silence the off report
        // no longer belongs to the trip.
        if (!gap) {
            window.push_back(sample);
        }
        TripBuilder::emit(window, source(), config_, trips);
        window.clear();
        open = false;
    }

    return trips;
}

IdleTimeoutTripStrategy::IdleTimeoutTripStrategy(TripConfig config)
    : config_(config) {
}

std::vector<Trip> IdleTimeoutTripStrategy::segment(const std::vector<PositionSample>& samples) const {
    std::vector<Trip> trips;
    if (samples.empty()) {
        return trips;
    }

    std::vector<PositionSample> window;
    std::optional<size_t> zeroRunStart;   // index into window

    auto close = [&]() {
        size_t end = zeroRunStart ? *zeroRunStart + 1 : window.size();
        window.resize(end);
        TripBuilder::emit(window, source(), config_, trips);
        window.clear();
        zeroRunStart.reset();
    };

    for (const auto& sample : samples) {
        if (!sample.ignitionOn) {
            continue;
        }

        if (!window.empty()) {
            if (sample.timestamp - window.back().timestamp > config_.maxSampleGap) {
                close();
            } else if (sample.speedKph <= 0.0) {
                window.push_back(sample);
                if (!zeroRunStart) {
                    zeroRunStart = window.size() - 1;
                }
                if (sample.timestamp - window[*zeroRunStart].timestamp >= config_.idleTimeout) {
                    close();
                }
                continue;
            } else {
                window.push_back(sample);
                zeroRunStart.reset();
                continue;
            }
        }

        if (sample.speedKph > 0.0) {
            window = {sample};
            zeroRunStart.reset();
        }
    }

    // Still open: closed only once the input runs past the idle timeout
    if (!window.empty() && samples.back().timestamp - window.back().timestamp > config_.idleTimeout) {
        close();
    }

    return trips;
}

Trip TripBuilder::build(const std::vector<PositionSample>& window, TripSource source, const TripConfig& config) {
    if (window.empty()) {
        throw ComputationError("empty trip window");
    }

    const auto& first = window.front();
    const auto& last = window.back();
    if (!(first.timestamp < last.timestamp)) {
        throw ComputationError("zero-duration trip at " + formatIso8601(first.timestamp));
    }

    Trip trip;
    trip.vehicleId = first.vehicleId;
    trip.sourceMethod = source;
    trip.startTime = first.timestamp;
    trip.endTime = last.timestamp;
    trip.startPoint = first.point();
    trip.endPoint = last.point();
    trip.durationMinutes = minutesBetween(first.timestamp, last.timestamp);

    if (first.odometerMeters && last.odometerMeters && *last.odometerMeters - *first.odometerMeters > 0.0) {
        trip.distanceKm = (*last.odometerMeters - *first.odometerMeters) / 1000.0;
        trip.distanceFromOdometer = true;
    } else {
        trip.distanceKm = Geo::pathLengthKm(window);
        if (trip.distanceKm < config.noiseFloorKm) {
            throw ComputationError("distance below noise floor at " + formatIso8601(first.timestamp));
        }
    }

    double speedSum = 0.0;
    for (const auto& sample : window) {
        speedSum += sample.speedKph;
        trip.maxSpeedKph = std::max(trip.maxSpeedKph, sample.speedKph);
    }
    trip.avgSpeedKph = speedSum / window.size();

    trip.id = RecordId::fromParts({trip.vehicleId, tripSourceToString(source),
                                   std::to_string(toEpochSeconds(trip.startTime))});
    return trip;
}

void TripBuilder::emit(const std::vector<PositionSample>& window, TripSource source,
                       const TripConfig& config, std::vector<Trip>& out) {
    try {
        out.push_back(build(window, source, config));
    } catch (const ComputationError& e) {
        std::cerr << "[Trips] Discarded " << tripSourceToString(source) << " trip for "
                  << (window.empty() ? std::string("?") : window.front().vehicleId)
                  << ": " << e.what() << std::endl;
    }
}

std::vector<PositionSample> prepareForSegmentation(std::vector<PositionSample> samples, const TripConfig& config) {
    std::stable_sort(samples.begin(), samples.end(), [](const PositionSample& a, const PositionSample& b) {
        return a.timestamp < b.timestamp;
    });
    samples.erase(std::unique(samples.begin(), samples.end(), [](const PositionSample& a, const PositionSample& b) {
        return a.timestamp == b.timestamp;
    }), samples.end());

    if (!config.spikeFilterEnabled || samples.empty()) {
        return samples;
    }

    std::vector<PositionSample> accepted;
    accepted.reserve(samples.size());
    size_t dropped = 0;

    for (auto& sample : samples) {
        if (!accepted.empty()) {
            const auto& last = accepted.back();
            double km = Geo::distanceKm(last.point(), sample.point());
            auto elapsed = sample.timestamp - last.timestamp;
            double hours = std::chrono::duration<double>(elapsed).count() / 3600.0;
            bool teleport = km > config.spikeMaxJumpKm && elapsed <= config.maxSampleGap;
            if (teleport || (hours > 0.0 && km / hours > config.spikeMaxSpeedKph)) {
                ++dropped;
                continue;
            }
        }
        accepted.push_back(std::move(sample));
    }

    if (dropped > 0) {
        std::cout << "[Trips] Dropped " << dropped << " GPS spike sample(s) for "
                  << accepted.front().vehicleId << std::endl;
    }
    return accepted;
}

} // namespace fleetsense::domain
