#include "JsonCodec.hpp"
#include "Errors.hpp"

namespace fleetsense {

namespace {

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

std::optional<double> optionalNumber(const nlohmann::json& json, const char* key) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number()) {
        throw InputError(std::string("field '") + key + "' is not a number");
    }
    return it->get<double>();
}

double requiredNumber(const nlohmann::json& json, const char* key) {
    auto value = optionalNumber(json, key);
    if (!value) {
        throw InputError(std::string("missing field '") + key + "'");
    }
    return *value;
}

} // namespace

PositionSample JsonCodec::deserializeSample(const std::string& json) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        throw InputError(std::string("invalid JSON: ") + e.what());
    }
    return jsonToSample(parsed);
}

PositionSample JsonCodec::jsonToSample(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw InputError("sample must be a JSON object");
    }

    PositionSample sample;
    try {
        sample.vehicleId = json.value("vehicle_id", "");
        if (!json.contains("timestamp")) {
            throw InputError("missing field 'timestamp'");
        }
        sample.timestamp = jsonToTimestamp(json["timestamp"]);
        sample.latitude = requiredNumber(json, "latitude");
        sample.longitude = requiredNumber(json, "longitude");
        sample.speedKph = optionalNumber(json, "speed").value_or(0.0);
        sample.ignitionOn = json.value("ignition_on", false);
        sample.batteryPercent = optionalNumber(json, "battery_percent");
        sample.odometerMeters = optionalNumber(json, "odometer_total");
        sample.isOnline = json.value("is_online", true);
    } catch (const nlohmann::json::exception& e) {
        throw InputError(std::string("bad sample field: ") + e.what());
    }
    return sample;
}

nlohmann::json JsonCodec::sampleToJson(const PositionSample& sample) {
    nlohmann::json j;
    j["vehicle_id"] = sample.vehicleId;
    j["timestamp"] = formatIso8601(sample.timestamp);
    j["latitude"] = sample.latitude;
    j["longitude"] = sample.longitude;
    j["speed"] = sample.speedKph;
    j["ignition_on"] = sample.ignitionOn;
    j["battery_percent"] = optionalToJson(sample.batteryPercent);
    j["odometer_total"] = optionalToJson(sample.odometerMeters);
    j["is_online"] = sample.isOnline;
    return j;
}

Timestamp JsonCodec::jsonToTimestamp(const nlohmann::json& json) {
    if (json.is_string()) {
        return parseIso8601(json.get<std::string>());
    }
    if (json.is_number()) {
        return fromEpochSeconds(json.get<std::int64_t>());
    }
    throw InputError("timestamp must be an ISO-8601 string or epoch seconds");
}

std::string JsonCodec::serialize(const VehicleEvent& event) {
    return eventToJson(event).dump();
}

nlohmann::json JsonCodec::eventToJson(const VehicleEvent& event) {
    nlohmann::json j;
    j["id"] = event.id;
    j["vehicle_id"] = event.vehicleId;
    j["type"] = eventTypeToString(event.type);
    j["severity"] = severityToString(event.severity);
    j["title"] = event.title;
    j["description"] = event.description;
    j["metadata"] = event.metadata;
    j["latitude"] = optionalToJson(event.latitude);
    j["longitude"] = optionalToJson(event.longitude);
    j["value_before"] = optionalToJson(event.valueBefore);
    j["value_after"] = optionalToJson(event.valueAfter);
    j["threshold"] = optionalToJson(event.threshold);
    j["created_at"] = formatIso8601(event.createdAt);
    j["expires_at"] = formatIso8601(event.expiresAt);
    j["acknowledged"] = event.acknowledged;
    return j;
}

nlohmann::json JsonCodec::pointToJson(const GeoPoint& point) {
    return nlohmann::json{{"lat", point.lat}, {"lon", point.lon}};
}

nlohmann::json JsonCodec::tripToJson(const Trip& trip) {
    nlohmann::json j;
    j["id"] = trip.id;
    j["vehicle_id"] = trip.vehicleId;
    j["start_time"] = formatIso8601(trip.startTime);
    j["end_time"] = formatIso8601(trip.endTime);
    j["start_point"] = pointToJson(trip.startPoint);
    j["end_point"] = pointToJson(trip.endPoint);
    j["distance_km"] = trip.distanceKm;
    j["max_speed"] = trip.maxSpeedKph;
    j["avg_speed"] = trip.avgSpeedKph;
    j["duration_minutes"] = trip.durationMinutes;
    j["distance_from_odometer"] = trip.distanceFromOdometer;
    j["source_method"] = tripSourceToString(trip.sourceMethod);
    return j;
}

nlohmann::json JsonCodec::locationToJson(const LearnedLocation& location) {
    nlohmann::json j;
    j["id"] = location.id;
    j["vehicle_id"] = location.vehicleId;
    j["centroid"] = pointToJson(location.centroid);
    j["radius_meters"] = location.radiusMeters;
    j["visit_count"] = location.visitCount;
    j["total_duration_minutes"] = location.totalDurationMinutes;
    j["first_visit"] = formatIso8601(location.firstVisit);
    j["last_visit"] = formatIso8601(location.lastVisit);
    j["location_type"] = locationTypeToString(location.locationType);
    j["confidence"] = location.confidence;
    j["custom_label"] = optionalToJson(location.customLabel);
    j["typical_arrival_hour"] = optionalToJson(location.typicalArrivalHour);
    return j;
}

nlohmann::json JsonCodec::visitPatternToJson(const VisitPattern& pattern) {
    nlohmann::json j;
    j["location_id"] = pattern.locationId;
    j["day_part"] = dayPartToString(pattern.dayPart);
    j["visit_count"] = pattern.visitCount;
    j["typical_hour"] = pattern.typicalHour;
    j["avg_duration_minutes"] = pattern.avgDurationMinutes;
    return j;
}

nlohmann::json JsonCodec::healthToJson(const DailyHealthScore& score) {
    nlohmann::json j;
    j["vehicle_id"] = score.vehicleId;
    j["date"] = score.date.toString();
    j["health_score"] = score.healthScore;
    j["confidence_score"] = score.confidenceScore;
    j["trend"] = healthTrendToString(score.trend);
    j["previous_score"] = optionalToJson(score.previousScore);
    j["components"] = {
        {"connectivity", score.connectivityScore},
        {"safety", score.safetyScore},
        {"utilization", score.utilizationScore},
        {"data_quality", score.dataQualityScore}
    };
    j["model_version"] = score.modelVersion;
    return j;
}

nlohmann::json JsonCodec::featureToJson(const DailyHealthFeature& f) {
    nlohmann::json j;
    j["vehicle_id"] = f.vehicleId;
    j["date"] = f.date.toString();
    j["points_count"] = f.pointsCount;
    j["transition_count"] = f.transitionCount;
    j["avg_sampling_interval_minutes"] = optionalToJson(f.avgSamplingIntervalMinutes);
    j["max_gap_minutes"] = f.maxGapMinutes;
    j["avg_battery"] = optionalToJson(f.avgBatteryPercent);
    j["min_battery"] = optionalToJson(f.minBatteryPercent);
    j["speeding_exposure_pct"] = f.speedingExposurePct;
    j["impossible_jump_count"] = f.impossibleJumpCount;
    j["gps_drift_ratio"] = f.gpsDriftRatio;
    j["trip_count"] = f.tripCount;
    j["distance_km"] = f.distanceKm;
    j["moving_minutes"] = f.movingMinutes;
    j["idle_event_count"] = f.idleEventCount;
    j["idle_minutes"] = f.idleMinutes;
    j["overspeed_event_count"] = f.overspeedEventCount;
    j["harsh_event_count"] = f.harshEventCount;
    j["offline_event_count"] = f.offlineEventCount;
    j["low_sample_day"] = f.lowSampleDay;
    j["expected_points"] = f.expectedPoints;
    j["data_completeness_pct"] = f.dataCompletenessPct;
    return j;
}

} // namespace fleetsense
