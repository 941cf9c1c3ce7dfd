#pragma once

#include "HealthRecord.hpp"
#include "LearnedLocation.hpp"
#include "PositionSample.hpp"
#include "Trip.hpp"
#include "VehicleEvent.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace fleetsense {

/**
 * @brief Wire format for samples in and derived records out
 *
 * Field names are snake_case. Timestamps are written as ISO-8601 UTC and
 * read as either ISO-8601 strings or epoch seconds.
 */
class JsonCodec {
public:
    // Throws InputError for malformed JSON or missing required fields.
    static PositionSample deserializeSample(const std::string& json);
    static PositionSample jsonToSample(const nlohmann::json& json);
    static nlohmann::json sampleToJson(const PositionSample& sample);

    static std::string serialize(const VehicleEvent& event);
    static nlohmann::json eventToJson(const VehicleEvent& event);

    static nlohmann::json tripToJson(const Trip& trip);
    static nlohmann::json locationToJson(const LearnedLocation& location);
    static nlohmann::json visitPatternToJson(const VisitPattern& pattern);
    static nlohmann::json healthToJson(const DailyHealthScore& score);
    static nlohmann::json featureToJson(const DailyHealthFeature& feature);

    static nlohmann::json pointToJson(const GeoPoint& point);

private:
    static Timestamp jsonToTimestamp(const nlohmann::json& json);
};

} // namespace fleetsense
