#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace fleetsense {

using Timestamp = std::chrono::system_clock::time_point;

Timestamp fromEpochSeconds(std::int64_t seconds);
std::int64_t toEpochSeconds(Timestamp ts);

// Formats as "YYYY-MM-DDTHH:MM:SSZ" in UTC.
std::string formatIso8601(Timestamp ts);

// Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and an
// optional "Z" or "+HH:MM"/"-HH:MM" suffix. Throws InputError on failure.
Timestamp parseIso8601(const std::string& text);

double minutesBetween(Timestamp from, Timestamp to);

/**
 * @brief Proleptic Gregorian calendar day
 *
 * Health rows are keyed by the local calendar date of a vehicle, so dates
 * are always derived together with a fixed UTC offset in minutes.
 */
struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    static CalendarDate fromDays(std::int64_t daysSinceEpoch);
    static CalendarDate parse(const std::string& text);
    static CalendarDate localDateOf(Timestamp ts, int utcOffsetMinutes);

    std::int64_t toDays() const;
    CalendarDate addDays(std::int64_t days) const;
    std::string toString() const;

    // First instant of this date in local time, expressed in UTC.
    Timestamp startOfDay(int utcOffsetMinutes) const;

    bool operator==(const CalendarDate& other) const;
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
    bool operator<(const CalendarDate& other) const;
    bool operator<=(const CalendarDate& other) const { return !(other < *this); }
};

// Hour of day [0, 23] in local time.
int localHourOf(Timestamp ts, int utcOffsetMinutes);

} // namespace fleetsense
