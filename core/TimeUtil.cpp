#include "TimeUtil.hpp"
#include "Errors.hpp"
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace fleetsense {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400;

std::int64_t daysFromCivil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civilFromDays(std::int64_t z, int& y, int& m, int& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0));
}

std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

bool validDate(int y, int m, int d) {
    if (m < 1 || m > 12 || d < 1 || y < 1) {
        return false;
    }
    int yy = 0, mm = 0, dd = 0;
    civilFromDays(daysFromCivil(y, m, d), yy, mm, dd);
    return yy == y && mm == m && dd == d;
}

} // namespace

Timestamp fromEpochSeconds(std::int64_t seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

std::int64_t toEpochSeconds(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

std::string formatIso8601(Timestamp ts) {
    std::int64_t secs = toEpochSeconds(ts);
    std::int64_t days = floorDiv(secs, kSecondsPerDay);
    std::int64_t rem = secs - days * kSecondsPerDay;

    int y = 0, m = 0, d = 0;
    civilFromDays(days, y, m, d);

    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << y << '-' << std::setw(2) << m << '-'
       << std::setw(2) << d << 'T' << std::setw(2) << rem / 3600 << ':'
       << std::setw(2) << (rem % 3600) / 60 << ':' << std::setw(2) << rem % 60 << 'Z';
    return ss.str();
}

Timestamp parseIso8601(const std::string& text) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%*1[T ]%2d:%2d:%2d%n",
                    &y, &mo, &d, &h, &mi, &s, &consumed) != 6) {
        throw InputError("Invalid ISO-8601 timestamp: " + text);
    }
    if (!validDate(y, mo, d) || h > 23 || mi > 59 || s > 60) {
        throw InputError("Timestamp out of range: " + text);
    }

    std::size_t pos = static_cast<std::size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
    }

    std::int64_t offsetSeconds = 0;
    if (pos < text.size()) {
        char sign = text[pos];
        if (sign == 'Z' || sign == 'z') {
            ++pos;
        } else if (sign == '+' || sign == '-') {
            int oh = 0, om = 0;
            if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) {
                throw InputError("Invalid timezone offset: " + text);
            }
            offsetSeconds = (oh * 3600 + om * 60) * (sign == '+' ? 1 : -1);
            pos += 6;
        }
    }
    if (pos != text.size()) {
        throw InputError("Trailing characters in timestamp: " + text);
    }

    std::int64_t secs = daysFromCivil(y, mo, d) * kSecondsPerDay + h * 3600 + mi * 60 + s;
    return fromEpochSeconds(secs - offsetSeconds);
}

double minutesBetween(Timestamp from, Timestamp to) {
    return std::chrono::duration<double>(to - from).count() / 60.0;
}

CalendarDate CalendarDate::fromDays(std::int64_t daysSinceEpoch) {
    CalendarDate date;
    civilFromDays(daysSinceEpoch, date.year, date.month, date.day);
    return date;
}

CalendarDate CalendarDate::parse(const std::string& text) {
    CalendarDate date;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &date.year, &date.month, &date.day, &consumed) != 3
        || static_cast<std::size_t>(consumed) != text.size()
        || !validDate(date.year, date.month, date.day)) {
        throw InputError("Invalid date (expected YYYY-MM-DD): " + text);
    }
    return date;
}

CalendarDate CalendarDate::localDateOf(Timestamp ts, int utcOffsetMinutes) {
    std::int64_t local = toEpochSeconds(ts) + static_cast<std::int64_t>(utcOffsetMinutes) * 60;
    return fromDays(floorDiv(local, kSecondsPerDay));
}

std::int64_t CalendarDate::toDays() const {
    return daysFromCivil(year, month, day);
}

CalendarDate CalendarDate::addDays(std::int64_t days) const {
    return fromDays(toDays() + days);
}

std::string CalendarDate::toString() const {
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << year << '-' << std::setw(2) << month << '-'
       << std::setw(2) << day;
    return ss.str();
}

Timestamp CalendarDate::startOfDay(int utcOffsetMinutes) const {
    return fromEpochSeconds(toDays() * kSecondsPerDay - static_cast<std::int64_t>(utcOffsetMinutes) * 60);
}

bool CalendarDate::operator==(const CalendarDate& other) const {
    return year == other.year && month == other.month && day == other.day;
}

bool CalendarDate::operator<(const CalendarDate& other) const {
    return toDays() < other.toDays();
}

int localHourOf(Timestamp ts, int utcOffsetMinutes) {
    std::int64_t local = toEpochSeconds(ts) + static_cast<std::int64_t>(utcOffsetMinutes) * 60;
    std::int64_t secondOfDay = local - floorDiv(local, kSecondsPerDay) * kSecondsPerDay;
    return static_cast<int>(secondOfDay / 3600);
}

} // namespace fleetsense
