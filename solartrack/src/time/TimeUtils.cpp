/**
 * @file TimeUtils.cpp
 * @brief Implementation of calendar/UTC conversions
 */

#include "solartrack/time/TimeUtils.hpp"
#include "solartrack/core/Constants.hpp"
#include "solartrack/core/Errors.hpp"
#include "solartrack/ephemeris/EphemerisStore.hpp"
#include <chrono>
#include <cmath>
#include <cstdio>
#include <regex>

namespace solartrack::time {

using namespace solartrack::constants;

namespace {

struct LeapSecondEntry {
    int year;
    int month;
    double tai_minus_utc;
};

// IERS Bulletin C, effective from the first day of the month
const LeapSecondEntry LEAP_SECONDS[] = {
    {1972, 1, 10.0}, {1972, 7, 11.0}, {1973, 1, 12.0}, {1974, 1, 13.0},
    {1975, 1, 14.0}, {1976, 1, 15.0}, {1977, 1, 16.0}, {1978, 1, 17.0},
    {1979, 1, 18.0}, {1980, 1, 19.0}, {1981, 7, 20.0}, {1982, 7, 21.0},
    {1983, 7, 22.0}, {1985, 7, 23.0}, {1988, 1, 24.0}, {1990, 1, 25.0},
    {1991, 1, 26.0}, {1992, 7, 27.0}, {1993, 7, 28.0}, {1994, 7, 29.0},
    {1996, 1, 30.0}, {1997, 7, 31.0}, {1999, 1, 32.0}, {2006, 1, 33.0},
    {2009, 1, 34.0}, {2012, 7, 35.0}, {2015, 7, 36.0}, {2017, 1, 37.0},
};

constexpr long long MS_PER_DAY = 86400000LL;

// Gregorian calendar of a JD whose day starts at .5 (UTC or TT civil reading)
CalendarDateTime civilCalendar(const Instant& t) {
    double s = t.fractionPart() + 0.5;
    double carry = std::floor(s);
    long long jdn = t.dayPart() + static_cast<long long>(carry);
    long long ms = std::llround((s - carry) * static_cast<double>(MS_PER_DAY));
    if (ms >= MS_PER_DAY) {
        ms -= MS_PER_DAY;
        ++jdn;
    }

    // Fliegel & Van Flandern (1968)
    long long l = jdn + 68569;
    long long n = 4 * l / 146097;
    l = l - (146097 * n + 3) / 4;
    long long i = 4000 * (l + 1) / 1461001;
    l = l - 1461 * i / 4 + 31;
    long long j = 80 * l / 2447;

    CalendarDateTime cal;
    cal.day = static_cast<int>(l - 2447 * j / 80);
    l = j / 11;
    cal.month = static_cast<int>(j + 2 - 12 * l);
    cal.year = static_cast<int>(100 * (n - 49) + i + l);

    cal.hour = static_cast<int>(ms / 3600000LL);
    cal.minute = static_cast<int>((ms / 60000LL) % 60);
    cal.second = static_cast<double>(ms % 60000LL) / 1000.0;
    return cal;
}

void checkField(bool ok, const std::string& what) {
    if (!ok) throw InvalidFormatError(what);
}

} // namespace

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && isLeapYear(year)) return 29;
    return DAYS[month - 1];
}

long long julianDayNumber(int year, int month, int day) {
    long long y = year;
    long long m = month;
    long long d = day;
    long long a = (m - 14) / 12;
    return (1461 * (y + 4800 + a)) / 4
         + (367 * (m - 2 - 12 * a)) / 12
         - (3 * ((y + 4900 + a) / 100)) / 4
         + d - 32075;
}

double taiMinusUtc(int year, int month, int /*day*/) {
    double dat = LEAP_SECONDS[0].tai_minus_utc;
    for (const auto& entry : LEAP_SECONDS) {
        if (year > entry.year || (year == entry.year && month >= entry.month)) {
            dat = entry.tai_minus_utc;
        } else {
            break;
        }
    }
    return dat;
}

Instant fromUtc(const CalendarDateTime& utc) {
    checkField(utc.month >= 1 && utc.month <= 12,
               "Invalid month " + std::to_string(utc.month) + " (expected 1-12)");
    checkField(utc.day >= 1 && utc.day <= daysInMonth(utc.year, utc.month),
               "Invalid day " + std::to_string(utc.day) + " for " + std::to_string(utc.year) +
               "-" + std::to_string(utc.month));
    checkField(utc.hour >= 0 && utc.hour <= 23,
               "Invalid hour " + std::to_string(utc.hour) + " (expected 0-23)");
    checkField(utc.minute >= 0 && utc.minute <= 59,
               "Invalid minute " + std::to_string(utc.minute) + " (expected 0-59)");
    checkField(utc.second >= 0.0 && utc.second < 60.0,
               "Invalid second " + std::to_string(utc.second) + " (expected 0-59)");

    long long jdn = julianDayNumber(utc.year, utc.month, utc.day);
    double day_seconds = utc.hour * 3600.0 + utc.minute * 60.0 + utc.second;
    double offset = taiMinusUtc(utc.year, utc.month, utc.day) + TT_MINUS_TAI;
    return Instant::fromTwoPart(static_cast<double>(jdn), (day_seconds + offset) / SECONDS_PER_DAY - 0.5);
}

Instant parse(const std::string& date, const std::string& time) {
    static const std::regex DATE_RE(R"(^\s*(\d{4})-(\d{1,2})-(\d{1,2})\s*$)");
    static const std::regex TIME_RE(R"(^\s*(\d{1,2}):(\d{2})(?::(\d{2}(?:\.\d+)?))?\s*$)");

    std::smatch dm;
    if (!std::regex_match(date, dm, DATE_RE)) {
        throw InvalidFormatError("Invalid date '" + date + "' (expected YYYY-MM-DD)");
    }
    std::smatch tm;
    if (!std::regex_match(time, tm, TIME_RE)) {
        throw InvalidFormatError("Invalid time '" + time + "' (expected HH:MM or HH:MM:SS, 24-hour)");
    }

    CalendarDateTime utc;
    utc.year = std::stoi(dm[1].str());
    utc.month = std::stoi(dm[2].str());
    utc.day = std::stoi(dm[3].str());
    utc.hour = std::stoi(tm[1].str());
    utc.minute = std::stoi(tm[2].str());
    utc.second = tm[3].matched ? std::stod(tm[3].str()) : 0.0;
    return fromUtc(utc);
}

CalendarDateTime toUtc(const Instant& t) {
    CalendarDateTime cal = civilCalendar(t);
    double dat = taiMinusUtc(cal.year, cal.month, cal.day);
    Instant utc = t.plusSeconds(-(dat + TT_MINUS_TAI));
    cal = civilCalendar(utc);

    double dat_utc = taiMinusUtc(cal.year, cal.month, cal.day);
    if (dat_utc != dat) {
        // Crossed a leap second boundary
        utc = t.plusSeconds(-(dat_utc + TT_MINUS_TAI));
        cal = civilCalendar(utc);
    }
    return cal;
}

std::string formatUtcDate(const Instant& t) {
    CalendarDateTime cal = toUtc(t);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", cal.year, cal.month, cal.day);
    return buf;
}

std::string formatUtcTime(const Instant& t, bool with_seconds) {
    CalendarDateTime cal = toUtc(t);
    char buf[32];
    if (with_seconds) {
        std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", cal.hour, cal.minute,
                      static_cast<int>(std::floor(cal.second)));
    } else {
        std::snprintf(buf, sizeof(buf), "%02d:%02d", cal.hour, cal.minute);
    }
    return buf;
}

std::string formatUtc(const Instant& t) {
    return formatUtcDate(t) + " " + formatUtcTime(t) + " UTC";
}

Instant now() {
    using namespace std::chrono;
    long long ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    long long days = ms / MS_PER_DAY;
    double day_fraction = static_cast<double>(ms % MS_PER_DAY) / static_cast<double>(MS_PER_DAY);

    // 1970-01-01T00:00 UTC = JD 2440587.5
    Instant utc_as_jd = Instant::fromTwoPart(2440587.0 + static_cast<double>(days), 0.5 + day_fraction);
    CalendarDateTime cal = civilCalendar(utc_as_jd);
    return utc_as_jd.plusSeconds(taiMinusUtc(cal.year, cal.month, cal.day) + TT_MINUS_TAI);
}

Instant validateWithinInterval(const Instant& t, const TimeInterval& supported) {
    if (!supported.contains(t)) {
        throw OutOfEphemerisRangeError("Date " + formatUtc(t) + " is outside the supported ephemeris range " +
                                       formatUtc(supported.start) + " to " + formatUtc(supported.end));
    }
    return t;
}

Instant validateWithinEphemeris(const Instant& t, const ephemeris::EphemerisStore& store) {
    return validateWithinInterval(t, store.supportedInterval());
}

} // namespace solartrack::time
