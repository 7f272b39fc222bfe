/**
 * @file TimeUtils.hpp
 * @brief Calendar (UTC) <-> Instant conversion and ephemeris range checks
 * @author SolarTrack Team
 *
 * Dates are Gregorian, `YYYY-MM-DD`; times are 24-hour `HH:MM` with
 * optional `:SS` or `:SS.fff`. UTC is mapped to TT through the IERS
 * leap-second table (TAI - UTC) plus the fixed 32.184 s TT - TAI offset.
 * Before 1972 TAI - UTC is held at its 1972 value of 10 s.
 */

#ifndef SOLARTRACK_TIME_TIMEUTILS_HPP
#define SOLARTRACK_TIME_TIMEUTILS_HPP

#include "solartrack/time/Instant.hpp"
#include <string>

namespace solartrack::ephemeris {
class EphemerisStore;
}

namespace solartrack::time {

/**
 * @brief Broken-down UTC calendar time
 */
struct CalendarDateTime {
    int year = 2000;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    double second = 0.0;
};

bool isLeapYear(int year);
int daysInMonth(int year, int month);

/// Julian Day Number of a Gregorian date (the JD at noon of that day)
long long julianDayNumber(int year, int month, int day);

/// TAI - UTC [s] in effect on the given UTC date
double taiMinusUtc(int year, int month, int day);

/**
 * @brief Parse a UTC date and time of day
 * @param date `YYYY-MM-DD`
 * @param time `HH:MM`, `HH:MM:SS` or `HH:MM:SS.fff`
 * @throws InvalidFormatError on malformed text or out-of-range fields
 */
Instant parse(const std::string& date, const std::string& time);

/**
 * @brief Instant for a broken-down UTC time
 * @throws InvalidFormatError if a field is out of range
 */
Instant fromUtc(const CalendarDateTime& utc);

/// Broken-down UTC, rounded to the nearest millisecond
CalendarDateTime toUtc(const Instant& t);

/// `YYYY-MM-DD`
std::string formatUtcDate(const Instant& t);

/// `HH:MM` or `HH:MM:SS`
std::string formatUtcTime(const Instant& t, bool with_seconds = false);

/// `YYYY-MM-DD HH:MM UTC`
std::string formatUtc(const Instant& t);

/// Current system clock time
Instant now();

/**
 * @brief Reject instants the ephemeris cannot answer
 *
 * Every consumer applies this before sampling the ephemeris.
 *
 * @return t unchanged
 * @throws OutOfEphemerisRangeError naming the supported date range
 */
Instant validateWithinEphemeris(const Instant& t, const ephemeris::EphemerisStore& store);

/// Same check against an explicit interval
Instant validateWithinInterval(const Instant& t, const TimeInterval& supported);

} // namespace solartrack::time

#endif // SOLARTRACK_TIME_TIMEUTILS_HPP
