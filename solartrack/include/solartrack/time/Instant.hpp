/**
 * @file Instant.hpp
 * @brief Continuous time value used throughout SolarTrack
 * @author SolarTrack Team
 *
 * An Instant is a two-part Julian Date in Terrestrial Time: an integral day
 * number plus a fraction in [0, 1). Keeping the fraction separate preserves
 * sub-nanosecond resolution across the whole DE4xx range, which a single
 * double JD (~20 us at JD 2.4e6) cannot.
 */

#ifndef SOLARTRACK_TIME_INSTANT_HPP
#define SOLARTRACK_TIME_INSTANT_HPP

#include <cstdint>
#include <vector>

namespace solartrack::time {

class Instant {
public:
    /// J2000.0 TT
    Instant() = default;

    /// From a single Julian Date (TT)
    static Instant fromJulianDate(double jd_tt);

    /// From a two-part Julian Date (TT); the parts need not be normalised
    static Instant fromTwoPart(double jd_day, double jd_fraction);

    /// From ephemeris time (TDB seconds past J2000)
    static Instant fromEphemerisTime(double et_tdb);

    /// Julian Date (TT) as one double, for interval arithmetic
    double julianDate() const { return static_cast<double>(day_) + fraction_; }
    double modifiedJulianDate() const;

    std::int64_t dayPart() const { return day_; }
    double fractionPart() const { return fraction_; }

    /// TDB seconds past J2000, the argument SPK kernels are indexed by
    double ephemerisTime() const;

    Instant plusDays(double days) const;
    Instant plusSeconds(double seconds) const { return plusDays(seconds / 86400.0); }

    /// Signed interval this -> other [days]
    double daysUntil(const Instant& other) const;

    bool operator==(const Instant& o) const { return day_ == o.day_ && fraction_ == o.fraction_; }
    bool operator!=(const Instant& o) const { return !(*this == o); }
    bool operator<(const Instant& o) const {
        return day_ < o.day_ || (day_ == o.day_ && fraction_ < o.fraction_);
    }
    bool operator>(const Instant& o) const { return o < *this; }
    bool operator<=(const Instant& o) const { return !(o < *this); }
    bool operator>=(const Instant& o) const { return !(*this < o); }

private:
    Instant(std::int64_t day, double fraction) : day_(day), fraction_(fraction) {}

    std::int64_t day_ = 2451545;
    double fraction_ = 0.0;
};

/// TDB - TT [s] (periodic term, ~1.7 ms amplitude)
double tdbMinusTt(double jd_tt);

/// Closed time interval
struct TimeInterval {
    Instant start;
    Instant end;

    bool contains(const Instant& t) const { return start <= t && t <= end; }
    double durationDays() const { return start.daysUntil(end); }
};

/**
 * @brief count evenly spaced instants across [start, end], endpoints included
 *
 * The last element is exactly end. count < 2 yields {start} or nothing.
 */
std::vector<Instant> linspace(const Instant& start, const Instant& end, int count);

} // namespace solartrack::time

#endif // SOLARTRACK_TIME_INSTANT_HPP
