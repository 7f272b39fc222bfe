/**
 * @file Instant.cpp
 * @brief Implementation of Instant
 */

#include "solartrack/time/Instant.hpp"
#include "solartrack/core/Constants.hpp"
#include <cmath>

namespace solartrack::time {

using namespace solartrack::constants;

Instant Instant::fromTwoPart(double jd_day, double jd_fraction) {
    double whole = std::floor(jd_day);
    double frac = (jd_day - whole) + jd_fraction;
    double carry = std::floor(frac);
    frac -= carry;
    // Guard against frac == 1.0 after rounding of a tiny negative value
    if (frac >= 1.0) {
        frac -= 1.0;
        carry += 1.0;
    }
    return Instant(static_cast<std::int64_t>(whole + carry), frac);
}

Instant Instant::fromJulianDate(double jd_tt) {
    return fromTwoPart(jd_tt, 0.0);
}

Instant Instant::fromEphemerisTime(double et_tdb) {
    double days = et_tdb / SECONDS_PER_DAY;
    double jd_guess = J2000_JD + days;
    double tt_days = days - tdbMinusTt(jd_guess) / SECONDS_PER_DAY;
    return fromTwoPart(J2000_JD, tt_days);
}

double Instant::modifiedJulianDate() const {
    return static_cast<double>(day_ - 2400000) + (fraction_ - 0.5);
}

double Instant::ephemerisTime() const {
    double days = static_cast<double>(day_ - static_cast<std::int64_t>(J2000_JD)) + fraction_;
    return days * SECONDS_PER_DAY + tdbMinusTt(julianDate());
}

Instant Instant::plusDays(double days) const {
    return fromTwoPart(static_cast<double>(day_), fraction_ + days);
}

double Instant::daysUntil(const Instant& other) const {
    return static_cast<double>(other.day_ - day_) + (other.fraction_ - fraction_);
}

double tdbMinusTt(double jd_tt) {
    // Mean anomaly of the Earth-Moon barycenter
    double g = (357.53 + 0.98560028 * (jd_tt - J2000_JD)) * DEG_TO_RAD;
    return 0.001657 * std::sin(g) + 0.000014 * std::sin(2.0 * g);
}

std::vector<Instant> linspace(const Instant& start, const Instant& end, int count) {
    std::vector<Instant> out;
    if (count <= 0) return out;
    if (count == 1) {
        out.push_back(start);
        return out;
    }
    out.reserve(static_cast<std::size_t>(count));
    double span = start.daysUntil(end);
    for (int i = 0; i < count - 1; ++i) {
        out.push_back(start.plusDays(span * static_cast<double>(i) / static_cast<double>(count - 1)));
    }
    out.push_back(end);
    return out;
}

} // namespace solartrack::time
