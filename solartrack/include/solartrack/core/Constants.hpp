/**
 * @file Constants.hpp
 * @brief Physical and astronomical constants used across SolarTrack
 * @author SolarTrack Team
 */

#ifndef SOLARTRACK_CORE_CONSTANTS_HPP
#define SOLARTRACK_CORE_CONSTANTS_HPP

namespace solartrack {
namespace constants {

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;

// Time
constexpr double SECONDS_PER_DAY = 86400.0;
constexpr double DAYS_PER_JULIAN_YEAR = 365.25;
constexpr double J2000_JD = 2451545.0;          ///< JD of J2000.0 (TT)
constexpr double MJD_OFFSET = 2400000.5;
constexpr double TT_MINUS_TAI = 32.184;         ///< [s]

// Event search grid
constexpr double MIN_SEARCH_STEP_DAYS = 1.0e-6;       ///< ~0.09 s
constexpr long long MAX_SEARCH_GRID_POINTS = 4000000;

// Distances
constexpr double KM_PER_AU = 149597870.7;       ///< IAU 2012 [km]

/// Mean obliquity of the ecliptic at J2000 (IAU 1976) [deg]
constexpr double OBLIQUITY_J2000_DEG = 23.4392911;

// Gravitational parameters from DE440 [km^3/s^2]
constexpr double GM_SUN_KM3S2 = 132712440041.279419;
constexpr double GM_MERCURY_KM3S2 = 22031.868551;
constexpr double GM_VENUS_KM3S2 = 324858.592000;
constexpr double GM_EARTH_KM3S2 = 398600.435507;
constexpr double GM_MOON_KM3S2 = 4902.800118;
constexpr double GM_MARS_SYS_KM3S2 = 42828.375816;
constexpr double GM_JUPITER_SYS_KM3S2 = 126712764.100000;
constexpr double GM_SATURN_SYS_KM3S2 = 37940584.841800;
constexpr double GM_URANUS_SYS_KM3S2 = 5794556.400000;
constexpr double GM_NEPTUNE_SYS_KM3S2 = 6836527.100580;
constexpr double GM_PLUTO_SYS_KM3S2 = 975.500000;

/// Convert a GM in km^3/s^2 to AU^3/day^2
constexpr double gmToAuDay(double gm_km3s2) {
    return gm_km3s2 * (SECONDS_PER_DAY * SECONDS_PER_DAY)
           / (KM_PER_AU * KM_PER_AU * KM_PER_AU);
}

// NAIF integer codes
namespace naif {
constexpr int SSB = 0;
constexpr int MERCURY_BARYCENTER = 1;
constexpr int VENUS_BARYCENTER = 2;
constexpr int EMB = 3;
constexpr int MARS_BARYCENTER = 4;
constexpr int JUPITER_BARYCENTER = 5;
constexpr int SATURN_BARYCENTER = 6;
constexpr int URANUS_BARYCENTER = 7;
constexpr int NEPTUNE_BARYCENTER = 8;
constexpr int PLUTO_BARYCENTER = 9;
constexpr int SUN = 10;
constexpr int MERCURY = 199;
constexpr int VENUS = 299;
constexpr int MOON = 301;
constexpr int EARTH = 399;
constexpr int MARS = 499;
} // namespace naif

} // namespace constants
} // namespace solartrack

#endif // SOLARTRACK_CORE_CONSTANTS_HPP
