/**
 * @file OrbitalElements.hpp
 * @brief Osculating orbital elements and the state -> elements conversion
 * @author SolarTrack Team
 */

#ifndef SOLARTRACK_ORBITS_ORBITAL_ELEMENTS_HPP
#define SOLARTRACK_ORBITS_ORBITAL_ELEMENTS_HPP

#include "solartrack/time/Instant.hpp"
#include <Eigen/Dense>

namespace solartrack::orbits {

/**
 * @brief Osculating semi-major axis and eccentricity at one instant
 *
 * Valid only at epoch. A zero pair means "unavailable".
 */
struct OrbitalElements {
    double semi_major_axis = 0.0;  ///< [AU]
    double eccentricity = 0.0;
    time::Instant epoch;

    bool isAvailable() const { return semi_major_axis > 0.0 || eccentricity > 0.0; }
};

/**
 * @brief Two-body elements from a relative state
 *
 * a = 1 / (2/r - v^2/mu), e = |((v^2 - mu/r) r - (r.v) v) / mu|.
 *
 * @param position Relative position [AU]
 * @param velocity Relative velocity [AU/day]
 * @param mu GM(center) + GM(body) [AU^3/day^2]
 * @return false (and out untouched) for a degenerate or unbound state
 */
bool stateToElements(const Eigen::Vector3d& position,
                     const Eigen::Vector3d& velocity,
                     double mu,
                     OrbitalElements& out);

} // namespace solartrack::orbits

#endif // SOLARTRACK_ORBITS_ORBITAL_ELEMENTS_HPP
