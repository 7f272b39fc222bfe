/**
 * @file OrbitalElements.cpp
 * @brief Cartesian state to osculating elements
 */

#include "solartrack/orbits/OrbitalElements.hpp"
#include <cmath>

namespace solartrack::orbits {

bool stateToElements(const Eigen::Vector3d& position,
                     const Eigen::Vector3d& velocity,
                     double mu,
                     OrbitalElements& out) {
    if (!(mu > 0.0) || !position.allFinite() || !velocity.allFinite()) return false;

    const double r = position.norm();
    if (r <= 0.0) return false;
    const double v2 = velocity.squaredNorm();

    // Specific orbital energy must be negative for an ellipse
    const double inv_a = 2.0 / r - v2 / mu;
    if (!(inv_a > 0.0)) return false;

    Eigen::Vector3d e_vec = ((v2 - mu / r) * position - position.dot(velocity) * velocity) / mu;
    const double e = e_vec.norm();
    if (!std::isfinite(e) || e >= 1.0) return false;

    out.semi_major_axis = 1.0 / inv_a;
    out.eccentricity = e;
    return true;
}

} // namespace solartrack::orbits
