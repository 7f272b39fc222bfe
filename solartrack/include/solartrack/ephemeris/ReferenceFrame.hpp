/**
 * @file ReferenceFrame.hpp
 * @brief Output reference frames and the J2000 equatorial -> ecliptic rotation
 * @author SolarTrack Team
 */

#ifndef SOLARTRACK_EPHEMERIS_REFERENCE_FRAME_HPP
#define SOLARTRACK_EPHEMERIS_REFERENCE_FRAME_HPP

#include <Eigen/Dense>
#include <string>

namespace solartrack::ephemeris {

enum class ReferenceFrame {
    EQUATORIAL_J2000,  ///< ICRF / J2000 equatorial, native SPK frame
    ECLIPTIC_J2000     ///< Mean ecliptic and equinox of J2000
};

/// Rotation taking J2000 equatorial vectors to the ecliptic frame
Eigen::Matrix3d equatorialToEclipticMatrix();

/// Express a J2000 equatorial vector in the requested frame
Eigen::Vector3d toFrame(const Eigen::Vector3d& equatorial, ReferenceFrame frame);

/// "equatorial" | "ecliptic"
std::string frameName(ReferenceFrame frame);

/**
 * @brief Parse a frame name (case-insensitive)
 * @throws std::invalid_argument for unknown names
 */
ReferenceFrame frameFromName(const std::string& name);

} // namespace solartrack::ephemeris

#endif // SOLARTRACK_EPHEMERIS_REFERENCE_FRAME_HPP
