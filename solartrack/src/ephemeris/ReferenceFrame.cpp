/**
 * @file ReferenceFrame.cpp
 * @brief Frame rotations
 */

#include "solartrack/ephemeris/ReferenceFrame.hpp"
#include "solartrack/core/Constants.hpp"
#include "solartrack/utils/StringUtils.hpp"
#include <cmath>
#include <stdexcept>

namespace solartrack::ephemeris {

Eigen::Matrix3d equatorialToEclipticMatrix() {
    constexpr double epsilon = constants::OBLIQUITY_J2000_DEG * constants::DEG_TO_RAD;
    const double c = std::cos(epsilon);
    const double s = std::sin(epsilon);
    Eigen::Matrix3d R;
    R << 1, 0, 0,
         0, c, s,
         0, -s, c;
    return R;
}

Eigen::Vector3d toFrame(const Eigen::Vector3d& equatorial, ReferenceFrame frame) {
    if (frame == ReferenceFrame::EQUATORIAL_J2000) return equatorial;
    static const Eigen::Matrix3d R = equatorialToEclipticMatrix();
    return R * equatorial;
}

std::string frameName(ReferenceFrame frame) {
    return frame == ReferenceFrame::ECLIPTIC_J2000 ? "ecliptic" : "equatorial";
}

ReferenceFrame frameFromName(const std::string& name) {
    std::string lower = utils::toLower(utils::trim(name));
    if (lower == "ecliptic" || lower == "eclipj2000") return ReferenceFrame::ECLIPTIC_J2000;
    if (lower == "equatorial" || lower == "j2000" || lower == "icrf") return ReferenceFrame::EQUATORIAL_J2000;
    throw std::invalid_argument("Unknown reference frame '" + name + "' (expected 'ecliptic' or 'equatorial')");
}

} // namespace solartrack::ephemeris
