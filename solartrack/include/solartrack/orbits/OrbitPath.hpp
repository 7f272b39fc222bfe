/**
 * @file OrbitPath.hpp
 * @brief Sampled heliocentric trajectory of one body
 * @author SolarTrack Team
 */

#ifndef SOLARTRACK_ORBITS_ORBIT_PATH_HPP
#define SOLARTRACK_ORBITS_ORBIT_PATH_HPP

#include "solartrack/ephemeris/ReferenceFrame.hpp"
#include "solartrack/time/Instant.hpp"
#include <Eigen/Dense>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace solartrack::orbits {

/**
 * @brief Ordered samples of a body's heliocentric position
 *
 * Either empty or exactly the requested sample count. Shared immutably; the
 * only thing that retires a path is eviction from the sampler cache, and
 * holders keep theirs alive through the shared_ptr.
 */
struct OrbitPath {
    std::string body;
    ephemeris::ReferenceFrame frame = ephemeris::ReferenceFrame::ECLIPTIC_J2000;
    std::vector<time::Instant> epochs;
    std::vector<Eigen::Vector3d> positions;   ///< [AU], epochs[i] <-> positions[i]

    bool empty() const { return positions.empty(); }
    std::size_t size() const { return positions.size(); }
};

using OrbitPathPtr = std::shared_ptr<const OrbitPath>;

/// Body name -> path, as handed to renderers and exporters
using OrbitSet = std::map<std::string, OrbitPathPtr>;

} // namespace solartrack::orbits

#endif // SOLARTRACK_ORBITS_ORBIT_PATH_HPP
