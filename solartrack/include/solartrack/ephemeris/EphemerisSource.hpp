/**
 * @file EphemerisSource.hpp
 * @brief Abstract source of raw ephemeris states
 * @author SolarTrack Team
 */

#ifndef SOLARTRACK_EPHEMERIS_SOURCE_HPP
#define SOLARTRACK_EPHEMERIS_SOURCE_HPP

#include <Eigen/Dense>
#include <optional>
#include <string>

namespace solartrack::ephemeris {

/**
 * @brief Time span covered for a body [s past J2000 TDB]
 */
struct Coverage {
    double start_et;
    double end_et;
};

/**
 * @brief Raw ephemeris backend addressed by NAIF IDs
 *
 * States are returned in the native J2000 equatorial frame, in km and km/s,
 * exactly as an SPK kernel stores them. Unit conversion, frame rotation and
 * body naming happen in EphemerisStore. Implementations must be safe to call
 * from several threads.
 */
class EphemerisSource {
public:
    virtual ~EphemerisSource() = default;

    /**
     * @brief State of target relative to observer
     * @param et Ephemeris time (seconds past J2000 TDB)
     * @return [x, y, z, vx, vy, vz] in km and km/s
     * @throws std::runtime_error if the body is absent or et is not covered
     */
    virtual Eigen::VectorXd getState(int target_id, int observer_id, double et) const = 0;

    /// Coverage of a body, or nullopt if the source cannot evaluate it
    virtual std::optional<Coverage> getCoverage(int body_id) const = 0;

    virtual std::string getName() const = 0;
};

} // namespace solartrack::ephemeris

#endif // SOLARTRACK_EPHEMERIS_SOURCE_HPP
