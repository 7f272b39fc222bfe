// PositionCalculator.hpp
// Heliocentric positions of named bodies at one instant, sampled from the
// Ephemeris Store. Planets are evaluated Sun-relative directly; the Moon is
// evaluated geocentrically and translated by Earth's heliocentric position.

#ifndef SOLARTRACK_EPHEMERIS_POSITIONCALCULATOR_HPP
#define SOLARTRACK_EPHEMERIS_POSITIONCALCULATOR_HPP

#include "solartrack/ephemeris/EphemerisStore.hpp"
#include <Eigen/Dense>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace solartrack::ephemeris {

/// Body name (canonical) -> position [AU]
using PositionMap = std::map<std::string, Eigen::Vector3d>;

class PositionCalculator {
public:
    explicit PositionCalculator(std::shared_ptr<const EphemerisStore> store, bool verbose = false);

    /**
     * @brief Positions of several bodies at one instant
     *
     * Each body is computed independently. A body that cannot be computed
     * (unknown name, no coverage) is reported on stderr and left out of the
     * map; callers must treat a missing key as unavailable, never as zero.
     * Keys are canonical body names ("mars" -> "Mars").
     *
     * @throws OutOfEphemerisRangeError if at is outside the supported interval
     */
    PositionMap positions(const std::vector<std::string>& bodies,
                          const time::Instant& at,
                          ReferenceFrame frame = ReferenceFrame::ECLIPTIC_J2000) const;

    /**
     * @brief Heliocentric position of one body (Moon = Earth_helio + Moon_geo)
     * @throws std::runtime_error from the ephemeris if at is not covered
     */
    Eigen::Vector3d heliocentric(const Body& body,
                                 const time::Instant& at,
                                 ReferenceFrame frame = ReferenceFrame::ECLIPTIC_J2000) const;

    /// Same, by name; throws UnknownBodyError
    Eigen::Vector3d heliocentric(const std::string& name,
                                 const time::Instant& at,
                                 ReferenceFrame frame = ReferenceFrame::ECLIPTIC_J2000) const;

    /// State relative to the body's natural center (Sun, or Earth for the Moon)
    BodyState stateRelativeToCenter(const Body& body,
                                    const time::Instant& at,
                                    ReferenceFrame frame = ReferenceFrame::ECLIPTIC_J2000) const;

    const EphemerisStore& store() const { return *store_; }
    const std::shared_ptr<const EphemerisStore>& storePtr() const { return store_; }

private:
    std::shared_ptr<const EphemerisStore> store_;
    bool verbose_;
};

} // namespace solartrack::ephemeris

#endif // SOLARTRACK_EPHEMERIS_POSITIONCALCULATOR_HPP
