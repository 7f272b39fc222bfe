/**
 * @file EphemerisStore.hpp
 * @brief Process-wide, read-only planetary ephemeris with named bodies
 * @author SolarTrack Team
 *
 * The store is created once at startup and shared by reference
 * (std::shared_ptr<const EphemerisStore>) with every component. It binds
 * body names to NAIF IDs and natural centers, converts raw source states to
 * AU and AU/day, rotates them into the requested frame, and publishes the
 * time interval callers must clamp to.
 */

#ifndef SOLARTRACK_EPHEMERIS_STORE_HPP
#define SOLARTRACK_EPHEMERIS_STORE_HPP

#include "solartrack/ephemeris/EphemerisSource.hpp"
#include "solartrack/ephemeris/ReferenceFrame.hpp"
#include "solartrack/time/Instant.hpp"
#include <Eigen/Dense>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace solartrack::ephemeris {

/**
 * @brief A body bound to the loaded ephemeris
 */
struct Body {
    std::string name;       ///< Canonical name ("Mars")
    int naif_id;            ///< ID evaluated in the source (499 or barycenter 4, ...)
    int center_id;          ///< Natural center: Sun (10), or Earth (399) for the Moon
    std::string center_name;
    double gm;              ///< GM of the body (system) [AU^3/day^2]
};

/**
 * @brief Position and velocity
 */
struct BodyState {
    Eigen::Vector3d position;   ///< [AU]
    Eigen::Vector3d velocity;   ///< [AU/day]
};

class EphemerisStore {
public:
    /// Margin trimmed from both ends of the file's nominal coverage [days]
    static constexpr double DEFAULT_MARGIN_DAYS = 0.5;

    /**
     * @brief Load a binary SPK ephemeris
     *
     * @param bsp_file Path to the kernel (e.g. de440s.bsp)
     * @param margin_days Safety margin subtracted from both coverage ends
     * @param verbose Print a load summary to stdout
     * @throws EphemerisLoadError if the file is missing, corrupt, or lacks Sun, Earth or Moon
     */
    static std::shared_ptr<const EphemerisStore> load(const std::string& bsp_file,
                                                      double margin_days = DEFAULT_MARGIN_DAYS,
                                                      bool verbose = false);

    /**
     * @brief Build a store over any source (tests inject a mock)
     * @throws EphemerisLoadError if a required body is absent or coverage is empty
     */
    explicit EphemerisStore(std::shared_ptr<const EphemerisSource> source,
                            double margin_days = DEFAULT_MARGIN_DAYS);

    /// Case-insensitive lookup; nullptr if the name is not bound
    const Body* findBody(const std::string& name) const;

    /// @throws UnknownBodyError
    const Body& body(const std::string& name) const;

    bool hasBody(const std::string& name) const { return findBody(name) != nullptr; }

    /// All bound bodies, in ephemeris order (Sun first)
    const std::vector<Body>& bodies() const { return bodies_; }

    /// Canonical names of all bound bodies, in ephemeris order
    std::vector<std::string> bodyNames() const;

    const Body& sun() const { return body("Sun"); }
    const Body& earth() const { return body("Earth"); }
    const Body& moon() const { return body("Moon"); }

    /// Interval every query must fall in (coverage of Sun, Earth and Moon less the margin)
    const time::TimeInterval& supportedInterval() const { return supported_; }

    /**
     * @brief State of target relative to observer
     * @throws std::runtime_error from the source if the instant is not covered
     */
    BodyState state(const Body& target, const Body& observer, const time::Instant& at,
                    ReferenceFrame frame = ReferenceFrame::ECLIPTIC_J2000) const;

    /// Position only
    Eigen::Vector3d position(const Body& target, const Body& observer, const time::Instant& at,
                             ReferenceFrame frame = ReferenceFrame::ECLIPTIC_J2000) const;

    /// GM of Sun [AU^3/day^2]
    double sunGM() const { return sun().gm; }

    const EphemerisSource& source() const { return *source_; }
    std::string describe() const;

private:
    std::shared_ptr<const EphemerisSource> source_;
    std::vector<Body> bodies_;
    std::map<std::string, std::size_t> index_;   // lower-case name -> bodies_ slot
    time::TimeInterval supported_;

    void bindBodies();
    void computeSupportedInterval(double margin_days);
};

} // namespace solartrack::ephemeris

#endif // SOLARTRACK_EPHEMERIS_STORE_HPP
