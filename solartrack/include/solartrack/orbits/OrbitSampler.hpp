/**
 * @file OrbitSampler.hpp
 * @brief Evenly spaced heliocentric samples of a body's trajectory
 * @author SolarTrack Team
 *
 * The requested window is clamped into the ephemeris supported interval,
 * then sampled at sample_count instants including both endpoints. Results
 * are memoised in an OrbitCache keyed on the clamped request.
 */

#ifndef SOLARTRACK_ORBITS_ORBIT_SAMPLER_HPP
#define SOLARTRACK_ORBITS_ORBIT_SAMPLER_HPP

#include "solartrack/ephemeris/PositionCalculator.hpp"
#include "solartrack/orbits/OrbitCache.hpp"
#include "solartrack/orbits/OrbitPath.hpp"
#include <memory>
#include <string>
#include <vector>

namespace solartrack::orbits {

class OrbitSampler {
public:
    static constexpr int DEFAULT_SAMPLE_COUNT = 500;

    OrbitSampler(std::shared_ptr<const ephemeris::EphemerisStore> store,
                 std::size_t cache_capacity = OrbitCache::DEFAULT_CAPACITY,
                 bool verbose = false);

    /**
     * @brief Sample one body's orbit over [start, end]
     *
     * @return Empty path if the clamped window has no positive duration,
     *         otherwise exactly sample_count samples
     * @throws InvalidSampleCountError if sample_count <= 1
     * @throws UnknownBodyError if the body is not in the ephemeris
     * @throws std::runtime_error if any sample cannot be evaluated
     */
    OrbitPathPtr orbit(const std::string& body,
                       const time::Instant& start,
                       const time::Instant& end,
                       int sample_count = DEFAULT_SAMPLE_COUNT,
                       ephemeris::ReferenceFrame frame = ephemeris::ReferenceFrame::ECLIPTIC_J2000);

    /**
     * @brief Sample several bodies; failures are logged and the body omitted
     * @throws InvalidSampleCountError if sample_count <= 1
     */
    OrbitSet orbits(const std::vector<std::string>& bodies,
                    const time::Instant& start,
                    const time::Instant& end,
                    int sample_count = DEFAULT_SAMPLE_COUNT,
                    ephemeris::ReferenceFrame frame = ephemeris::ReferenceFrame::ECLIPTIC_J2000);

    OrbitCache& cache() { return cache_; }
    const OrbitCache& cache() const { return cache_; }

private:
    ephemeris::PositionCalculator calculator_;
    OrbitCache cache_;
    bool verbose_;
};

/**
 * @brief Read a sample count typed by a user
 * @throws InvalidSampleCountError if text is not a whole integer in int range, or is below 2
 */
int parseSampleCount(const std::string& text);

} // namespace solartrack::orbits

#endif // SOLARTRACK_ORBITS_ORBIT_SAMPLER_HPP
