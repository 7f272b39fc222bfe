/**
 * @file SPKEphemerisSource.hpp
 * @brief JPL DE4xx ephemeris source backed by the native SPK reader
 * @author SolarTrack Team
 *
 * Works with any DAF/SPK planetary kernel (de440s.bsp, de440.bsp,
 * de441_part-2.bsp, ...). No CSPICE dependency.
 */

#ifndef SOLARTRACK_EPHEMERIS_SPK_SOURCE_HPP
#define SOLARTRACK_EPHEMERIS_SPK_SOURCE_HPP

#include "solartrack/ephemeris/EphemerisSource.hpp"
#include <memory>
#include <string>

namespace solartrack::io {
    class SPKReader;
}

namespace solartrack::ephemeris {

class SPKEphemerisSource : public EphemerisSource {
public:
    /**
     * @brief Open and index an SPK kernel
     * @param bsp_file Path to the .bsp file
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    explicit SPKEphemerisSource(const std::string& bsp_file);

    ~SPKEphemerisSource() override;

    Eigen::VectorXd getState(int target_id, int observer_id, double et) const override;
    std::optional<Coverage> getCoverage(int body_id) const override;
    std::string getName() const override;

private:
    std::string bsp_file_;
    std::unique_ptr<io::SPKReader> reader_;
};

} // namespace solartrack::ephemeris

#endif // SOLARTRACK_EPHEMERIS_SPK_SOURCE_HPP
