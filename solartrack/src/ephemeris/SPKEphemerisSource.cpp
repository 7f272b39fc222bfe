/**
 * @file SPKEphemerisSource.cpp
 * @brief Implementation of the SPK-backed ephemeris source
 */

#include "solartrack/ephemeris/SPKEphemerisSource.hpp"
#include "solartrack/io/SPKReader.hpp"
#include <filesystem>

namespace solartrack::ephemeris {

SPKEphemerisSource::SPKEphemerisSource(const std::string& bsp_file)
    : bsp_file_(bsp_file)
{
    reader_ = std::make_unique<io::SPKReader>(bsp_file);
}

SPKEphemerisSource::~SPKEphemerisSource() = default;

Eigen::VectorXd SPKEphemerisSource::getState(int target_id, int observer_id, double et) const {
    // Chains such as Moon (301 -> 3 -> 0) and Earth (399 -> 3 -> 0) are resolved by the reader
    return reader_->getStateRelativeTo(target_id, observer_id, et);
}

std::optional<Coverage> SPKEphemerisSource::getCoverage(int body_id) const {
    auto window = reader_->coverage(body_id);
    if (!window) return std::nullopt;
    return Coverage{window->start_et, window->end_et};
}

std::string SPKEphemerisSource::getName() const {
    return "JPL SPK (" + std::filesystem::path(bsp_file_).filename().string() + ")";
}

} // namespace solartrack::ephemeris
