/**
 * @file OrbitExport.hpp
 * @brief Flatten sampled orbits into rows and CSV
 * @author SolarTrack Team
 */

#ifndef SOLARTRACK_IO_ORBIT_EXPORT_HPP
#define SOLARTRACK_IO_ORBIT_EXPORT_HPP

#include "solartrack/orbits/OrbitPath.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace solartrack::io {

struct OrbitExportRow {
    std::string body;
    std::size_t index;
    double x;   ///< [AU]
    double y;
    double z;
};

/// One row per sample, bodies in map order, samples in time order
std::vector<OrbitExportRow> toExportRows(const orbits::OrbitSet& orbits);

/**
 * @brief Write `Planet,Point Index,X (AU),Y (AU),Z (AU)` CSV
 * @return Number of data rows written
 */
std::size_t writeOrbitCsv(std::ostream& out, const orbits::OrbitSet& orbits);

/// Same, to a file; throws std::runtime_error if it cannot be opened
std::size_t writeOrbitCsv(const std::string& path, const orbits::OrbitSet& orbits);

} // namespace solartrack::io

#endif // SOLARTRACK_IO_ORBIT_EXPORT_HPP
