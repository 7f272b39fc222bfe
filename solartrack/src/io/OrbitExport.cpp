/**
 * @file OrbitExport.cpp
 * @brief Implementation of orbit export
 */

#include "solartrack/io/OrbitExport.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace solartrack::io {

std::vector<OrbitExportRow> toExportRows(const orbits::OrbitSet& orbits) {
    std::vector<OrbitExportRow> rows;
    for (const auto& [name, path] : orbits) {
        if (!path) continue;
        for (std::size_t i = 0; i < path->positions.size(); ++i) {
            const auto& p = path->positions[i];
            rows.push_back(OrbitExportRow{name, i, p.x(), p.y(), p.z()});
        }
    }
    return rows;
}

std::size_t writeOrbitCsv(std::ostream& out, const orbits::OrbitSet& orbits) {
    const auto rows = toExportRows(orbits);

    out << "Planet,Point Index,X (AU),Y (AU),Z (AU)\n";
    out << std::setprecision(12);
    for (const auto& r : rows) {
        out << r.body << ',' << r.index << ',' << r.x << ',' << r.y << ',' << r.z << '\n';
    }
    if (!out) {
        throw std::runtime_error("Failed writing orbit CSV");
    }
    return rows.size();
}

std::size_t writeOrbitCsv(const std::string& path, const orbits::OrbitSet& orbits) {
    std::ofstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open output file: " + path);
    }
    return writeOrbitCsv(f, orbits);
}

} // namespace solartrack::io
