/**
 * @file ElementExtractor.cpp
 * @brief Implementation of ElementExtractor
 */

#include "solartrack/orbits/ElementExtractor.hpp"
#include "solartrack/time/TimeUtils.hpp"
#include <iostream>

namespace solartrack::orbits {

ElementExtractor::ElementExtractor(std::shared_ptr<const ephemeris::EphemerisStore> store, bool verbose)
    : calculator_(std::move(store), verbose), verbose_(verbose) {}

OrbitalElements ElementExtractor::elements(const std::string& body_name, const time::Instant& at) const {
    OrbitalElements result;
    result.epoch = at;

    try {
        const auto& store = calculator_.store();
        const ephemeris::Body& body = store.body(body_name);
        if (body.naif_id == store.sun().naif_id) {
            std::cerr << "[ElementExtractor] Warning: the Sun has no heliocentric orbit\n";
            return result;
        }
        time::validateWithinEphemeris(at, store);

        const ephemeris::Body& center = (body.center_id == store.earth().naif_id) ? store.earth() : store.sun();
        const double mu = center.gm + body.gm;

        // Elements are frame-independent; stay in the native frame
        ephemeris::BodyState s = calculator_.stateRelativeToCenter(body, at, ephemeris::ReferenceFrame::EQUATORIAL_J2000);

        if (!stateToElements(s.position, s.velocity, mu, result)) {
            std::cerr << "[ElementExtractor] Warning: degenerate or unbound state for "
                      << body.name << " at " << time::formatUtc(at) << "\n";
            return result;
        }

        if (verbose_) {
            std::cout << "[ElementExtractor] " << body.name << " about " << center.name
                      << ": a=" << result.semi_major_axis << " AU e=" << result.eccentricity << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "[ElementExtractor] Warning: elements for '" << body_name
                  << "' unavailable: " << e.what() << "\n";
        result.semi_major_axis = 0.0;
        result.eccentricity = 0.0;
    }
    return result;
}

} // namespace solartrack::orbits
