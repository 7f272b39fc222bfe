/**
 * @file PositionCalculator.cpp
 * @brief Implementation of PositionCalculator
 */

#include "solartrack/ephemeris/PositionCalculator.hpp"
#include "solartrack/core/Constants.hpp"
#include "solartrack/core/Errors.hpp"
#include "solartrack/time/TimeUtils.hpp"
#include <cmath>
#include <iostream>

namespace solartrack::ephemeris {

PositionCalculator::PositionCalculator(std::shared_ptr<const EphemerisStore> store, bool verbose)
    : store_(std::move(store)), verbose_(verbose)
{
    if (!store_) throw std::invalid_argument("PositionCalculator requires an ephemeris store");
}

Eigen::Vector3d PositionCalculator::heliocentric(const Body& body,
                                                 const time::Instant& at,
                                                 ReferenceFrame frame) const {
    const Body& sun = store_->sun();
    if (body.naif_id == sun.naif_id) return Eigen::Vector3d::Zero();

    if (body.center_id == constants::naif::EARTH) {
        // Moon_helio = Earth_helio + Moon_geo
        const Body& earth = store_->earth();
        Eigen::Vector3d earth_helio = store_->position(earth, sun, at, frame);
        Eigen::Vector3d moon_geo = store_->position(body, earth, at, frame);
        return earth_helio + moon_geo;
    }
    return store_->position(body, sun, at, frame);
}

Eigen::Vector3d PositionCalculator::heliocentric(const std::string& name,
                                                 const time::Instant& at,
                                                 ReferenceFrame frame) const {
    return heliocentric(store_->body(name), at, frame);
}

BodyState PositionCalculator::stateRelativeToCenter(const Body& body,
                                                    const time::Instant& at,
                                                    ReferenceFrame frame) const {
    const Body& center = (body.center_id == constants::naif::EARTH) ? store_->earth() : store_->sun();
    return store_->state(body, center, at, frame);
}

PositionMap PositionCalculator::positions(const std::vector<std::string>& bodies,
                                          const time::Instant& at,
                                          ReferenceFrame frame) const {
    time::validateWithinEphemeris(at, *store_);

    PositionMap result;
    for (const auto& name : bodies) {
        const Body* body = store_->findBody(name);
        if (!body) {
            std::cerr << "[PositionCalculator] Warning: unknown body '" << name << "', skipped\n";
            continue;
        }
        try {
            Eigen::Vector3d pos = heliocentric(*body, at, frame);
            if (!pos.allFinite()) {
                std::cerr << "[PositionCalculator] Warning: non-finite position for " << body->name << ", skipped\n";
                continue;
            }
            result[body->name] = pos;
        } catch (const std::exception& e) {
            std::cerr << "[PositionCalculator] Warning: failed to compute " << body->name
                      << " at " << time::formatUtc(at) << ": " << e.what() << "\n";
        }
    }

    if (verbose_) {
        std::cout << "[PositionCalculator] " << result.size() << "/" << bodies.size()
                  << " positions at " << time::formatUtc(at) << "\n";
    }
    return result;
}

} // namespace solartrack::ephemeris
