/**
 * @file EphemerisStore.cpp
 * @brief Implementation of the Ephemeris Store
 */

#include "solartrack/ephemeris/EphemerisStore.hpp"
#include "solartrack/ephemeris/SPKEphemerisSource.hpp"
#include "solartrack/core/Constants.hpp"
#include "solartrack/core/Errors.hpp"
#include "solartrack/time/TimeUtils.hpp"
#include "solartrack/utils/StringUtils.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <limits>

namespace solartrack::ephemeris {

using namespace solartrack::constants;

namespace {

struct BodyCandidate {
    const char* name;
    std::vector<int> naif_ids;   // preferred first (body center, then system barycenter)
    int center_id;
    const char* center_name;
    double gm_km3s2;
    bool required;
};

// Ordered as presented to callers
const std::vector<BodyCandidate>& candidates() {
    static const std::vector<BodyCandidate> table = {
        {"Sun",     {naif::SUN},                                  naif::SUN,   "Sun",   GM_SUN_KM3S2,         true},
        {"Mercury", {naif::MERCURY, naif::MERCURY_BARYCENTER},    naif::SUN,   "Sun",   GM_MERCURY_KM3S2,     false},
        {"Venus",   {naif::VENUS, naif::VENUS_BARYCENTER},        naif::SUN,   "Sun",   GM_VENUS_KM3S2,       false},
        {"Earth",   {naif::EARTH},                                naif::SUN,   "Sun",   GM_EARTH_KM3S2,       true},
        {"Moon",    {naif::MOON},                                 naif::EARTH, "Earth", GM_MOON_KM3S2,        true},
        {"Mars",    {naif::MARS, naif::MARS_BARYCENTER},          naif::SUN,   "Sun",   GM_MARS_SYS_KM3S2,    false},
        {"Jupiter", {naif::JUPITER_BARYCENTER},                   naif::SUN,   "Sun",   GM_JUPITER_SYS_KM3S2, false},
        {"Saturn",  {naif::SATURN_BARYCENTER},                    naif::SUN,   "Sun",   GM_SATURN_SYS_KM3S2,  false},
        {"Uranus",  {naif::URANUS_BARYCENTER},                    naif::SUN,   "Sun",   GM_URANUS_SYS_KM3S2,  false},
        {"Neptune", {naif::NEPTUNE_BARYCENTER},                   naif::SUN,   "Sun",   GM_NEPTUNE_SYS_KM3S2, false},
        {"Pluto",   {naif::PLUTO_BARYCENTER},                     naif::SUN,   "Sun",   GM_PLUTO_SYS_KM3S2,   false},
    };
    return table;
}

} // namespace

std::shared_ptr<const EphemerisStore> EphemerisStore::load(const std::string& bsp_file,
                                                           double margin_days,
                                                           bool verbose) {
    if (!std::filesystem::exists(bsp_file)) {
        throw EphemerisLoadError("Ephemeris file not found: " + bsp_file);
    }

    std::shared_ptr<const EphemerisSource> source;
    try {
        source = std::make_shared<SPKEphemerisSource>(bsp_file);
    } catch (const std::exception& e) {
        throw EphemerisLoadError("Failed to load ephemeris '" + bsp_file + "': " + e.what());
    }

    auto store = std::make_shared<const EphemerisStore>(std::move(source), margin_days);
    if (verbose) {
        std::cout << "[EphemerisStore] " << store->describe() << "\n";
    }
    return store;
}

EphemerisStore::EphemerisStore(std::shared_ptr<const EphemerisSource> source, double margin_days)
    : source_(std::move(source))
{
    if (!source_) {
        throw EphemerisLoadError("No ephemeris source supplied");
    }
    if (margin_days < 0.0) {
        throw EphemerisLoadError("Ephemeris safety margin must be non-negative");
    }
    bindBodies();
    computeSupportedInterval(margin_days);
}

void EphemerisStore::bindBodies() {
    for (const auto& candidate : candidates()) {
        int bound_id = -1;
        for (int id : candidate.naif_ids) {
            if (source_->getCoverage(id)) {
                bound_id = id;
                break;
            }
        }

        if (bound_id < 0) {
            if (candidate.required) {
                throw EphemerisLoadError("Ephemeris " + source_->getName() + " lacks required body " +
                                         candidate.name + " (NAIF " + std::to_string(candidate.naif_ids.front()) + ")");
            }
            continue;
        }

        Body body;
        body.name = candidate.name;
        body.naif_id = bound_id;
        body.center_id = candidate.center_id;
        body.center_name = candidate.center_name;
        body.gm = gmToAuDay(candidate.gm_km3s2);

        index_[utils::toLower(body.name)] = bodies_.size();
        bodies_.push_back(body);
    }
}

void EphemerisStore::computeSupportedInterval(double margin_days) {
    double start_et = -std::numeric_limits<double>::infinity();
    double end_et = std::numeric_limits<double>::infinity();

    for (const char* name : {"Sun", "Earth", "Moon"}) {
        auto window = source_->getCoverage(body(name).naif_id);
        start_et = std::max(start_et, window->start_et);
        end_et = std::min(end_et, window->end_et);
    }

    const double margin_sec = margin_days * SECONDS_PER_DAY;
    start_et += margin_sec;
    end_et -= margin_sec;
    if (!(end_et > start_et)) {
        throw EphemerisLoadError("Ephemeris " + source_->getName() +
                                 " covers no usable interval after the safety margin");
    }

    supported_.start = time::Instant::fromEphemerisTime(start_et);
    supported_.end = time::Instant::fromEphemerisTime(end_et);
}

const Body* EphemerisStore::findBody(const std::string& name) const {
    auto it = index_.find(utils::toLower(utils::trim(name)));
    return it == index_.end() ? nullptr : &bodies_[it->second];
}

const Body& EphemerisStore::body(const std::string& name) const {
    const Body* b = findBody(name);
    if (!b) throw UnknownBodyError(name);
    return *b;
}

std::vector<std::string> EphemerisStore::bodyNames() const {
    std::vector<std::string> names;
    names.reserve(bodies_.size());
    for (const auto& b : bodies_) names.push_back(b.name);
    return names;
}

BodyState EphemerisStore::state(const Body& target, const Body& observer, const time::Instant& at,
                                ReferenceFrame frame) const {
    Eigen::VectorXd raw = source_->getState(target.naif_id, observer.naif_id, at.ephemerisTime());

    // km -> AU, km/s -> AU/day
    const double vel_scale = SECONDS_PER_DAY / KM_PER_AU;
    Eigen::Vector3d pos_eq = raw.head<3>() / KM_PER_AU;
    Eigen::Vector3d vel_eq = raw.tail<3>() * vel_scale;

    return BodyState{toFrame(pos_eq, frame), toFrame(vel_eq, frame)};
}

Eigen::Vector3d EphemerisStore::position(const Body& target, const Body& observer, const time::Instant& at,
                                         ReferenceFrame frame) const {
    return state(target, observer, at, frame).position;
}

std::string EphemerisStore::describe() const {
    return source_->getName() + ", bodies: " + utils::join(bodyNames(), ", ") +
           ", supported " + time::formatUtc(supported_.start) + " to " + time::formatUtc(supported_.end);
}

} // namespace solartrack::ephemeris
