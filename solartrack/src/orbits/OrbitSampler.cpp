/**
 * @file OrbitSampler.cpp
 * @brief Implementation of OrbitSampler
 */

#include "solartrack/orbits/OrbitSampler.hpp"
#include "solartrack/core/Errors.hpp"
#include "solartrack/time/TimeUtils.hpp"
#include "solartrack/utils/StringUtils.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace solartrack::orbits {

int parseSampleCount(const std::string& text) {
    const std::string trimmed = utils::trim(text);
    int count = 0;
    std::size_t used = 0;
    try {
        count = std::stoi(trimmed, &used);
    } catch (const std::logic_error&) {
        throw InvalidSampleCountError(text);
    }
    if (trimmed.empty() || used != trimmed.size()) {
        throw InvalidSampleCountError(text);
    }
    if (count <= 1) {
        throw InvalidSampleCountError(count);
    }
    return count;
}

OrbitSampler::OrbitSampler(std::shared_ptr<const ephemeris::EphemerisStore> store,
                           std::size_t cache_capacity,
                           bool verbose)
    : calculator_(std::move(store), verbose), cache_(cache_capacity), verbose_(verbose) {}

OrbitPathPtr OrbitSampler::orbit(const std::string& body_name,
                                 const time::Instant& start,
                                 const time::Instant& end,
                                 int sample_count,
                                 ephemeris::ReferenceFrame frame) {
    if (sample_count <= 1) {
        throw InvalidSampleCountError(sample_count);
    }
    const auto& store = calculator_.store();
    const ephemeris::Body& body = store.body(body_name);

    const time::TimeInterval& supported = store.supportedInterval();
    const time::Instant t0 = std::max(start, supported.start);
    const time::Instant t1 = std::min(end, supported.end);

    auto path = std::make_shared<OrbitPath>();
    path->body = body.name;
    path->frame = frame;
    if (!(t0 < t1)) {
        return path;
    }

    OrbitCacheKey key{body.name, t0, t1, sample_count, frame};
    if (auto cached = cache_.get(key)) {
        return *cached;
    }

    path->epochs = time::linspace(t0, t1, sample_count);
    path->positions.reserve(path->epochs.size());
    for (const auto& t : path->epochs) {
        Eigen::Vector3d pos = calculator_.heliocentric(body, t, frame);
        if (!pos.allFinite()) {
            throw std::runtime_error("Non-finite position for " + body.name + " at " + time::formatUtc(t));
        }
        path->positions.push_back(pos);
    }

    if (verbose_) {
        std::cout << "[OrbitSampler] " << body.name << ": " << sample_count << " samples "
                  << time::formatUtcDate(t0) << " to " << time::formatUtcDate(t1) << "\n";
    }

    OrbitPathPtr result = std::move(path);
    cache_.put(key, result);
    return result;
}

OrbitSet OrbitSampler::orbits(const std::vector<std::string>& bodies,
                              const time::Instant& start,
                              const time::Instant& end,
                              int sample_count,
                              ephemeris::ReferenceFrame frame) {
    if (sample_count <= 1) {
        throw InvalidSampleCountError(sample_count);
    }

    OrbitSet set;
    for (const auto& name : bodies) {
        try {
            OrbitPathPtr path = orbit(name, start, end, sample_count, frame);
            if (!path->empty()) set[path->body] = std::move(path);
        } catch (const std::exception& e) {
            std::cerr << "[OrbitSampler] Warning: orbit of '" << name << "' skipped: " << e.what() << "\n";
        }
    }
    return set;
}

} // namespace solartrack::orbits
