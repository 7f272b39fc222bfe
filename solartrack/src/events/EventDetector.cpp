/**
 * @file EventDetector.cpp
 * @brief Implementation of EventDetector
 */

#include "solartrack/events/EventDetector.hpp"
#include "solartrack/core/Constants.hpp"
#include "solartrack/events/ExtremumSearch.hpp"
#include "solartrack/time/TimeUtils.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace solartrack::events {

using constants::RAD_TO_DEG;

std::string eventKindName(EventKind kind) {
    switch (kind) {
        case EventKind::InferiorConjunction: return "Inferior Conjunction";
        case EventKind::SuperiorConjunction: return "Superior Conjunction";
        case EventKind::Opposition: return "Opposition";
    }
    return "Unknown";
}

EventDetector::EventDetector(std::shared_ptr<const ephemeris::EphemerisStore> store,
                             EventDetectorOptions options,
                             bool verbose)
    : calculator_(std::move(store), verbose), options_(options), verbose_(verbose)
{
    if (!(options_.approximate_threshold_deg > 0.0) || !(options_.approximate_threshold_deg < 90.0) ||
        !(options_.precise_threshold_deg > 0.0) || !(options_.precise_threshold_deg < 90.0)) {
        throw std::invalid_argument("Event thresholds must lie in (0, 90) degrees");
    }
    if (!(options_.step_days >= constants::MIN_SEARCH_STEP_DAYS)) {
        throw std::invalid_argument("Event search step must be at least " +
                                    std::to_string(constants::MIN_SEARCH_STEP_DAYS) + " day");
    }
    if (!(options_.time_tolerance_days > 0.0)) {
        throw std::invalid_argument("Event search tolerance must be positive");
    }
}

double EventDetector::elongation(const ephemeris::Body& body, const time::Instant& at) const {
    const auto& store = calculator_.store();
    Eigen::Vector3d earth = calculator_.heliocentric(store.earth(), at);
    Eigen::Vector3d target = calculator_.heliocentric(body, at);

    Eigen::Vector3d to_sun = -earth;
    Eigen::Vector3d to_body = target - earth;
    // atan2 keeps precision near 0 and 180 degrees where acos does not
    return std::atan2(to_sun.cross(to_body).norm(), to_sun.dot(to_body)) * RAD_TO_DEG;
}

const ephemeris::Body* EventDetector::eligible(const std::string& name) const {
    const auto& store = calculator_.store();
    const ephemeris::Body* body = store.findBody(name);
    if (!body) return nullptr;
    if (body->naif_id == store.earth().naif_id ||
        body->naif_id == store.moon().naif_id ||
        body->naif_id == store.sun().naif_id) {
        return nullptr;
    }
    return body;
}

std::optional<EventKind> EventDetector::classify(const ephemeris::Body& body,
                                                 const time::Instant& at,
                                                 double elongation_deg,
                                                 double threshold_deg) const {
    const bool near_sun = elongation_deg <= threshold_deg;
    const bool opposite_sun = elongation_deg >= 180.0 - threshold_deg;
    if (!near_sun && !opposite_sun) return std::nullopt;

    const auto& store = calculator_.store();
    Eigen::Vector3d earth = calculator_.heliocentric(store.earth(), at);
    Eigen::Vector3d target = calculator_.heliocentric(body, at);
    const double earth_sun = earth.norm();

    if (near_sun) {
        const double earth_body = (target - earth).norm();
        return earth_body < earth_sun ? EventKind::InferiorConjunction : EventKind::SuperiorConjunction;
    }
    return target.norm() > earth_sun ? EventKind::Opposition : EventKind::SuperiorConjunction;
}

std::vector<Event> EventDetector::checkAt(const std::vector<std::string>& bodies,
                                          const time::Instant& at) const {
    std::vector<Event> events;
    if (!calculator_.store().supportedInterval().contains(at)) {
        if (verbose_) {
            std::cout << "[EventDetector] " << time::formatUtc(at) << " outside ephemeris range, no events\n";
        }
        return events;
    }

    for (const auto& name : bodies) {
        const ephemeris::Body* body = eligible(name);
        if (!body) continue;
        try {
            const double elong = elongation(*body, at);
            if (auto kind = classify(*body, at, elong, options_.approximate_threshold_deg)) {
                events.push_back(Event{body->name, *kind, std::nullopt, elong});
            }
        } catch (const std::exception& e) {
            std::cerr << "[EventDetector] Warning: " << body->name << " skipped: " << e.what() << "\n";
        }
    }
    return events;
}

void EventDetector::searchBody(const ephemeris::Body& body,
                               const time::Instant& start,
                               const time::Instant& end,
                               std::vector<Event>& out) const {
    std::vector<time::Instant> grid;
    for (time::Instant t = start; t < end;) {
        grid.push_back(t);
        const time::Instant next = t.plusDays(options_.step_days);
        if (!(t < next)) {
            throw std::runtime_error("Search step does not advance past " + time::formatUtc(t));
        }
        t = next;
    }
    grid.push_back(end);
    if (grid.size() < 3) return;

    std::vector<double> elong(grid.size());
    for (std::size_t i = 0; i < grid.size(); ++i) {
        elong[i] = elongation(body, grid[i]);
    }

    const double threshold = options_.precise_threshold_deg;
    for (std::size_t i = 1; i + 1 < grid.size(); ++i) {
        const bool is_min = elong[i] <= elong[i - 1] && elong[i] < elong[i + 1];
        const bool is_max = elong[i] >= elong[i - 1] && elong[i] > elong[i + 1];
        if (!is_min && !is_max) continue;

        // Offsets from grid[i - 1] keep the argument small
        const time::Instant base = grid[i - 1];
        const double span = base.daysUntil(grid[i + 1]);
        auto f = [this, &body, &base](double dt) { return elongation(body, base.plusDays(dt)); };

        ExtremumResult r = is_min ? brentMinimize(f, 0.0, span, options_.time_tolerance_days)
                                  : brentMaximize(f, 0.0, span, options_.time_tolerance_days);
        const time::Instant when = base.plusDays(r.x);

        const bool qualifies = is_min ? r.value <= threshold : r.value >= 180.0 - threshold;
        if (!qualifies) continue;
        if (auto kind = classify(body, when, r.value, threshold)) {
            out.push_back(Event{body.name, *kind, when, r.value});
            if (verbose_) {
                std::cout << "[EventDetector] " << body.name << " " << eventKindName(*kind) << " at "
                          << time::formatUtc(when) << " (elongation " << r.value << " deg)\n";
            }
        }
    }
}

std::vector<Event> EventDetector::search(const std::vector<std::string>& bodies,
                                         const time::Instant& start,
                                         const time::Instant& end) const {
    std::vector<Event> events;

    const time::TimeInterval& supported = calculator_.store().supportedInterval();
    const time::Instant t0 = std::max(start, supported.start);
    const time::Instant t1 = std::min(end, supported.end);
    if (!(t0 < t1)) {
        if (verbose_) {
            std::cout << "[EventDetector] Search window outside ephemeris range, no events\n";
        }
        return events;
    }

    const double points = t0.daysUntil(t1) / options_.step_days + 2.0;
    if (points > static_cast<double>(constants::MAX_SEARCH_GRID_POINTS)) {
        throw std::invalid_argument("Search over " + std::to_string(t0.daysUntil(t1)) + " days at a " +
                                    std::to_string(options_.step_days) + " day step exceeds " +
                                    std::to_string(constants::MAX_SEARCH_GRID_POINTS) + " samples");
    }

    for (const auto& name : bodies) {
        const ephemeris::Body* body = eligible(name);
        if (!body) continue;
        std::vector<Event> found;
        try {
            searchBody(*body, t0, t1, found);
        } catch (const std::exception& e) {
            std::cerr << "[EventDetector] Warning: search for " << body->name << " failed: " << e.what() << "\n";
            continue;
        }
        events.insert(events.end(), found.begin(), found.end());
    }

    std::stable_sort(events.begin(), events.end(),
                     [](const Event& a, const Event& b) { return *a.time < *b.time; });
    return events;
}

} // namespace solartrack::events
