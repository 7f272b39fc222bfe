/**
 * @file EventDetector.hpp
 * @brief Conjunction and opposition detection from Sun-Earth-body geometry
 * @author SolarTrack Team
 *
 * Elongation is the angle at Earth between the directions to the Sun and to
 * a body. Small elongation means conjunction: inferior when the body is
 * nearer to Earth than the Sun is, superior otherwise. Elongation near 180
 * degrees means opposition for a body farther from the Sun than Earth; an
 * inner body at that geometry is classified as superior conjunction.
 *
 * Two modes share this classification:
 *  - checkAt: threshold test at a single instant, no time reported
 *  - search: extrema of elongation over an interval, located by sampling at
 *    a fixed step and refined with Brent's method
 *
 * Earth, the Moon and the Sun are never reported.
 */

#ifndef SOLARTRACK_EVENTS_EVENT_DETECTOR_HPP
#define SOLARTRACK_EVENTS_EVENT_DETECTOR_HPP

#include "solartrack/ephemeris/PositionCalculator.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace solartrack::events {

enum class EventKind {
    InferiorConjunction,
    SuperiorConjunction,
    Opposition
};

/// "Inferior Conjunction", "Superior Conjunction", "Opposition"
std::string eventKindName(EventKind kind);

struct Event {
    std::string body;
    EventKind kind;
    std::optional<time::Instant> time;   ///< Set by search only
    double elongation_deg;
};

struct EventDetectorOptions {
    double approximate_threshold_deg = 5.0;
    double precise_threshold_deg = 10.0;
    double step_days = 0.5;               ///< At least MIN_SEARCH_STEP_DAYS
    double time_tolerance_days = 1e-5;    ///< Brent tolerance (~1 s)
};

class EventDetector {
public:
    explicit EventDetector(std::shared_ptr<const ephemeris::EphemerisStore> store,
                           EventDetectorOptions options = EventDetectorOptions(),
                           bool verbose = false);

    /// Sun-Earth-body angle [deg], in [0, 180]
    double elongation(const ephemeris::Body& body, const time::Instant& at) const;

    /**
     * @brief Threshold test at one instant
     *
     * Returns no events if at is outside the supported interval.
     */
    std::vector<Event> checkAt(const std::vector<std::string>& bodies, const time::Instant& at) const;

    /**
     * @brief Timed events in [start, end], sorted by time
     *
     * The interval is clamped to the supported ephemeris interval; an
     * interval with no overlap yields no events.
     *
     * @throws std::invalid_argument if the clamped interval needs more than
     *         MAX_SEARCH_GRID_POINTS samples at the configured step
     */
    std::vector<Event> search(const std::vector<std::string>& bodies,
                              const time::Instant& start,
                              const time::Instant& end) const;

    const EventDetectorOptions& options() const { return options_; }

private:
    ephemeris::PositionCalculator calculator_;
    EventDetectorOptions options_;
    bool verbose_;

    /// nullptr for unknown bodies and for Earth, Moon and Sun
    const ephemeris::Body* eligible(const std::string& name) const;

    std::optional<EventKind> classify(const ephemeris::Body& body,
                                      const time::Instant& at,
                                      double elongation_deg,
                                      double threshold_deg) const;

    void searchBody(const ephemeris::Body& body,
                    const time::Instant& start,
                    const time::Instant& end,
                    std::vector<Event>& out) const;
};

} // namespace solartrack::events

#endif // SOLARTRACK_EVENTS_EVENT_DETECTOR_HPP
