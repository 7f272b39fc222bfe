/**
 * @file ExtremumSearch.hpp
 * @brief One-dimensional bracketed minimisation (Brent's method)
 * @author SolarTrack Team
 */

#ifndef SOLARTRACK_EVENTS_EXTREMUM_SEARCH_HPP
#define SOLARTRACK_EVENTS_EXTREMUM_SEARCH_HPP

#include <functional>

namespace solartrack::events {

struct ExtremumResult {
    double x = 0.0;        ///< Abscissa of the extremum
    double value = 0.0;    ///< f(x)
    int iterations = 0;
    bool converged = false;
};

/**
 * @brief Minimise f on [lower, upper]
 *
 * Golden-section steps combined with parabolic interpolation. The interval
 * must bracket a single minimum; the returned x always lies inside it.
 *
 * @param tolerance Absolute tolerance on x
 */
ExtremumResult brentMinimize(const std::function<double(double)>& f,
                             double lower,
                             double upper,
                             double tolerance = 1e-6,
                             int max_iterations = 100);

/// Maximise f on [lower, upper] by minimising -f
ExtremumResult brentMaximize(const std::function<double(double)>& f,
                             double lower,
                             double upper,
                             double tolerance = 1e-6,
                             int max_iterations = 100);

} // namespace solartrack::events

#endif // SOLARTRACK_EVENTS_EXTREMUM_SEARCH_HPP
