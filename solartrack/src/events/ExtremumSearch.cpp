/**
 * @file ExtremumSearch.cpp
 * @brief Brent minimisation
 */

#include "solartrack/events/ExtremumSearch.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace solartrack::events {

namespace {
constexpr double CGOLD = 0.381966011250105;  // (3 - sqrt(5)) / 2
}

ExtremumResult brentMinimize(const std::function<double(double)>& f,
                             double lower,
                             double upper,
                             double tolerance,
                             int max_iterations) {
    if (!(upper > lower)) {
        throw std::invalid_argument("brentMinimize: empty bracket");
    }
    if (!(tolerance > 0.0)) {
        throw std::invalid_argument("brentMinimize: tolerance must be positive");
    }

    double a = lower;
    double b = upper;
    double x = a + CGOLD * (b - a);
    double w = x;
    double v = x;
    double fx = f(x);
    double fw = fx;
    double fv = fx;
    double d = 0.0;
    double e = 0.0;

    ExtremumResult result;
    for (int iter = 0; iter < max_iterations; ++iter) {
        const double xm = 0.5 * (a + b);
        const double tol1 = tolerance;
        const double tol2 = 2.0 * tol1;

        result.iterations = iter;
        if (std::abs(x - xm) <= tol2 - 0.5 * (b - a)) {
            result.converged = true;
            break;
        }

        bool golden = true;
        if (std::abs(e) > tol1) {
            // Parabola through x, w, v
            double r = (x - w) * (fx - fv);
            double q = (x - v) * (fx - fw);
            double p = (x - v) * q - (x - w) * r;
            q = 2.0 * (q - r);
            if (q > 0.0) p = -p;
            q = std::abs(q);
            const double e_prev = e;
            e = d;

            if (std::abs(p) < std::abs(0.5 * q * e_prev) && p > q * (a - x) && p < q * (b - x)) {
                d = p / q;
                const double u = x + d;
                if (u - a < tol2 || b - u < tol2) {
                    d = std::copysign(tol1, xm - x);
                }
                golden = false;
            }
        }
        if (golden) {
            e = (x >= xm) ? a - x : b - x;
            d = CGOLD * e;
        }

        const double u = (std::abs(d) >= tol1) ? x + d : x + std::copysign(tol1, d);
        const double fu = f(u);

        if (fu <= fx) {
            if (u >= x) a = x; else b = x;
            v = w; fv = fw;
            w = x; fw = fx;
            x = u; fx = fu;
        } else {
            if (u < x) a = u; else b = u;
            if (fu <= fw || w == x) {
                v = w; fv = fw;
                w = u; fw = fu;
            } else if (fu <= fv || v == x || v == w) {
                v = u; fv = fu;
            }
        }
    }

    result.x = std::clamp(x, lower, upper);
    result.value = fx;
    return result;
}

ExtremumResult brentMaximize(const std::function<double(double)>& f,
                             double lower,
                             double upper,
                             double tolerance,
                             int max_iterations) {
    ExtremumResult r = brentMinimize([&f](double x) { return -f(x); },
                                     lower, upper, tolerance, max_iterations);
    r.value = -r.value;
    return r;
}

} // namespace solartrack::events
