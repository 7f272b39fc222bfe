/**
 * @file Errors.hpp
 * @brief Exception types reported by the SolarTrack core
 * @author SolarTrack Team
 *
 * Every failure the core reports to a caller is one of these types, so a
 * presentation layer can tell a bad date apart from a missing ephemeris
 * without parsing messages. Messages are written in domain terms.
 */

#ifndef SOLARTRACK_CORE_ERRORS_HPP
#define SOLARTRACK_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace solartrack {

/// Base of all SolarTrack errors
class SolarTrackError : public std::runtime_error {
public:
    explicit SolarTrackError(const std::string& what) : std::runtime_error(what) {}
};

/// Ephemeris file missing, corrupt, or lacking a required body (fatal at startup)
class EphemerisLoadError : public SolarTrackError {
public:
    explicit EphemerisLoadError(const std::string& what) : SolarTrackError(what) {}
};

/// Malformed or out-of-range date/time text
class InvalidFormatError : public SolarTrackError {
public:
    explicit InvalidFormatError(const std::string& what) : SolarTrackError(what) {}
};

/// Instant outside the interval the loaded ephemeris can answer
class OutOfEphemerisRangeError : public SolarTrackError {
public:
    explicit OutOfEphemerisRangeError(const std::string& what) : SolarTrackError(what) {}
};

/// Body name not bound in the Ephemeris Store
class UnknownBodyError : public SolarTrackError {
public:
    explicit UnknownBodyError(const std::string& name)
        : SolarTrackError("Unknown body: '" + name + "'"), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/// Orbit sampling requested with fewer than two samples, or with a non-integer count
class InvalidSampleCountError : public SolarTrackError {
public:
    explicit InvalidSampleCountError(int count)
        : SolarTrackError("Sample count must be at least 2 (got " + std::to_string(count) + ")"),
          count_(count) {}

    explicit InvalidSampleCountError(const std::string& text)
        : SolarTrackError("Sample count must be an integer (got '" + text + "')"),
          count_(0) {}

    int count() const { return count_; }

private:
    int count_;
};

} // namespace solartrack

#endif // SOLARTRACK_CORE_ERRORS_HPP
