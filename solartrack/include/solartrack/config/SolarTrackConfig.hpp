// SolarTrackConfig.hpp
// Runtime settings for the SolarTrack driver, read from and written to JSON.

#ifndef SOLARTRACK_CONFIG_SOLARTRACKCONFIG_HPP
#define SOLARTRACK_CONFIG_SOLARTRACKCONFIG_HPP

#include "solartrack/core/Constants.hpp"
#include "solartrack/ephemeris/ReferenceFrame.hpp"
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace solartrack {
namespace config {

/**
 * @brief Settings shared by the core components.
 *
 * Every field has a default; a JSON file only needs the keys it changes.
 */
struct SolarTrackConfig {
    std::string ephemeris_file = "de440s.bsp";
    double ephemeris_margin_days = 0.5;

    ephemeris::ReferenceFrame frame = ephemeris::ReferenceFrame::ECLIPTIC_J2000;

    // Orbit sampling
    int orbit_sample_count = 500;
    int orbit_cache_capacity = 64;     // 0 disables the cache

    // Event detection
    double approximate_threshold_deg = 5.0;
    double precise_threshold_deg = 10.0;
    double search_step_days = 0.5;

    // Bodies shown when a command names none
    std::vector<std::string> bodies = {"Mercury", "Venus", "Earth", "Moon", "Mars",
                                       "Jupiter", "Saturn", "Uranus", "Neptune"};

    bool verbose = false;
};

namespace detail {

inline void requirePositive(double value, const char* key) {
    if (!(value > 0.0)) {
        throw std::invalid_argument(std::string("Config key '") + key + "' must be positive");
    }
}

} // namespace detail

/**
 * @brief Build a configuration from parsed JSON
 * @throws std::invalid_argument on an unknown frame or out-of-range value
 * @throws nlohmann::json::exception on a value of the wrong JSON type
 */
inline SolarTrackConfig configFromJson(const nlohmann::json& j) {
    SolarTrackConfig config;
    if (!j.is_object()) {
        throw std::invalid_argument("Configuration must be a JSON object");
    }

    config.ephemeris_file = j.value("ephemeris_file", config.ephemeris_file);
    config.ephemeris_margin_days = j.value("ephemeris_margin_days", config.ephemeris_margin_days);
    if (j.contains("frame")) {
        config.frame = ephemeris::frameFromName(j["frame"].get<std::string>());
    }

    config.orbit_sample_count = j.value("orbit_sample_count", config.orbit_sample_count);
    config.orbit_cache_capacity = j.value("orbit_cache_capacity", config.orbit_cache_capacity);

    config.approximate_threshold_deg = j.value("approximate_threshold_deg", config.approximate_threshold_deg);
    config.precise_threshold_deg = j.value("precise_threshold_deg", config.precise_threshold_deg);
    config.search_step_days = j.value("search_step_days", config.search_step_days);

    if (j.contains("bodies")) {
        config.bodies = j["bodies"].get<std::vector<std::string>>();
    }
    config.verbose = j.value("verbose", config.verbose);

    // Validation
    if (config.ephemeris_file.empty()) {
        throw std::invalid_argument("Config key 'ephemeris_file' must not be empty");
    }
    if (config.ephemeris_margin_days < 0.0) {
        throw std::invalid_argument("Config key 'ephemeris_margin_days' must not be negative");
    }
    if (config.orbit_sample_count < 2) {
        throw std::invalid_argument("Config key 'orbit_sample_count' must be at least 2");
    }
    if (config.orbit_cache_capacity < 0) {
        throw std::invalid_argument("Config key 'orbit_cache_capacity' must not be negative");
    }
    detail::requirePositive(config.approximate_threshold_deg, "approximate_threshold_deg");
    detail::requirePositive(config.precise_threshold_deg, "precise_threshold_deg");
    detail::requirePositive(config.search_step_days, "search_step_days");
    if (config.search_step_days < constants::MIN_SEARCH_STEP_DAYS) {
        throw std::invalid_argument("Config key 'search_step_days' must be at least " +
                                    std::to_string(constants::MIN_SEARCH_STEP_DAYS) + " day");
    }
    if (config.approximate_threshold_deg >= 90.0 || config.precise_threshold_deg >= 90.0) {
        throw std::invalid_argument("Event thresholds must be below 90 degrees");
    }

    return config;
}

inline nlohmann::json configToJson(const SolarTrackConfig& config) {
    nlohmann::json j;
    j["ephemeris_file"] = config.ephemeris_file;
    j["ephemeris_margin_days"] = config.ephemeris_margin_days;
    j["frame"] = ephemeris::frameName(config.frame);
    j["orbit_sample_count"] = config.orbit_sample_count;
    j["orbit_cache_capacity"] = config.orbit_cache_capacity;
    j["approximate_threshold_deg"] = config.approximate_threshold_deg;
    j["precise_threshold_deg"] = config.precise_threshold_deg;
    j["search_step_days"] = config.search_step_days;
    j["bodies"] = config.bodies;
    j["verbose"] = config.verbose;
    return j;
}

// JSON file loader
inline SolarTrackConfig loadConfig(const std::string& config_file) {
    std::ifstream f(config_file);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + config_file);
    }

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Malformed config file " + config_file + ": " + e.what());
    }
    return configFromJson(j);
}

inline void saveConfig(const SolarTrackConfig& config, const std::string& config_file) {
    std::ofstream f(config_file);
    if (!f.is_open()) {
        throw std::runtime_error("Could not write config file: " + config_file);
    }
    f << configToJson(config).dump(4) << "\n";
}

} // namespace config
} // namespace solartrack

#endif // SOLARTRACK_CONFIG_SOLARTRACKCONFIG_HPP
