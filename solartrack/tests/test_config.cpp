/**
 * @file test_config.cpp
 * @brief Unit tests for the JSON configuration loader
 */

#include <gtest/gtest.h>
#include "solartrack/config/SolarTrackConfig.hpp"
#include <cstdio>
#include <fstream>

using namespace solartrack;
using namespace solartrack::config;
using nlohmann::json;

namespace {

json withKey(const std::string& key, json value) {
    json j = json::object();
    j[key] = std::move(value);
    return j;
}

} // namespace

TEST(ConfigTest, DefaultsWhenEmpty) {
    SolarTrackConfig c = configFromJson(json::object());
    EXPECT_EQ(c.ephemeris_file, "de440s.bsp");
    EXPECT_DOUBLE_EQ(c.ephemeris_margin_days, 0.5);
    EXPECT_EQ(c.frame, ephemeris::ReferenceFrame::ECLIPTIC_J2000);
    EXPECT_EQ(c.orbit_sample_count, 500);
    EXPECT_EQ(c.orbit_cache_capacity, 64);
    EXPECT_DOUBLE_EQ(c.approximate_threshold_deg, 5.0);
    EXPECT_DOUBLE_EQ(c.precise_threshold_deg, 10.0);
    EXPECT_DOUBLE_EQ(c.search_step_days, 0.5);
    EXPECT_EQ(c.bodies.size(), 9u);
    EXPECT_FALSE(c.verbose);
}

TEST(ConfigTest, ParsesAllKeys) {
    json j = json::parse(R"({
        "ephemeris_file": "/data/de440.bsp",
        "ephemeris_margin_days": 2.0,
        "frame": "Equatorial",
        "orbit_sample_count": 120,
        "orbit_cache_capacity": 0,
        "approximate_threshold_deg": 3.5,
        "precise_threshold_deg": 8.0,
        "search_step_days": 0.25,
        "bodies": ["Mars", "Jupiter"],
        "verbose": true
    })");
    SolarTrackConfig c = configFromJson(j);
    EXPECT_EQ(c.ephemeris_file, "/data/de440.bsp");
    EXPECT_DOUBLE_EQ(c.ephemeris_margin_days, 2.0);
    EXPECT_EQ(c.frame, ephemeris::ReferenceFrame::EQUATORIAL_J2000);
    EXPECT_EQ(c.orbit_sample_count, 120);
    EXPECT_EQ(c.orbit_cache_capacity, 0);
    EXPECT_DOUBLE_EQ(c.approximate_threshold_deg, 3.5);
    EXPECT_DOUBLE_EQ(c.precise_threshold_deg, 8.0);
    EXPECT_DOUBLE_EQ(c.search_step_days, 0.25);
    EXPECT_EQ(c.bodies, (std::vector<std::string>{"Mars", "Jupiter"}));
    EXPECT_TRUE(c.verbose);
}

TEST(ConfigTest, RejectsOutOfRangeValues) {
    EXPECT_THROW(configFromJson(json::array()), std::invalid_argument);
    EXPECT_THROW(configFromJson(withKey("ephemeris_file", "")), std::invalid_argument);
    EXPECT_THROW(configFromJson(withKey("ephemeris_margin_days", -1.0)), std::invalid_argument);
    EXPECT_THROW(configFromJson(withKey("orbit_sample_count", 1)), std::invalid_argument);
    EXPECT_THROW(configFromJson(withKey("orbit_cache_capacity", -5)), std::invalid_argument);
    EXPECT_THROW(configFromJson(withKey("approximate_threshold_deg", 0.0)), std::invalid_argument);
    EXPECT_THROW(configFromJson(withKey("precise_threshold_deg", 95.0)), std::invalid_argument);
    EXPECT_THROW(configFromJson(withKey("search_step_days", -0.5)), std::invalid_argument);
    EXPECT_THROW(configFromJson(withKey("search_step_days", 1e-17)), std::invalid_argument);
    EXPECT_THROW(configFromJson(withKey("search_step_days", 1e-7)), std::invalid_argument);
    EXPECT_THROW(configFromJson(withKey("frame", "galactic")), std::invalid_argument);
}

TEST(ConfigTest, WrongJsonTypeThrows) {
    EXPECT_THROW(configFromJson(withKey("orbit_sample_count", "many")), json::exception);
}

TEST(ConfigTest, SaveThenLoadPreservesSettings) {
    SolarTrackConfig c;
    c.ephemeris_file = "de430.bsp";
    c.frame = ephemeris::ReferenceFrame::EQUATORIAL_J2000;
    c.orbit_sample_count = 42;
    c.bodies = {"Venus"};
    c.verbose = true;

    std::string path = ::testing::TempDir() + "solartrack_config_test.json";
    saveConfig(c, path);
    SolarTrackConfig loaded = loadConfig(path);
    std::remove(path.c_str());

    EXPECT_EQ(loaded.ephemeris_file, "de430.bsp");
    EXPECT_EQ(loaded.frame, ephemeris::ReferenceFrame::EQUATORIAL_J2000);
    EXPECT_EQ(loaded.orbit_sample_count, 42);
    EXPECT_EQ(loaded.bodies, (std::vector<std::string>{"Venus"}));
    EXPECT_TRUE(loaded.verbose);
    EXPECT_DOUBLE_EQ(loaded.precise_threshold_deg, c.precise_threshold_deg);
}

TEST(ConfigTest, LoadErrors) {
    EXPECT_THROW(loadConfig("/nonexistent/solartrack.json"), std::runtime_error);

    std::string path = ::testing::TempDir() + "solartrack_bad_config.json";
    {
        std::ofstream f(path);
        f << "{ \"frame\": ";
    }
    EXPECT_THROW(loadConfig(path), std::invalid_argument);
    std::remove(path.c_str());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
