/**
 * @file test_spk_reader.cpp
 * @brief Unit tests for SPKReader against synthetic DAF kernels
 */

#include <gtest/gtest.h>
#include "solartrack/io/SPKReader.hpp"
#include "SyntheticSpk.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <string>

using namespace solartrack;
using namespace solartrack::testing;

class SPKReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        start_et = -1.0e8;
        end_et = 1.0e8;
        segments = minimalSolarSystem(start_et, end_et);
        path = ::testing::TempDir() + "solartrack_spk_reader_test.bsp";
        writeSyntheticSpk(path, segments);
    }

    void TearDown() override {
        std::remove(path.c_str());
    }

    const LinearSegment& segment(int body) const {
        for (const auto& s : segments) {
            if (s.body == body) return s;
        }
        throw std::runtime_error("no segment");
    }

    double start_et;
    double end_et;
    std::vector<LinearSegment> segments;
    std::string path;
};

TEST_F(SPKReaderTest, OpensAndIndexesSegments) {
    io::SPKReader reader(path);
    EXPECT_TRUE(reader.isOpen());
    EXPECT_EQ(reader.segmentCount(), segments.size());

    auto ids = reader.bodies();
    EXPECT_EQ(ids, (std::vector<int>{3, 4, 10, 301, 399}));
    EXPECT_TRUE(reader.hasBody(399));
    EXPECT_FALSE(reader.hasBody(599));
    // The barycenter is only ever a center
    EXPECT_FALSE(reader.hasBody(0));
}

TEST_F(SPKReaderTest, Type2PositionAndVelocity) {
    io::SPKReader reader(path);
    const auto& emb = segment(3);

    for (double et : {start_et, -3.3e7, 0.0, 1.234567e7, end_et}) {
        Eigen::VectorXd s = reader.getState(3, et);
        Eigen::Vector3d expected = emb.position(et);
        for (int k = 0; k < 3; ++k) {
            EXPECT_NEAR(s[k], expected[k], 1e-6) << "et=" << et;
            EXPECT_NEAR(s[k + 3], emb.v[k], 1e-12) << "et=" << et;
        }
    }
}

TEST_F(SPKReaderTest, Type13HermiteIsExactForLinearMotion) {
    io::SPKReader reader(path);
    const auto& mars = segment(4);

    Eigen::VectorXd s = reader.getState(4, 4.2e7);
    Eigen::Vector3d expected = mars.position(4.2e7);
    for (int k = 0; k < 3; ++k) {
        EXPECT_NEAR(s[k], expected[k], 1e-4);
        EXPECT_NEAR(s[k + 3], mars.v[k], 1e-9);
    }
}

TEST_F(SPKReaderTest, RelativeStateResolvesCenterChains) {
    io::SPKReader reader(path);
    const double et = 2.5e7;

    // Earth wrt Sun = (EMB + Earth/EMB) - Sun
    Eigen::Vector3d expected = segment(3).position(et) + segment(399).position(et) - segment(10).position(et);
    Eigen::VectorXd s = reader.getStateRelativeTo(399, 10, et);
    for (int k = 0; k < 3; ++k) {
        EXPECT_NEAR(s[k], expected[k], 1e-5);
    }

    // Moon wrt Earth shares the EMB link
    Eigen::Vector3d moon_geo = segment(301).position(et) - segment(399).position(et);
    Eigen::VectorXd m = reader.getStateRelativeTo(301, 399, et);
    for (int k = 0; k < 3; ++k) {
        EXPECT_NEAR(m[k], moon_geo[k], 1e-6);
    }

    EXPECT_DOUBLE_EQ(reader.getStateRelativeTo(10, 10, et).norm(), 0.0);
}

TEST_F(SPKReaderTest, CoverageIntersectsChain) {
    io::SPKReader reader(path);
    auto cov = reader.coverage(399);
    ASSERT_TRUE(cov.has_value());
    EXPECT_DOUBLE_EQ(cov->start_et, start_et);
    EXPECT_DOUBLE_EQ(cov->end_et, end_et);
    EXPECT_FALSE(reader.coverage(12345).has_value());
}

TEST_F(SPKReaderTest, OutOfCoverageThrows) {
    io::SPKReader reader(path);
    EXPECT_THROW(reader.getState(3, end_et + 1000.0), std::runtime_error);
    EXPECT_THROW(reader.getState(599, 0.0), std::runtime_error);
}

TEST_F(SPKReaderTest, ReadsOppositeByteOrder) {
    std::string swapped = ::testing::TempDir() + "solartrack_spk_swapped.bsp";
    writeSyntheticSpk(swapped, segments, true);

    io::SPKReader reader(swapped);
    Eigen::VectorXd s = reader.getState(3, 1.0e6);
    Eigen::Vector3d expected = segment(3).position(1.0e6);
    for (int k = 0; k < 3; ++k) {
        EXPECT_NEAR(s[k], expected[k], 1e-6);
    }
    std::remove(swapped.c_str());
}

namespace {

// Mars barycenter with a quartic term, so the interpolation degree shows
Eigen::VectorXd quarticMarsState(int window, double et, const LinearSegment& seg) {
    std::string path = ::testing::TempDir() + "solartrack_spk_window_" + std::to_string(window) + ".bsp";
    LinearSegment s = seg;
    s.window = window;
    writeSyntheticSpk(path, {s});
    io::SPKReader reader(path);
    Eigen::VectorXd state = reader.getState(4, et);
    std::remove(path.c_str());
    return state;
}

} // namespace

TEST(SPKReaderType13, InterpolatesOverTheWindow) {
    LinearSegment mars{4, 0, 13, -1.0e8, 1.0e8, Eigen::Vector3d(2.0e6, -1.0e6, 5.0e5),
                       Eigen::Vector3d(10.0, -4.0, 1.0)};
    mars.quartic = Eigen::Vector3d(1.0e6, 0.0, 0.0);
    const double et = 2.2e7;

    // Three states give a quintic, exact for quartic motion
    Eigen::VectorXd s = quarticMarsState(3, et, mars);
    Eigen::Vector3d expected = mars.position(et);
    Eigen::Vector3d expected_v = mars.velocity(et);
    for (int k = 0; k < 3; ++k) {
        EXPECT_NEAR(s[k], expected[k], 1e-4);
        EXPECT_NEAR(s[k + 3], expected_v[k], 1e-8);
    }

    // Two states give a cubic, which misses the quartic term by kilometres
    Eigen::VectorXd cubic = quarticMarsState(2, et, mars);
    EXPECT_GT(std::abs(cubic[0] - expected[0]), 1.0);
    EXPECT_NEAR(cubic[1], expected[1], 1e-4);
}

TEST(SPKReaderErrors, MissingFileThrows) {
    EXPECT_THROW(io::SPKReader("/nonexistent/path/de440s.bsp"), std::runtime_error);
}

TEST(SPKReaderErrors, NonDafFileThrows) {
    std::string bogus = ::testing::TempDir() + "solartrack_not_a_kernel.bsp";
    {
        std::ofstream f(bogus, std::ios::binary);
        std::string junk(4096, 'x');
        f.write(junk.data(), static_cast<std::streamsize>(junk.size()));
    }
    EXPECT_THROW(io::SPKReader reader(bogus), std::runtime_error);
    std::remove(bogus.c_str());
}

TEST(SPKReaderErrors, TruncatedFileThrows) {
    std::string tiny = ::testing::TempDir() + "solartrack_tiny.bsp";
    {
        std::ofstream f(tiny, std::ios::binary);
        f << "DAF/SPK ";
    }
    EXPECT_THROW(io::SPKReader reader(tiny), std::runtime_error);
    std::remove(tiny.c_str());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
