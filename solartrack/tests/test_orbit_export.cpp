/**
 * @file test_orbit_export.cpp
 * @brief Unit tests for orbit row flattening and CSV output
 */

#include <gtest/gtest.h>
#include "solartrack/io/OrbitExport.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace solartrack;
using namespace solartrack::io;

namespace {

orbits::OrbitPathPtr makePath(const std::string& body, int n, double scale) {
    auto p = std::make_shared<orbits::OrbitPath>();
    p->body = body;
    for (int i = 0; i < n; ++i) {
        p->epochs.push_back(time::Instant::fromJulianDate(2460000.5 + i));
        p->positions.emplace_back(scale * i, -scale * i, 0.5 * i);
    }
    return p;
}

} // namespace

TEST(OrbitExportTest, RowsFollowBodyThenSampleOrder) {
    orbits::OrbitSet set;
    set["Venus"] = makePath("Venus", 2, 0.7);
    set["Mars"] = makePath("Mars", 3, 1.5);

    auto rows = toExportRows(set);
    ASSERT_EQ(rows.size(), 5u);
    EXPECT_EQ(rows[0].body, "Mars");
    EXPECT_EQ(rows[0].index, 0u);
    EXPECT_EQ(rows[2].body, "Mars");
    EXPECT_EQ(rows[2].index, 2u);
    EXPECT_DOUBLE_EQ(rows[2].x, 3.0);
    EXPECT_DOUBLE_EQ(rows[2].y, -3.0);
    EXPECT_DOUBLE_EQ(rows[2].z, 1.0);
    EXPECT_EQ(rows[3].body, "Venus");
    EXPECT_EQ(rows[4].index, 1u);
}

TEST(OrbitExportTest, SkipsNullPaths) {
    orbits::OrbitSet set;
    set["Mars"] = makePath("Mars", 2, 1.0);
    set["Ghost"] = nullptr;
    EXPECT_EQ(toExportRows(set).size(), 2u);
}

TEST(OrbitExportTest, CsvHasHeaderAndOneLinePerSample) {
    orbits::OrbitSet set;
    set["Mars"] = makePath("Mars", 2, 1.5);

    std::ostringstream out;
    EXPECT_EQ(writeOrbitCsv(out, set), 2u);

    std::istringstream in(out.str());
    std::string line;
    std::getline(in, line);
    EXPECT_EQ(line, "Planet,Point Index,X (AU),Y (AU),Z (AU)");
    std::getline(in, line);
    EXPECT_EQ(line.rfind("Mars,0,0,", 0), 0u);
    std::getline(in, line);
    EXPECT_EQ(line, "Mars,1,1.5,-1.5,0.5");
    EXPECT_FALSE(std::getline(in, line));
}

TEST(OrbitExportTest, EmptySetWritesHeaderOnly) {
    std::ostringstream out;
    EXPECT_EQ(writeOrbitCsv(out, orbits::OrbitSet()), 0u);
    EXPECT_EQ(out.str(), "Planet,Point Index,X (AU),Y (AU),Z (AU)\n");
}

TEST(OrbitExportTest, WritesFile) {
    orbits::OrbitSet set;
    set["Jupiter"] = makePath("Jupiter", 4, 5.2);
    std::string path = ::testing::TempDir() + "solartrack_orbits.csv";
    EXPECT_EQ(writeOrbitCsv(path, set), 4u);

    std::ifstream f(path);
    ASSERT_TRUE(f.is_open());
    int lines = 0;
    std::string line;
    while (std::getline(f, line)) ++lines;
    EXPECT_EQ(lines, 5);
    std::remove(path.c_str());

    EXPECT_THROW(writeOrbitCsv("/nonexistent/dir/orbits.csv", set), std::runtime_error);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
