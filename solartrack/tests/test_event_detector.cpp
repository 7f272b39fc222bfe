/**
 * @file test_event_detector.cpp
 * @brief Unit tests for conjunction/opposition detection and Brent search
 */

#include <gtest/gtest.h>
#include "solartrack/core/Constants.hpp"
#include "solartrack/events/EventDetector.hpp"
#include "solartrack/events/ExtremumSearch.hpp"
#include "solartrack/time/TimeUtils.hpp"
#include "MockEphemerisSource.hpp"
#include <cmath>
#include <cstdlib>
#include <stdexcept>

using namespace solartrack;
using namespace solartrack::events;

class EventDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<const ephemeris::EphemerisStore>(std::make_shared<solartrack::testing::MockEphemerisSource>());
        detector = std::make_unique<EventDetector>(store);
    }

    std::shared_ptr<const ephemeris::EphemerisStore> store;
    std::unique_ptr<EventDetector> detector;
};

TEST_F(EventDetectorTest, FindsMarsOpposition2020) {
    auto events = detector->search({"Mars"}, time::parse("2020-01-01", "00:00"), time::parse("2021-06-01", "00:00"));
    ASSERT_EQ(events.size(), 1u);

    const Event& ev = events.front();
    EXPECT_EQ(ev.body, "Mars");
    EXPECT_EQ(ev.kind, EventKind::Opposition);
    ASSERT_TRUE(ev.time.has_value());
    EXPECT_GE(ev.elongation_deg, 170.0);

    // 2020-10-13, give or take the two-body approximation
    EXPECT_NEAR(time::parse("2020-10-13", "00:00").daysUntil(*ev.time), 0.0, 10.0);
}

TEST_F(EventDetectorTest, FindsVenusInferiorConjunction2020) {
    auto events = detector->search({"Venus"}, time::parse("2020-01-01", "00:00"), time::parse("2020-12-31", "00:00"));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events.front().kind, EventKind::InferiorConjunction);
    EXPECT_LE(events.front().elongation_deg, 10.0);
    EXPECT_NEAR(time::parse("2020-06-03", "00:00").daysUntil(*events.front().time), 0.0, 10.0);
}

TEST_F(EventDetectorTest, SearchResultsAreSortedByTime) {
    auto events = detector->search({"Venus", "Mars"}, time::parse("2020-01-01", "00:00"), time::parse("2021-06-01", "00:00"));
    ASSERT_EQ(events.size(), 3u);
    for (std::size_t i = 1; i < events.size(); ++i) {
        EXPECT_LE(*events[i - 1].time, *events[i].time);
    }
    EXPECT_EQ(events[0].body, "Venus");
    EXPECT_EQ(events[0].kind, EventKind::InferiorConjunction);
    EXPECT_EQ(events[1].body, "Mars");
    EXPECT_EQ(events[1].kind, EventKind::Opposition);
    EXPECT_EQ(events[2].body, "Venus");
    EXPECT_EQ(events[2].kind, EventKind::SuperiorConjunction);
}

TEST_F(EventDetectorTest, CheckAtAgreesWithSearch) {
    auto found = detector->search({"Mars"}, time::parse("2020-01-01", "00:00"), time::parse("2021-06-01", "00:00"));
    ASSERT_EQ(found.size(), 1u);
    const time::Instant when = *found.front().time;

    auto at_event = detector->checkAt({"Mars", "Venus"}, when);
    ASSERT_EQ(at_event.size(), 1u);
    EXPECT_EQ(at_event.front().body, "Mars");
    EXPECT_EQ(at_event.front().kind, EventKind::Opposition);
    EXPECT_FALSE(at_event.front().time.has_value());

    EXPECT_TRUE(detector->checkAt({"Mars"}, when.plusDays(-120.0)).empty());
}

TEST_F(EventDetectorTest, ElongationRange) {
    const auto& mars = store->body("Mars");
    for (int k = 0; k < 40; ++k) {
        auto t = time::parse("2020-01-01", "00:00").plusDays(20.0 * k);
        const double e = detector->elongation(mars, t);
        EXPECT_GE(e, 0.0);
        EXPECT_LE(e, 180.0);
    }
}

TEST_F(EventDetectorTest, ExcludesEarthMoonAndSun) {
    auto start = time::parse("2020-01-01", "00:00");
    auto end = time::parse("2020-12-31", "00:00");
    EXPECT_TRUE(detector->search({"Earth", "Moon", "Sun"}, start, end).empty());
    EXPECT_TRUE(detector->checkAt({"Earth", "Moon", "Sun"}, start).empty());
}

TEST_F(EventDetectorTest, SkipsUnknownBodies) {
    auto events = detector->search({"Vulcan", "Uranus", "Venus"},
                                   time::parse("2020-01-01", "00:00"), time::parse("2020-12-31", "00:00"));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events.front().body, "Venus");
}

TEST_F(EventDetectorTest, OutOfRangeGivesNoEvents) {
    auto start = time::parse("1800-01-01", "00:00");
    auto end = time::parse("1801-01-01", "00:00");
    EXPECT_TRUE(detector->search({"Mars", "Venus"}, start, end).empty());
    EXPECT_TRUE(detector->checkAt({"Mars", "Venus"}, start).empty());
}

TEST_F(EventDetectorTest, NarrowThresholdStillFindsCoplanarOpposition) {
    EventDetectorOptions options;
    options.precise_threshold_deg = 1.0;
    EventDetector narrow(store, options);
    auto events = narrow.search({"Mars"}, time::parse("2020-01-01", "00:00"), time::parse("2021-06-01", "00:00"));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_GE(events.front().elongation_deg, 179.0);
}

TEST_F(EventDetectorTest, RejectsBadOptions) {
    EventDetectorOptions zero;
    zero.approximate_threshold_deg = 0.0;
    EXPECT_THROW(EventDetector(store, zero), std::invalid_argument);

    EventDetectorOptions wide;
    wide.precise_threshold_deg = 90.0;
    EXPECT_THROW(EventDetector(store, wide), std::invalid_argument);

    EventDetectorOptions no_step;
    no_step.step_days = 0.0;
    EXPECT_THROW(EventDetector(store, no_step), std::invalid_argument);

    // Too small to move an Instant at all
    EventDetectorOptions stuck;
    stuck.step_days = 1e-17;
    EXPECT_THROW(EventDetector(store, stuck), std::invalid_argument);

    EventDetectorOptions sub_floor;
    sub_floor.step_days = 1e-7;
    EXPECT_THROW(EventDetector(store, sub_floor), std::invalid_argument);

    EventDetectorOptions at_floor;
    at_floor.step_days = constants::MIN_SEARCH_STEP_DAYS;
    EXPECT_NO_THROW(EventDetector(store, at_floor));
}

TEST_F(EventDetectorTest, OversizedGridIsRejectedBeforeSampling) {
    EventDetectorOptions fine;
    fine.step_days = constants::MIN_SEARCH_STEP_DAYS;
    EventDetector detector_fine(store, fine);

    // 1 day at 1e-6 day is 1,000,000 samples, 10 days is over the limit
    const auto start = time::parse("2020-10-13", "00:00");
    EXPECT_THROW(detector_fine.search({"Mars"}, start, start.plusDays(10.0)), std::invalid_argument);

    // Clamping happens first, so an out-of-range window is still just empty
    EXPECT_TRUE(detector_fine.search({"Mars"}, time::parse("1800-01-01", "00:00"),
                                     time::parse("1801-01-01", "00:00")).empty());
}

TEST(EventKindTest, Names) {
    EXPECT_EQ(eventKindName(EventKind::InferiorConjunction), "Inferior Conjunction");
    EXPECT_EQ(eventKindName(EventKind::SuperiorConjunction), "Superior Conjunction");
    EXPECT_EQ(eventKindName(EventKind::Opposition), "Opposition");
}

TEST(ExtremumSearchTest, MinimisesParabola) {
    auto r = brentMinimize([](double x) { return (x - 2.0) * (x - 2.0) + 1.0; }, 0.0, 5.0, 1e-8);
    EXPECT_TRUE(r.converged);
    EXPECT_NEAR(r.x, 2.0, 1e-6);
    EXPECT_NEAR(r.value, 1.0, 1e-10);
}

TEST(ExtremumSearchTest, MinimisesCusp) {
    auto r = brentMinimize([](double x) { return std::abs(x - 0.3); }, 0.0, 1.0, 1e-7);
    EXPECT_TRUE(r.converged);
    EXPECT_NEAR(r.x, 0.3, 1e-6);
}

TEST(ExtremumSearchTest, MaximisesAndReportsPositiveValue) {
    auto r = brentMaximize([](double x) { return 3.0 - (x - 1.0) * (x - 1.0); }, -2.0, 2.0, 1e-8);
    EXPECT_NEAR(r.x, 1.0, 1e-6);
    EXPECT_NEAR(r.value, 3.0, 1e-10);
}

TEST(ExtremumSearchTest, RejectsEmptyBracketAndTolerance) {
    auto f = [](double x) { return x * x; };
    EXPECT_THROW(brentMinimize(f, 1.0, 1.0), std::invalid_argument);
    EXPECT_THROW(brentMinimize(f, 2.0, 1.0), std::invalid_argument);
    EXPECT_THROW(brentMinimize(f, 0.0, 1.0, 0.0), std::invalid_argument);
}

// Checked against a real kernel when SOLARTRACK_SPK_FILE names one
TEST(EventDetectorRealKernel, MarsOpposition2020) {
    const char* path = std::getenv("SOLARTRACK_SPK_FILE");
    if (!path) {
        GTEST_SKIP() << "SOLARTRACK_SPK_FILE not set";
    }
    auto store = ephemeris::EphemerisStore::load(path);
    EventDetector detector(store);
    auto events = detector.search({"Mars"}, time::parse("2020-09-01", "00:00"), time::parse("2020-11-30", "00:00"));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events.front().kind, EventKind::Opposition);
    EXPECT_NEAR(time::parse("2020-10-13", "23:00").daysUntil(*events.front().time), 0.0, 3.0);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
