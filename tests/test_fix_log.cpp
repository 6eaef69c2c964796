/*
 * GTest suite for the raw fix log reader and the speed -> radius policy
 */

#include <fogmap/fix_log.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <sstream>

using namespace fogmap;

/* ========================================================================
 * buffer_radius_for_speed
 * ======================================================================== */

TEST(BufferPolicy, Buckets) {
    EXPECT_DOUBLE_EQ(buffer_radius_for_speed(0.0), 40.0);
    EXPECT_DOUBLE_EQ(buffer_radius_for_speed(1.5), 40.0);      /* 5.4 km/h */
    EXPECT_DOUBLE_EQ(buffer_radius_for_speed(5.0), 28.0);      /* 18 km/h */
    EXPECT_DOUBLE_EQ(buffer_radius_for_speed(15.0), 18.0);     /* 54 km/h */
    EXPECT_DOUBLE_EQ(buffer_radius_for_speed(30.0), 12.0);     /* 108 km/h */
    EXPECT_DOUBLE_EQ(buffer_radius_for_speed(50.0), 8.0);      /* 180 km/h */
}

TEST(BufferPolicy, BucketEdges) {
    EXPECT_DOUBLE_EQ(buffer_radius_for_speed(1.6), 40.0);      /* 5.76 km/h */
    EXPECT_DOUBLE_EQ(buffer_radius_for_speed(1.7), 28.0);      /* 6.12 km/h */
    EXPECT_DOUBLE_EQ(buffer_radius_for_speed(36.0), 12.0);     /* 129.6 km/h */
    EXPECT_DOUBLE_EQ(buffer_radius_for_speed(36.2), 8.0);      /* 130.32 km/h */
}

TEST(BufferPolicy, BadSpeedCountsAsStopped) {
    EXPECT_DOUBLE_EQ(buffer_radius_for_speed(-3.0), 40.0);
    EXPECT_DOUBLE_EQ(buffer_radius_for_speed(std::numeric_limits<double>::quiet_NaN()), 40.0);
    EXPECT_DOUBLE_EQ(buffer_radius_for_speed(std::numeric_limits<double>::infinity()), 40.0);
}

/* ========================================================================
 * CSV
 * ======================================================================== */

TEST(FixLogCsv, ParsesRowsHeaderAndComments) {
    std::istringstream in(
        "longitude,latitude,timestamp_ms,speed_mps\n"
        "# recorded on the Yamanote line\n"
        "\n"
        "139.767125, 35.681236, 1700000000000\n"
        "139.7700,35.6820,1700000002000,1.0\n"
        "139.80,35.70,1700000004000, 30\n");

    auto fixes = fixes_from_csv_stream(in, 15.0);
    ASSERT_EQ(fixes.size(), 3u);

    EXPECT_DOUBLE_EQ(fixes[0].longitude, 139.767125);
    EXPECT_DOUBLE_EQ(fixes[0].latitude, 35.681236);
    EXPECT_EQ(fixes[0].timestamp_ms, 1700000000000LL);
    EXPECT_DOUBLE_EQ(fixes[0].buffer_radius_m, 15.0);

    EXPECT_DOUBLE_EQ(fixes[1].buffer_radius_m, 40.0);
    EXPECT_DOUBLE_EQ(fixes[2].buffer_radius_m, 12.0);
}

TEST(FixLogCsv, SkipsInvalidRows) {
    std::istringstream in(
        "1.0,2.0\n"                   /* too few columns */
        "abc,2.0,1000\n"              /* not a number */
        "1.0,2.0,10.5\n"              /* fractional timestamp */
        "1.0,2.0,1000,fast\n"         /* bad speed */
        "1.0,2.0,1000\n");
    auto fixes = fixes_from_csv_stream(in, 20.0);
    ASSERT_EQ(fixes.size(), 1u);
    EXPECT_DOUBLE_EQ(fixes[0].buffer_radius_m, 20.0);
}

TEST(FixLogCsv, MissingFileIsNullopt) {
    EXPECT_FALSE(load_fixes_csv("/nonexistent/fogmap/fixes.csv").has_value());
}
