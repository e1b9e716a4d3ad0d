#include <gtest/gtest.h>
#include <cerrno>
#include <sstream>
#include <string>
#include "session_csv.hpp"

TEST(SessionCsv, ParsesSampleRow) {
    sensor_sample_t s{};
    ASSERT_EQ(parse_sample_row("2.51,0.1,-0.2,7.0,300,0,-5.5,12000\r", &s), 0);
    EXPECT_DOUBLE_EQ(s.timestamp_s, 2.51);
    EXPECT_DOUBLE_EQ(s.ax, 0.1);
    EXPECT_DOUBLE_EQ(s.ay, -0.2);
    EXPECT_DOUBLE_EQ(s.az, 7.0);
    EXPECT_DOUBLE_EQ(s.gx, 300.0);
    EXPECT_DOUBLE_EQ(s.gy, 0.0);
    EXPECT_DOUBLE_EQ(s.gz, -5.5);
    EXPECT_DOUBLE_EQ(s.mic_rms, 12000.0);
}

TEST(SessionCsv, SpacesAroundFieldsAreAccepted) {
    sensor_sample_t s{};
    ASSERT_EQ(parse_sample_row(" 1.0 , 0, 0, 1, 0, 0, 0, 3 ", &s), 0);
    EXPECT_DOUBLE_EQ(s.timestamp_s, 1.0);
    EXPECT_DOUBLE_EQ(s.mic_rms, 3.0);
}

TEST(SessionCsv, MalformedRowsAreRejected) {
    sensor_sample_t s{};
    s.timestamp_s = 42.0;
    EXPECT_EQ(parse_sample_row("1,2,3,4,5,6,7", &s), -EINVAL);
    EXPECT_EQ(parse_sample_row("1,2,3,4,5,6,7,8,9", &s), -EINVAL);
    EXPECT_EQ(parse_sample_row("1,2,3,x,5,6,7,8", &s), -EINVAL);
    EXPECT_EQ(parse_sample_row("1,2,3,,5,6,7,8", &s), -EINVAL);
    EXPECT_EQ(parse_sample_row("1,2,3,4abc,5,6,7,8", &s), -EINVAL);
    EXPECT_DOUBLE_EQ(s.timestamp_s, 42.0);
    EXPECT_EQ(parse_sample_row("1,2,3,4,5,6,7,8", nullptr), -EINVAL);
}

TEST(SessionCsv, SkippableRows) {
    EXPECT_TRUE(is_skippable_row(""));
    EXPECT_TRUE(is_skippable_row("   \r"));
    EXPECT_TRUE(is_skippable_row("# recorded 2024-03-01"));
    EXPECT_TRUE(is_skippable_row("timestamp,ax,ay,az,gx,gy,gz,mic"));
    EXPECT_FALSE(is_skippable_row("0.01,0,0,1,0,0,0,0"));
    EXPECT_FALSE(is_skippable_row("-0.5,0,0,1,0,0,0,0"));
}

TEST(SessionCsv, SwingRowMatchesHeader) {
    swing_event_t ev{};
    ev.hit_index = 3;
    ev.timestamp_s = 2.5;
    ev.peak_angular_velocity = 5.236;
    ev.peak_tip_speed = 2.042;
    ev.peak_acceleration = 57.879;
    ev.impact_force = 8.682;
    ev.duration_ms = 600.0;
    ev.power_ratio = 7595.25;
    ev.is_valid = true;

    std::ostringstream os;
    write_swing_row(os, ev);
    const std::string row = os.str();
    ASSERT_FALSE(row.empty());
    EXPECT_EQ(row.back(), '\n');
    EXPECT_EQ(row.rfind("3,2.500,", 0), 0u);
    EXPECT_NE(row.find(",600.0,"), std::string::npos);
    EXPECT_NE(row.find(",7595.250,1,1\n"), std::string::npos);

    const std::string header = SWING_CSV_HEADER;
    size_t header_cols = 1;
    size_t row_cols = 1;
    for (char c : header) {
        header_cols += (c == ',');
    }
    for (char c : row) {
        row_cols += (c == ',');
    }
    EXPECT_EQ(header_cols, row_cols);

    // stream formatting is restored for the next writer
    os.str("");
    os << 0.5;
    EXPECT_EQ(os.str(), "0.5");
}
