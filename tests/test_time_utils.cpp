#include <gtest/gtest.h>
#include <core/time_utils.hpp>
#include <ctime>

using namespace std::chrono;

static system_clock::time_point local_time(int hour, int min, int sec) {
    struct tm tm_buf = {};
    tm_buf.tm_year = 2025 - 1900;
    tm_buf.tm_mon = 0;
    tm_buf.tm_mday = 15;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = min;
    tm_buf.tm_sec = sec;
    tm_buf.tm_isdst = -1;
    return system_clock::from_time_t(mktime(&tm_buf));
}

TEST(TimeUtils, FormatSecondsZero) {
    EXPECT_EQ(format_seconds(0), "0s");
}

TEST(TimeUtils, FormatSecondsNegativeClamps) {
    EXPECT_EQ(format_seconds(-30), "0s");
}

TEST(TimeUtils, FormatDurationSeconds) {
    auto start = local_time(10, 0, 0);
    EXPECT_EQ(format_duration(start, start + seconds(45)), "45s");
}

TEST(TimeUtils, FormatDurationMinutes) {
    auto start = local_time(10, 0, 0);
    EXPECT_EQ(format_duration(start, local_time(10, 5, 30)), "5m30s");
}

TEST(TimeUtils, FormatDurationHours) {
    auto start = local_time(10, 0, 0);
    EXPECT_EQ(format_duration(start, local_time(12, 15, 0)), "2h15m");
}

TEST(TimeUtils, FormatDurationOpenEnded) {
    auto start = system_clock::now() - seconds(3);
    std::string d = format_duration(start);
    EXPECT_TRUE(d == "3s" || d == "4s") << d;
}

TEST(TimeUtils, FormatClockAfternoon) {
    EXPECT_EQ(format_clock(local_time(14, 35, 22)), "2:35pm");
}

TEST(TimeUtils, FormatClockMidnight) {
    EXPECT_EQ(format_clock(local_time(0, 0, 0)), "12:00am");
}
