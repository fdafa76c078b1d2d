#include <gtest/gtest.h>
#include <ctime>
#include "signal_ngin/core/time_utils.hpp"

using namespace signal_ngin;
using namespace signal_ngin::core;

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, SafeGmtimeAtEpoch) {
    std::time_t epoch = 0;
    std::tm result;

    std::tm* ret = safe_gmtime(&epoch, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(ret, &result);
    EXPECT_EQ(result.tm_year, 70);
    EXPECT_EQ(result.tm_mon, 0);
    EXPECT_EQ(result.tm_mday, 1);
    EXPECT_EQ(result.tm_hour, 0);
}

TEST_F(TimeUtilsTest, EpochSecondsRoundTrip) {
    const int64_t seconds = 1717200000;  // 2024-06-01 00:00:00 UTC
    Timestamp ts = from_epoch_seconds(seconds);
    EXPECT_EQ(to_epoch_seconds(ts), seconds);
    EXPECT_EQ(format_utc(ts), "2024-06-01 00:00:00");
}

TEST_F(TimeUtilsTest, EpochSecondsFloorsSubSecondInstants) {
    Timestamp ts = from_epoch_seconds(100) + std::chrono::milliseconds(999);
    EXPECT_EQ(to_epoch_seconds(ts), 100);

    Timestamp before_epoch = from_epoch_seconds(0) - std::chrono::milliseconds(1);
    EXPECT_EQ(to_epoch_seconds(before_epoch), -1);
}

TEST_F(TimeUtilsTest, DaysFromCivil) {
    EXPECT_EQ(days_from_civil(1970, 1, 1), 0);
    EXPECT_EQ(days_from_civil(1970, 1, 2), 1);
    EXPECT_EQ(days_from_civil(1969, 12, 31), -1);
    EXPECT_EQ(days_from_civil(2000, 3, 1), 11017);
    EXPECT_EQ(days_from_civil(2024, 6, 1) * 86400, 1717200000);
}

TEST_F(TimeUtilsTest, FormatUtcLeapDay) {
    Timestamp ts = from_epoch_seconds(days_from_civil(2024, 2, 29) * 86400 + 3661);
    EXPECT_EQ(format_utc(ts), "2024-02-29 01:01:01");
}
