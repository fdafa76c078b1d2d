#include <gtest/gtest.h>
#include "signal_ngin/core/time_utils.hpp"
#include "signal_ngin/scheduler/market_calendar.hpp"

using namespace signal_ngin;

namespace {
// Monday 2024-06-03 00:00:00 UTC
constexpr int64_t kMonday = 1717372800;
// Monday 2024-01-08 00:00:00 UTC
constexpr int64_t kWinterMonday = 1704672000;

Timestamp utc(int64_t day_start, int hours, int minutes = 0) {
    return core::from_epoch_seconds(day_start + hours * 3600 + minutes * 60);
}
}  // namespace

class MarketCalendarTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto calendar = MarketCalendar::create(MarketCalendarConfig());
        ASSERT_TRUE(calendar.is_ok()) << calendar.error()->what();
        calendar_ = calendar.value();
    }

    std::shared_ptr<const MarketCalendar> calendar_;
};

TEST_F(MarketCalendarTest, VietnamSessionsWithLunchBreak) {
    // UTC+7: 10:00 local
    EXPECT_TRUE(calendar_->is_open("HOSE", utc(kMonday, 3)));
    // 08:59 local
    EXPECT_FALSE(calendar_->is_open("HOSE", utc(kMonday, 1, 59)));
    // 12:00 local
    EXPECT_FALSE(calendar_->is_open("HNX", utc(kMonday, 5)));
    // 13:30 local
    EXPECT_TRUE(calendar_->is_open("UPCOM", utc(kMonday, 6, 30)));
    // Session end is inclusive: 15:00 open, 15:01 closed
    EXPECT_TRUE(calendar_->is_open("HOSE", utc(kMonday, 8)));
    EXPECT_FALSE(calendar_->is_open("HOSE", utc(kMonday, 8, 1)));
}

TEST_F(MarketCalendarTest, WeekendsAreClosed) {
    // Saturday 2024-06-01 10:00 local
    EXPECT_FALSE(calendar_->is_open("HOSE", utc(kMonday - 2 * 86400, 3)));
    // Sunday 2024-06-02 11:00 EDT
    EXPECT_FALSE(calendar_->is_open("NYSE", utc(kMonday - 86400, 15)));
}

TEST_F(MarketCalendarTest, UsHoursFollowDaylightSaving) {
    // June: EDT (UTC-4), 09:30 local = 13:30 UTC
    EXPECT_TRUE(calendar_->is_open("NASDAQ", utc(kMonday, 13, 30)));
    EXPECT_FALSE(calendar_->is_open("NASDAQ", utc(kMonday, 13, 29)));
    EXPECT_TRUE(calendar_->is_open("NYSE", utc(kMonday, 20)));

    // January: EST (UTC-5), 09:30 local = 14:30 UTC
    EXPECT_FALSE(calendar_->is_open("NASDAQ", utc(kWinterMonday, 13, 45)));
    EXPECT_TRUE(calendar_->is_open("NASDAQ", utc(kWinterMonday, 14, 30)));
    EXPECT_TRUE(calendar_->is_open("NASDAQ", utc(kWinterMonday, 21)));
}

TEST_F(MarketCalendarTest, DaylightSavingBoundaries2024) {
    // Starts 2024-03-10 07:00 UTC, ends 2024-11-03 06:00 UTC
    EXPECT_FALSE(MarketCalendar::us_dst_active(core::from_epoch_seconds(1710053999)));
    EXPECT_TRUE(MarketCalendar::us_dst_active(core::from_epoch_seconds(1710054000)));
    EXPECT_TRUE(MarketCalendar::us_dst_active(core::from_epoch_seconds(1730613599)));
    EXPECT_FALSE(MarketCalendar::us_dst_active(core::from_epoch_seconds(1730613600)));
}

TEST_F(MarketCalendarTest, UnknownVenueIsAlwaysOpen) {
    EXPECT_FALSE(calendar_->has_hours("LSE"));
    EXPECT_TRUE(calendar_->has_hours("HOSE"));
    EXPECT_TRUE(calendar_->is_open("LSE", utc(kMonday - 86400, 3)));
}

TEST_F(MarketCalendarTest, RejectsInvalidConfiguration) {
    MarketCalendarConfig config;
    config.markets = {{{"HOSE"}, 420, false, true, {{"9:00", "11:30"}}}};
    EXPECT_TRUE(MarketCalendar::create(config).is_error());

    config.markets = {{{"HOSE"}, 420, false, true, {{"11:30", "09:00"}}}};
    EXPECT_TRUE(MarketCalendar::create(config).is_error());

    config.markets = {{{"HOSE"}, 420, false, true, {}}};
    EXPECT_TRUE(MarketCalendar::create(config).is_error());

    config.markets = {{{"HOSE"}, 420, false, true, {{"09:00", "11:30"}}},
                      {{"HOSE"}, 420, false, true, {{"13:00", "15:00"}}}};
    auto duplicate = MarketCalendar::create(config);
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error()->code(), ErrorCode::CONFIGURATION_ERROR);
}

TEST_F(MarketCalendarTest, ConfigFromJson) {
    MarketCalendarConfig config;
    config.from_json({{"markets",
                       {{{"venues", {"XETRA"}},
                         {"utc_offset_minutes", 60},
                         {"weekdays_only", false},
                         {"sessions", {{{"open", "09:00"}, {"close", "17:30"}}}}}}}});
    auto calendar = MarketCalendar::create(config);
    ASSERT_TRUE(calendar.is_ok());
    // Sunday 2024-06-02 09:00 UTC = 10:00 local, weekends allowed
    EXPECT_TRUE(calendar.value()->is_open("XETRA", utc(kMonday - 86400, 9)));
    EXPECT_TRUE(calendar.value()->is_open("HOSE", utc(kMonday, 0)));
}
