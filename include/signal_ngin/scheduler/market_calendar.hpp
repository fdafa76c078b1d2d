// include/signal_ngin/scheduler/market_calendar.hpp
#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief Trading hours shared by a set of venues
 * Times are local "HH:MM"; both session ends are inclusive.
 */
struct VenueHours {
    std::vector<std::string> venues;
    int utc_offset_minutes{0};
    bool us_daylight_saving{false};  // +60 min from 2nd Sunday of March to 1st Sunday of November
    bool weekdays_only{true};
    std::vector<std::pair<std::string, std::string>> sessions;
};

/**
 * @brief Configuration for the market calendar
 * Defaults: HOSE/HNX/UPCOM 09:00-11:30 and 13:00-15:00 at UTC+7,
 * NASDAQ/NYSE 09:30-16:00 US Eastern.
 */
struct MarketCalendarConfig : public ConfigBase {
    std::vector<VenueHours> markets{
        {{"HOSE", "HNX", "UPCOM"}, 7 * 60, false, true, {{"09:00", "11:30"}, {"13:00", "15:00"}}},
        {{"NASDAQ", "NYSE"}, -5 * 60, true, true, {{"09:30", "16:00"}}}};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    std::string section_name() const override {
        return "calendar";
    }
};

/**
 * @brief Answers whether a venue's market is in session
 * Venues without configured hours are always open.
 */
class MarketCalendar {
    struct Token {};

public:
    explicit MarketCalendar(Token) {}

    /**
     * @return The calendar, or CONFIGURATION_ERROR for malformed session
     *         times, inverted sessions or a venue listed twice
     */
    static Result<std::shared_ptr<const MarketCalendar>> create(
        const MarketCalendarConfig& config);

    bool is_open(const std::string& venue, const Timestamp& at) const;

    bool has_hours(const std::string& venue) const {
        return venue_index_.count(venue) > 0;
    }

    /**
     * @brief Whether US daylight saving time is in effect at an instant
     */
    static bool us_dst_active(const Timestamp& at);

private:
    struct Session {
        int open_minute;
        int close_minute;
    };

    struct Market {
        int utc_offset_minutes;
        bool us_daylight_saving;
        bool weekdays_only;
        std::vector<Session> sessions;
    };

    std::vector<Market> markets_;
    std::map<std::string, size_t> venue_index_;
};

}  // namespace signal_ngin
