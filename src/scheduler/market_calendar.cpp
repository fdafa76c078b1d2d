// src/scheduler/market_calendar.cpp

#include "signal_ngin/scheduler/market_calendar.hpp"
#include <optional>
#include "signal_ngin/core/time_utils.hpp"

namespace signal_ngin {

namespace {

constexpr int64_t SECONDS_PER_DAY = 86400;

// "HH:MM" -> minutes after midnight
std::optional<int> parse_clock(const std::string& text) {
    if (text.size() != 5 || text[2] != ':') {
        return std::nullopt;
    }
    for (size_t i : {0, 1, 3, 4}) {
        if (text[i] < '0' || text[i] > '9') {
            return std::nullopt;
        }
    }
    int hours = (text[0] - '0') * 10 + (text[1] - '0');
    int minutes = (text[3] - '0') * 10 + (text[4] - '0');
    if (hours > 23 || minutes > 59) {
        return std::nullopt;
    }
    return hours * 60 + minutes;
}

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

// 0 = Sunday; 1970-01-01 was a Thursday
int weekday_from_days(int64_t days) {
    return static_cast<int>(((days % 7) + 7 + 4) % 7);
}

int64_t first_sunday_on_or_after(int64_t days) {
    return days + (7 - weekday_from_days(days)) % 7;
}

}  // namespace

nlohmann::json MarketCalendarConfig::to_json() const {
    nlohmann::json j;
    nlohmann::json market_array = nlohmann::json::array();
    for (const auto& market : markets) {
        nlohmann::json m;
        m["venues"] = market.venues;
        m["utc_offset_minutes"] = market.utc_offset_minutes;
        m["us_daylight_saving"] = market.us_daylight_saving;
        m["weekdays_only"] = market.weekdays_only;
        nlohmann::json sessions = nlohmann::json::array();
        for (const auto& [open, close] : market.sessions) {
            sessions.push_back({{"open", open}, {"close", close}});
        }
        m["sessions"] = sessions;
        market_array.push_back(m);
    }
    j["markets"] = market_array;
    return j;
}

void MarketCalendarConfig::from_json(const nlohmann::json& j) {
    if (!j.contains("markets")) {
        return;
    }
    markets.clear();
    for (const auto& item : j.at("markets")) {
        VenueHours hours;
        read_field(item, "venues", hours.venues);
        read_field(item, "utc_offset_minutes", hours.utc_offset_minutes);
        read_field(item, "us_daylight_saving", hours.us_daylight_saving);
        read_field(item, "weekdays_only", hours.weekdays_only);
        if (item.contains("sessions")) {
            for (const auto& session : item.at("sessions")) {
                hours.sessions.emplace_back(session.at("open").get<std::string>(),
                                            session.at("close").get<std::string>());
            }
        }
        markets.push_back(hours);
    }
}

Result<std::shared_ptr<const MarketCalendar>> MarketCalendar::create(
    const MarketCalendarConfig& config) {
    using CalendarPtr = std::shared_ptr<const MarketCalendar>;
    auto fail = [](const std::string& message) {
        return make_error<CalendarPtr>(ErrorCode::CONFIGURATION_ERROR, message,
                                       "MarketCalendar");
    };

    auto calendar = std::make_shared<MarketCalendar>(Token{});
    for (const auto& hours : config.markets) {
        if (hours.venues.empty()) {
            return fail("market hours without venues");
        }
        if (hours.utc_offset_minutes < -14 * 60 || hours.utc_offset_minutes > 14 * 60) {
            return fail("UTC offset out of range for " + hours.venues.front());
        }

        Market market{hours.utc_offset_minutes, hours.us_daylight_saving, hours.weekdays_only, {}};
        for (const auto& [open_text, close_text] : hours.sessions) {
            auto open = parse_clock(open_text);
            auto close = parse_clock(close_text);
            if (!open || !close) {
                return fail("malformed session '" + open_text + "-" + close_text + "'");
            }
            if (*open >= *close) {
                return fail("session '" + open_text + "-" + close_text + "' closes before it opens");
            }
            market.sessions.push_back({*open, *close});
        }
        if (market.sessions.empty()) {
            return fail("no sessions for " + hours.venues.front());
        }

        const size_t index = calendar->markets_.size();
        calendar->markets_.push_back(market);
        for (const auto& venue : hours.venues) {
            if (!calendar->venue_index_.emplace(venue, index).second) {
                return fail("venue " + venue + " listed twice");
            }
        }
    }

    return Result<CalendarPtr>(CalendarPtr(std::move(calendar)));
}

bool MarketCalendar::is_open(const std::string& venue, const Timestamp& at) const {
    auto it = venue_index_.find(venue);
    if (it == venue_index_.end()) {
        return true;
    }
    const Market& market = markets_[it->second];

    int offset_minutes = market.utc_offset_minutes;
    if (market.us_daylight_saving && us_dst_active(at)) {
        offset_minutes += 60;
    }

    const int64_t local_seconds = core::to_epoch_seconds(at) + offset_minutes * 60;
    const int64_t local_day = floor_div(local_seconds, SECONDS_PER_DAY);
    const int minute_of_day = static_cast<int>((local_seconds - local_day * SECONDS_PER_DAY) / 60);

    if (market.weekdays_only) {
        const int weekday = weekday_from_days(local_day);
        if (weekday == 0 || weekday == 6) {
            return false;
        }
    }

    for (const auto& session : market.sessions) {
        if (minute_of_day >= session.open_minute && minute_of_day <= session.close_minute) {
            return true;
        }
    }
    return false;
}

bool MarketCalendar::us_dst_active(const Timestamp& at) {
    const int64_t seconds = core::to_epoch_seconds(at);
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm utc;
    if (core::safe_gmtime(&t, &utc) == nullptr) {
        return false;
    }
    const int64_t year = utc.tm_year + 1900;

    // Starts 02:00 EST (07:00 UTC), ends 02:00 EDT (06:00 UTC)
    const int64_t start_day = first_sunday_on_or_after(core::days_from_civil(year, 3, 1)) + 7;
    const int64_t end_day = first_sunday_on_or_after(core::days_from_civil(year, 11, 1));
    const int64_t start = start_day * SECONDS_PER_DAY + 7 * 3600;
    const int64_t end = end_day * SECONDS_PER_DAY + 6 * 3600;
    return seconds >= start && seconds < end;
}

}  // namespace signal_ngin
