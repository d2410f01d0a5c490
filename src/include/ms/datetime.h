#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ms {

// Calendar date and time of day, optionally aware of its UTC offset.
struct Timestamp {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int microsecond = 0;
    // minutes east of UTC; empty for naive values
    std::optional<int> utc_offset;

    bool aware() const noexcept { return utc_offset.has_value(); }

    bool operator==(const Timestamp& rhs) const noexcept {
        return year == rhs.year && month == rhs.month && day == rhs.day && hour == rhs.hour &&
               minute == rhs.minute && second == rhs.second && microsecond == rhs.microsecond &&
               utc_offset == rhs.utc_offset;
    }
    bool operator!=(const Timestamp& rhs) const noexcept { return not(*this == rhs); }
};

namespace datetime {

    // YYYY-MM-DDTHH:MM:SS[.ffffff][+HH:MM]
    std::string isoformat(const Timestamp& ts);

    // YYYY-MM-DD
    std::string isodate(const Timestamp& ts);

    // HH:MM:SS, with milliseconds appended when the value has a sub-second part
    std::string isotime(const Timestamp& ts);

    // Accepts the isoformat() shape, a space instead of 'T', a trailing 'Z', and
    // date-only text. Returns std::nullopt when the text is not a valid timestamp.
    std::optional<Timestamp> from_iso(const std::string& text);
    std::optional<Timestamp> from_iso_date(const std::string& text);
    std::optional<Timestamp> from_iso_time(const std::string& text);

    // RFC 822, e.g. "Sun, 10 Nov 2013 07:23:45 -0000", always rendered in UTC
    std::string rfcformat(const Timestamp& ts);
    std::optional<Timestamp> from_rfc(const std::string& text);

    // strftime/strptime style conversions. parse() requires the whole text to match.
    std::string format(const Timestamp& ts, const std::string& fmt);
    std::optional<Timestamp> parse(const std::string& text, const std::string& fmt);

    // Naive values are taken to be UTC.
    Timestamp to_utc(const Timestamp& ts);
    // Shift into the process's local time zone (TZ), recording its offset.
    Timestamp to_local(const Timestamp& ts);

    int64_t to_epoch_seconds(const Timestamp& ts);
    Timestamp from_epoch_seconds(int64_t seconds, int microsecond = 0, int utc_offset = 0);

    bool is_valid(const Timestamp& ts);

}  // namespace datetime
}  // namespace ms
