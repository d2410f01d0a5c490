#include <ms/datetime.h>

#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace ms {
namespace datetime {

    namespace {
        // Howard Hinnant's civil calendar algorithms (proleptic Gregorian).
        int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
            y -= m <= 2;
            const int64_t era = (y >= 0 ? y : y - 399) / 400;
            const auto yoe = static_cast<unsigned>(y - era * 400);
            const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
            const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<int64_t>(doe) - 719468;
        }

        void civil_from_days(int64_t z, int& year, int& month, int& day) {
            z += 719468;
            const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
            const auto doe = static_cast<unsigned>(z - era * 146097);
            const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const int64_t y = static_cast<int64_t>(yoe) + era * 400;
            const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const unsigned mp = (5 * doy + 2) / 153;
            day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
            month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
            year = static_cast<int>(y + (month <= 2));
        }

        int64_t floor_div(int64_t a, int64_t b) {
            int64_t q = a / b;
            if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
            return q;
        }

        bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

        int days_in_month(int y, int m) {
            static const int table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (m == 2 && is_leap(y)) return 29;
            return table[m - 1];
        }

        // Right-pad a 1-6 digit fraction to microseconds.
        int parse_fraction(const std::string& digits) {
            std::string padded = digits;
            while (padded.size() < 6) padded.push_back('0');
            return std::atoi(padded.c_str());
        }

        std::optional<int> parse_offset(const std::string& tz) {
            if (tz.empty()) return std::nullopt;
            if (tz == "Z") return 0;
            int sign = tz[0] == '-' ? -1 : 1;
            std::string digits;
            for (size_t k = 1; k < tz.size(); ++k)
                if (tz[k] != ':') digits.push_back(tz[k]);
            int hours = std::atoi(digits.substr(0, 2).c_str());
            int minutes = std::atoi(digits.substr(2, 2).c_str());
            return sign * (hours * 60 + minutes);
        }

        std::tm to_tm(const Timestamp& ts) {
            std::tm tm{};
            tm.tm_year = ts.year - 1900;
            tm.tm_mon = ts.month - 1;
            tm.tm_mday = ts.day;
            tm.tm_hour = ts.hour;
            tm.tm_min = ts.minute;
            tm.tm_sec = ts.second;
            int64_t days = days_from_civil(ts.year, static_cast<unsigned>(ts.month),
                                           static_cast<unsigned>(ts.day));
            tm.tm_wday = static_cast<int>(((days % 7) + 11) % 7);  // 1970-01-01 was a Thursday
            tm.tm_yday = static_cast<int>(days - days_from_civil(ts.year, 1, 1));
            tm.tm_isdst = 0;
            return tm;
        }
    }  // namespace

    bool is_valid(const Timestamp& ts) {
        if (ts.month < 1 or ts.month > 12) return false;
        if (ts.day < 1 or ts.day > days_in_month(ts.year, ts.month)) return false;
        if (ts.hour < 0 or ts.hour > 23) return false;
        if (ts.minute < 0 or ts.minute > 59) return false;
        if (ts.second < 0 or ts.second > 59) return false;
        if (ts.microsecond < 0 or ts.microsecond > 999999) return false;
        if (ts.utc_offset && (*ts.utc_offset <= -24 * 60 or *ts.utc_offset >= 24 * 60)) return false;
        return true;
    }

    std::string isodate(const Timestamp& ts) {
        std::ostringstream ss;
        ss << std::setfill('0') << std::setw(4) << ts.year << '-' << std::setw(2) << ts.month << '-'
           << std::setw(2) << ts.day;
        return ss.str();
    }

    std::string isotime(const Timestamp& ts) {
        std::ostringstream ss;
        ss << std::setfill('0') << std::setw(2) << ts.hour << ':' << std::setw(2) << ts.minute << ':'
           << std::setw(2) << ts.second;
        if (ts.microsecond % 1000 != 0)
            ss << '.' << std::setw(6) << ts.microsecond;
        else if (ts.microsecond != 0)
            ss << '.' << std::setw(3) << ts.microsecond / 1000;
        return ss.str();
    }

    std::string isoformat(const Timestamp& ts) {
        std::ostringstream ss;
        ss << isodate(ts) << 'T' << std::setfill('0') << std::setw(2) << ts.hour << ':'
           << std::setw(2) << ts.minute << ':' << std::setw(2) << ts.second;
        if (ts.microsecond != 0) ss << '.' << std::setw(6) << ts.microsecond;
        if (ts.utc_offset) {
            int offset = *ts.utc_offset;
            ss << (offset < 0 ? '-' : '+');
            offset = std::abs(offset);
            ss << std::setw(2) << offset / 60 << ':' << std::setw(2) << offset % 60;
        }
        return ss.str();
    }

    std::optional<Timestamp> from_iso(const std::string& text) {
        static const std::regex rx(
                    R"(^(\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.(\d{1,6}))?)?(Z|[+-]\d{2}:?\d{2})?)?$)");
        std::smatch m;
        if (!std::regex_match(text, m, rx)) return std::nullopt;
        Timestamp ts;
        ts.year = std::stoi(m[1].str());
        ts.month = std::stoi(m[2].str());
        ts.day = std::stoi(m[3].str());
        if (m[4].matched) {
            ts.hour = std::stoi(m[4].str());
            ts.minute = std::stoi(m[5].str());
        }
        if (m[6].matched) ts.second = std::stoi(m[6].str());
        if (m[7].matched) ts.microsecond = parse_fraction(m[7].str());
        if (m[8].matched) ts.utc_offset = parse_offset(m[8].str());
        if (!is_valid(ts)) return std::nullopt;
        return ts;
    }

    std::optional<Timestamp> from_iso_date(const std::string& text) {
        static const std::regex rx(R"(^(\d{4})-(\d{2})-(\d{2})$)");
        std::smatch m;
        if (!std::regex_match(text, m, rx)) return std::nullopt;
        Timestamp ts;
        ts.year = std::stoi(m[1].str());
        ts.month = std::stoi(m[2].str());
        ts.day = std::stoi(m[3].str());
        if (!is_valid(ts)) return std::nullopt;
        return ts;
    }

    std::optional<Timestamp> from_iso_time(const std::string& text) {
        static const std::regex rx(R"(^(\d{2}):(\d{2})(?::(\d{2})(?:\.(\d{1,6}))?)?$)");
        std::smatch m;
        if (!std::regex_match(text, m, rx)) return std::nullopt;
        Timestamp ts;
        ts.hour = std::stoi(m[1].str());
        ts.minute = std::stoi(m[2].str());
        if (m[3].matched) ts.second = std::stoi(m[3].str());
        if (m[4].matched) ts.microsecond = parse_fraction(m[4].str());
        if (!is_valid(ts)) return std::nullopt;
        return ts;
    }

    std::string rfcformat(const Timestamp& ts) {
        static const char* days[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
        static const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                       "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
        Timestamp utc = to_utc(ts);
        std::tm tm = to_tm(utc);
        std::ostringstream ss;
        ss << days[tm.tm_wday] << ", " << std::setfill('0') << std::setw(2) << utc.day << ' '
           << months[utc.month - 1] << ' ' << std::setw(4) << utc.year << ' ' << std::setw(2) << utc.hour
           << ':' << std::setw(2) << utc.minute << ':' << std::setw(2) << utc.second << " -0000";
        return ss.str();
    }

    std::optional<Timestamp> from_rfc(const std::string& text) {
        static const std::regex rx(
                    R"(^(?:[A-Za-z]{3}, )?(\d{1,2}) ([A-Za-z]{3}) (\d{4}) (\d{2}):(\d{2})(?::(\d{2}))? ([+-]\d{4}|GMT|UTC|Z)$)");
        static const std::string months = "JanFebMarAprMayJunJulAugSepOctNovDec";
        std::smatch m;
        if (!std::regex_match(text, m, rx)) return std::nullopt;
        auto month = months.find(m[2].str());
        if (month == std::string::npos or month % 3 != 0) return std::nullopt;
        Timestamp ts;
        ts.day = std::stoi(m[1].str());
        ts.month = static_cast<int>(month / 3) + 1;
        ts.year = std::stoi(m[3].str());
        ts.hour = std::stoi(m[4].str());
        ts.minute = std::stoi(m[5].str());
        if (m[6].matched) ts.second = std::stoi(m[6].str());
        std::string zone = m[7].str();
        if (zone[0] == '+' or zone[0] == '-')
            ts.utc_offset = parse_offset(zone);
        else
            ts.utc_offset = 0;
        if (!is_valid(ts)) return std::nullopt;
        return ts;
    }

    std::string format(const Timestamp& ts, const std::string& fmt) {
        std::tm tm = to_tm(ts);
        std::ostringstream ss;
        ss << std::put_time(&tm, fmt.c_str());
        return ss.str();
    }

    std::optional<Timestamp> parse(const std::string& text, const std::string& fmt) {
        std::tm tm{};
        tm.tm_year = 0;
        tm.tm_mday = 1;
        std::istringstream ss(text);
        ss >> std::get_time(&tm, fmt.c_str());
        if (ss.fail()) return std::nullopt;
        if (ss.peek() != std::char_traits<char>::eof()) return std::nullopt;
        Timestamp ts;
        ts.year = tm.tm_year + 1900;
        ts.month = tm.tm_mon + 1;
        ts.day = tm.tm_mday;
        ts.hour = tm.tm_hour;
        ts.minute = tm.tm_min;
        ts.second = tm.tm_sec;
        if (!is_valid(ts)) return std::nullopt;
        return ts;
    }

    int64_t to_epoch_seconds(const Timestamp& ts) {
        int64_t days = days_from_civil(ts.year, static_cast<unsigned>(ts.month),
                                       static_cast<unsigned>(ts.day));
        int64_t seconds = days * 86400 + ts.hour * 3600 + ts.minute * 60 + ts.second;
        return seconds - static_cast<int64_t>(ts.utc_offset.value_or(0)) * 60;
    }

    Timestamp from_epoch_seconds(int64_t seconds, int microsecond, int utc_offset) {
        int64_t local = seconds + static_cast<int64_t>(utc_offset) * 60;
        int64_t days = floor_div(local, 86400);
        int64_t rem = local - days * 86400;
        Timestamp ts;
        civil_from_days(days, ts.year, ts.month, ts.day);
        ts.hour = static_cast<int>(rem / 3600);
        ts.minute = static_cast<int>((rem % 3600) / 60);
        ts.second = static_cast<int>(rem % 60);
        ts.microsecond = microsecond;
        ts.utc_offset = utc_offset;
        return ts;
    }

    Timestamp to_utc(const Timestamp& ts) {
        if (!ts.aware()) {
            Timestamp out = ts;
            out.utc_offset = 0;
            return out;
        }
        return from_epoch_seconds(to_epoch_seconds(ts), ts.microsecond, 0);
    }

    Timestamp to_local(const Timestamp& ts) {
        auto t = static_cast<std::time_t>(to_epoch_seconds(ts));
        std::tm tm{};
        localtime_r(&t, &tm);
        Timestamp out;
        out.year = tm.tm_year + 1900;
        out.month = tm.tm_mon + 1;
        out.day = tm.tm_mday;
        out.hour = tm.tm_hour;
        out.minute = tm.tm_min;
        out.second = tm.tm_sec;
        out.microsecond = ts.microsecond;
        out.utc_offset = static_cast<int>(tm.tm_gmtoff / 60);
        return out;
    }

}  // namespace datetime
}  // namespace ms
