#pragma once

#include <charconv>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <time.h>

namespace JsonWeave {

// Wall-clock timestamp with an optional UTC offset. Without an offset the value is naive,
// mirroring what an ISO-8601 string without a zone designator denotes.
class DateTime {
public:
    using duration   = std::chrono::microseconds;
    using local_time = std::chrono::local_time<duration>;

    DateTime() = default;
    explicit DateTime(local_time local, std::optional<std::chrono::minutes> utcOffset = std::nullopt)
        : m_local(local), m_offset(utcOffset)
    {}
    DateTime(std::chrono::year_month_day date,
             std::chrono::hours h, std::chrono::minutes m, std::chrono::seconds s,
             duration fraction = duration::zero(),
             std::optional<std::chrono::minutes> utcOffset = std::nullopt)
        : m_local(std::chrono::local_days{date} + h + m + s + fraction), m_offset(utcOffset)
    {}

    local_time local() const { return m_local; }
    std::optional<std::chrono::minutes> utcOffset() const { return m_offset; }
    bool isAware() const { return m_offset.has_value(); }

    std::chrono::year_month_day date() const {
        return std::chrono::year_month_day{std::chrono::floor<std::chrono::days>(m_local)};
    }
    std::chrono::hh_mm_ss<duration> timeOfDay() const {
        return std::chrono::hh_mm_ss<duration>{m_local - std::chrono::floor<std::chrono::days>(m_local)};
    }

    // Absolute instant; naive values have none
    std::optional<std::chrono::sys_time<duration>> toSys() const {
        if(!m_offset) return std::nullopt;
        return std::chrono::sys_time<duration>{m_local.time_since_epoch() - *m_offset};
    }

    friend bool operator==(const DateTime&, const DateTime&) = default;

private:
    local_time m_local{};
    std::optional<std::chrono::minutes> m_offset;
};

namespace temporal {

namespace detail {

struct Scanner {
    std::string_view s;
    std::size_t pos = 0;

    bool digits(std::size_t n, int& out) {
        if(pos + n > s.size()) return false;
        for(std::size_t i = 0; i < n; i ++) {
            if(s[pos + i] < '0' || s[pos + i] > '9') return false;
        }
        auto res = std::from_chars(s.data() + pos, s.data() + pos + n, out);
        if(res.ec != std::errc{}) return false;
        pos += n;
        return true;
    }
    bool literal(char c) {
        if(pos < s.size() && s[pos] == c) {
            pos ++;
            return true;
        }
        return false;
    }
    bool peekDigit() const {
        return pos < s.size() && s[pos] >= '0' && s[pos] <= '9';
    }
    bool done() const {
        return pos == s.size();
    }
};

inline std::optional<std::chrono::year_month_day> scanDate(Scanner& sc) {
    int y = 0, m = 0, d = 0;
    if(!sc.digits(4, y) || !sc.literal('-') || !sc.digits(2, m) || !sc.literal('-') || !sc.digits(2, d)) {
        return std::nullopt;
    }
    std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{unsigned(m)}, std::chrono::day{unsigned(d)}};
    if(!ymd.ok()) return std::nullopt;
    return ymd;
}

// ±HH:MM, ±HHMM, ±HH:MM:SS with zero seconds
inline std::optional<std::chrono::minutes> scanOffset(Scanner& sc) {
    int sign = 0;
    if(sc.literal('+')) sign = 1;
    else if(sc.literal('-')) sign = -1;
    else return std::nullopt;

    int hh = 0, mm = 0;
    if(!sc.digits(2, hh)) return std::nullopt;
    bool colon = sc.literal(':');
    if(!sc.digits(2, mm)) return std::nullopt;
    if(colon && sc.literal(':')) {
        int ss = 0;
        if(!sc.digits(2, ss) || ss != 0) return std::nullopt;
    }
    if(hh > 23 || mm > 59) return std::nullopt;
    return std::chrono::minutes{sign * (hh * 60 + mm)};
}

inline std::tm toTm(std::chrono::local_days day, std::chrono::hh_mm_ss<DateTime::duration> tod) {
    using namespace std::chrono;
    year_month_day ymd{day};
    std::tm tm{};
    tm.tm_year  = int(ymd.year()) - 1900;
    tm.tm_mon   = int(unsigned(ymd.month())) - 1;
    tm.tm_mday  = int(unsigned(ymd.day()));
    tm.tm_hour  = int(tod.hours().count());
    tm.tm_min   = int(tod.minutes().count());
    tm.tm_sec   = int(tod.seconds().count());
    tm.tm_wday  = int(weekday{day}.c_encoding());
    tm.tm_yday  = int((day - local_days{ymd.year() / January / 1}).count());
    tm.tm_isdst = 0;
    return tm;
}

inline std::optional<std::string> runStrftime(const std::tm& tm, const std::string& fmt) {
    if(fmt.empty()) return std::nullopt;
    char buf[256];
    std::size_t n = std::strftime(buf, sizeof(buf), fmt.c_str(), &tm);
    if(n == 0) return std::nullopt;
    return std::string(buf, n);
}

// Unparsed fields default to 1900-01-01 00:00:00
inline bool runStrptime(std::string_view text, const std::string& fmt, std::tm& tm) {
    tm = std::tm{};
    tm.tm_mday = 1;
    std::string input(text);
    const char* end = ::strptime(input.c_str(), fmt.c_str(), &tm);
    return end != nullptr && *end == '\0';
}

inline std::optional<std::chrono::year_month_day> dateFromTm(const std::tm& tm) {
    std::chrono::year_month_day ymd{std::chrono::year{tm.tm_year + 1900},
                                    std::chrono::month{unsigned(tm.tm_mon + 1)},
                                    std::chrono::day{unsigned(tm.tm_mday)}};
    if(!ymd.ok()) return std::nullopt;
    return ymd;
}

} // namespace detail

// YYYY-MM-DD
inline std::optional<std::chrono::year_month_day> parseIsoDate(std::string_view s) {
    detail::Scanner sc{s};
    auto ymd = detail::scanDate(sc);
    if(!ymd || !sc.done()) return std::nullopt;
    return ymd;
}

inline std::string formatIsoDate(const std::chrono::year_month_day& d) {
    return std::format("{:04}-{:02}-{:02}", int(d.year()), unsigned(d.month()), unsigned(d.day()));
}

// YYYY-MM-DD[(T| )HH:MM[:SS[.f{1,6}]]][Z|±HH:MM]
// A trailing Z is read as +00:00.
inline std::optional<DateTime> parseIsoDateTime(std::string_view s) {
    using namespace std::chrono;
    detail::Scanner sc{s};
    auto ymd = detail::scanDate(sc);
    if(!ymd) return std::nullopt;
    if(sc.done()) return DateTime(local_days{*ymd});

    if(!sc.literal('T') && !sc.literal('t') && !sc.literal(' ')) return std::nullopt;

    int hh = 0, mm = 0, ss = 0;
    if(!sc.digits(2, hh) || !sc.literal(':') || !sc.digits(2, mm)) return std::nullopt;
    if(sc.literal(':') && !sc.digits(2, ss)) return std::nullopt;
    if(hh > 23 || mm > 59 || ss > 59) return std::nullopt;

    long long micros = 0;
    if(sc.literal('.') || sc.literal(',')) {
        int count = 0;
        while(sc.peekDigit()) {
            if(count == 6) return std::nullopt;
            int d = 0;
            if(!sc.digits(1, d)) return std::nullopt;
            micros = micros * 10 + d;
            count ++;
        }
        if(count == 0) return std::nullopt;
        for(; count < 6; count ++) micros *= 10;
    }

    std::optional<minutes> offset;
    if(sc.literal('Z') || sc.literal('z')) {
        offset = minutes{0};
    } else if(!sc.done()) {
        offset = detail::scanOffset(sc);
        if(!offset) return std::nullopt;
    }
    if(!sc.done()) return std::nullopt;

    return DateTime(*ymd, hours{hh}, minutes{mm}, seconds{ss}, microseconds{micros}, offset);
}

// YYYY-MM-DDTHH:MM:SS[.ffffff][±HH:MM]; fractions only when non-zero, offset only when aware
inline std::string formatIsoDateTime(const DateTime& dt) {
    using namespace std::chrono;
    auto tod = dt.timeOfDay();
    std::string out = formatIsoDate(dt.date());
    out += std::format("T{:02}:{:02}:{:02}", tod.hours().count(), tod.minutes().count(), tod.seconds().count());
    if(tod.subseconds().count() != 0) {
        out += std::format(".{:06}", tod.subseconds().count());
    }
    if(auto off = dt.utcOffset()) {
        auto total = off->count();
        char sign = total < 0 ? '-' : '+';
        if(total < 0) total = -total;
        out += std::format("{}{:02}:{:02}", sign, total / 60, total % 60);
    }
    return out;
}

inline std::optional<std::string> formatDate(const std::chrono::year_month_day& d, const std::string& fmt) {
    using namespace std::chrono;
    std::tm tm = detail::toTm(local_days{d}, hh_mm_ss<DateTime::duration>{DateTime::duration::zero()});
    return detail::runStrftime(tm, fmt);
}

inline std::optional<std::chrono::year_month_day> parseDate(std::string_view s, const std::string& fmt) {
    std::tm tm{};
    if(!detail::runStrptime(s, fmt, tm)) return std::nullopt;
    return detail::dateFromTm(tm);
}

inline std::optional<std::string> formatDateTime(const DateTime& dt, const std::string& fmt) {
    using namespace std::chrono;
    std::tm tm = detail::toTm(floor<days>(dt.local()), dt.timeOfDay());
    if(auto off = dt.utcOffset()) {
        tm.tm_gmtoff = long(off->count()) * 60;
        tm.tm_zone = off->count() == 0 ? "UTC" : "";
    } else {
        tm.tm_zone = "";
    }
    return detail::runStrftime(tm, fmt);
}

// The result carries an offset only when the pattern parses one (%z)
inline std::optional<DateTime> parseDateTime(std::string_view s, const std::string& fmt) {
    using namespace std::chrono;
    std::tm tm{};
    if(!detail::runStrptime(s, fmt, tm)) return std::nullopt;
    auto ymd = detail::dateFromTm(tm);
    if(!ymd || tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 59) return std::nullopt;
    std::optional<minutes> offset;
    if(fmt.find("%z") != std::string::npos) {
        offset = minutes{tm.tm_gmtoff / 60};
    }
    return DateTime(*ymd, hours{tm.tm_hour}, minutes{tm.tm_min}, seconds{tm.tm_sec}, DateTime::duration::zero(), offset);
}

} // namespace temporal

} // namespace JsonWeave
