#include <oryx/core/time.hpp>

#include <fmt/format.h>

#include <charconv>
#include <chrono>

namespace oryx {

namespace {

constexpr std::int64_t kNanosPerMicro = 1'000;
constexpr std::int64_t kNanosPerSecond = 1'000'000'000;

auto parse_int(std::string_view text, std::size_t pos, std::size_t width, int& out) -> bool {
    if (pos + width > text.size()) {
        return false;
    }
    const char* begin = text.data() + pos;
    const char* end = begin + width;
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

}  // namespace

auto make_date(int year, unsigned month, unsigned day) -> Date {
    using namespace std::chrono;
    sys_days days_since{year_month_day{std::chrono::year{year}, std::chrono::month{month},
                                       std::chrono::day{day}}};
    return Date{static_cast<std::int32_t>(days_since.time_since_epoch().count())};
}

auto make_timestamp(int year, unsigned month, unsigned day, int hour, int minute, int second,
                    std::int64_t micros) -> Timestamp {
    auto date = make_date(year, month, day);
    std::int64_t seconds = static_cast<std::int64_t>(date.days) * 86'400 + hour * 3'600 +
                           minute * 60 + second;
    return Timestamp{seconds * kNanosPerSecond + micros * kNanosPerMicro};
}

auto date_of(Timestamp ts) -> Date {
    using namespace std::chrono;
    sys_time<nanoseconds> tp{nanoseconds{ts.nanos}};
    return Date{static_cast<std::int32_t>(floor<days>(tp).time_since_epoch().count())};
}

auto timestamp_of(Date date) -> Timestamp {
    return Timestamp{static_cast<std::int64_t>(date.days) * 86'400 * kNanosPerSecond};
}

auto year_of(Date date) -> int {
    using namespace std::chrono;
    year_month_day ymd{sys_days{days{date.days}}};
    return static_cast<int>(ymd.year());
}

auto parse_date(std::string_view text) -> std::optional<Date> {
    int year = 0;
    int month = 0;
    int day = 0;
    if (text.size() != 10 || text[4] != '-' || text[7] != '-' || !parse_int(text, 0, 4, year) ||
        !parse_int(text, 5, 2, month) || !parse_int(text, 8, 2, day)) {
        return std::nullopt;
    }
    std::chrono::year_month_day ymd{std::chrono::year{year},
                                    std::chrono::month{static_cast<unsigned>(month)},
                                    std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return make_date(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

auto parse_timestamp(std::string_view text) -> std::optional<Timestamp> {
    auto date = parse_date(text.substr(0, 10));
    if (!date) {
        return std::nullopt;
    }
    if (text.size() == 10) {
        return timestamp_of(*date);
    }
    if (text[10] != ' ' && text[10] != 'T') {
        return std::nullopt;
    }
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!parse_int(text, 11, 2, hour) || text.size() < 16 || text[13] != ':' ||
        !parse_int(text, 14, 2, minute)) {
        return std::nullopt;
    }
    std::size_t pos = 16;
    if (pos < text.size() && text[pos] == ':') {
        if (!parse_int(text, pos + 1, 2, second)) {
            return std::nullopt;
        }
        pos += 3;
    }
    std::int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        std::size_t digits = 0;
        for (++pos; pos < text.size() && digits < 9; ++pos, ++digits) {
            char c = text[pos];
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            nanos = nanos * 10 + (c - '0');
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (; digits < 9; ++digits) {
            nanos *= 10;
        }
    }
    if (pos != text.size() || hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }
    auto base = timestamp_of(*date);
    return Timestamp{base.nanos +
                     (static_cast<std::int64_t>(hour) * 3'600 + minute * 60 + second) *
                         kNanosPerSecond +
                     nanos};
}

auto format_date(Date date) -> std::string {
    using namespace std::chrono;
    year_month_day ymd{sys_days{days{date.days}}};
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

auto format_timestamp(Timestamp ts, bool fraction) -> std::string {
    using namespace std::chrono;
    sys_time<nanoseconds> tp{nanoseconds{ts.nanos}};
    auto day = floor<days>(tp);
    year_month_day ymd{day};
    hh_mm_ss<nanoseconds> hms{tp - day};
    auto text = fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}", static_cast<int>(ymd.year()),
                            static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                            hms.hours().count(), hms.minutes().count(), hms.seconds().count());
    auto micros = hms.subseconds().count() / kNanosPerMicro;
    if (fraction || micros != 0) {
        text += fmt::format(".{:06}", micros);
    }
    return text;
}

}  // namespace oryx
