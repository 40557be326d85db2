#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace oryx {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Instant in nanoseconds since 1970-01-01T00:00:00Z (Unix epoch).
struct Timestamp {
    std::int64_t nanos = 0;
    auto operator<=>(const Timestamp&) const = default;
};

[[nodiscard]] auto make_date(int year, unsigned month, unsigned day) -> Date;

[[nodiscard]] auto make_timestamp(int year, unsigned month, unsigned day, int hour = 0,
                                  int minute = 0, int second = 0, std::int64_t micros = 0)
    -> Timestamp;

/// Calendar date of the given instant.
[[nodiscard]] auto date_of(Timestamp ts) -> Date;

/// Midnight of the given date.
[[nodiscard]] auto timestamp_of(Date date) -> Timestamp;

[[nodiscard]] auto year_of(Date date) -> int;

/// Parse `YYYY-MM-DD`.
[[nodiscard]] auto parse_date(std::string_view text) -> std::optional<Date>;

/// Parse `YYYY-MM-DD[( |T)HH:MM[:SS[.ffffff]]]`.
[[nodiscard]] auto parse_timestamp(std::string_view text) -> std::optional<Timestamp>;

/// `YYYY-MM-DD`.
[[nodiscard]] auto format_date(Date date) -> std::string;

/// `YYYY-MM-DD HH:MM:SS`, followed by `.ffffff` when the instant has a
/// sub-second part (always when `fraction` is set).
[[nodiscard]] auto format_timestamp(Timestamp ts, bool fraction = false) -> std::string;

}  // namespace oryx

namespace std {

template <>
struct hash<oryx::Date> {
    auto operator()(const oryx::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(d.days);
    }
};

template <>
struct hash<oryx::Timestamp> {
    auto operator()(const oryx::Timestamp& ts) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(ts.nanos);
    }
};

}  // namespace std
