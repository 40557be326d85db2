#include <oryx/core/value.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <charconv>
#include <cmath>
#include <functional>

namespace oryx {

namespace {

auto combine(std::size_t seed, std::size_t value) -> std::size_t {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6U) + (seed >> 2U));
}

auto pow10(std::int32_t exponent) -> std::int64_t {
    std::int64_t result = 1;
    for (std::int32_t i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

auto format_double(double value) -> std::string {
    auto text = fmt::format("{}", value);
    if (std::isfinite(value) && text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

auto quote(std::string_view text) -> std::string {
    std::string out = "'";
    for (char c : text) {
        if (c == '\'') {
            out += '\\';
        }
        out += c;
    }
    out += '\'';
    return out;
}

}  // namespace

// ─── Decimal ─────────────────────────────────────────────────────────────────

auto Decimal::parse(std::string_view text) -> std::optional<Decimal> {
    if (text.empty()) {
        return std::nullopt;
    }
    bool negative = false;
    std::size_t pos = 0;
    if (text[0] == '-' || text[0] == '+') {
        negative = text[0] == '-';
        ++pos;
    }
    Decimal result;
    bool seen_point = false;
    bool seen_digit = false;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.' && !seen_point) {
            seen_point = true;
            continue;
        }
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        seen_digit = true;
        result.units = result.units * 10 + (c - '0');
        if (seen_point) {
            ++result.scale;
        }
    }
    if (!seen_digit) {
        return std::nullopt;
    }
    if (negative) {
        result.units = -result.units;
    }
    return result;
}

auto Decimal::from_double(double value, std::int32_t scale) -> Decimal {
    auto units = static_cast<std::int64_t>(std::llround(value * static_cast<double>(pow10(scale))));
    return Decimal{units, scale}.normalized();
}

auto Decimal::normalized() const -> Decimal {
    Decimal result = *this;
    while (result.scale > 0 && result.units % 10 == 0) {
        result.units /= 10;
        --result.scale;
    }
    return result;
}

auto Decimal::to_double() const -> double {
    return static_cast<double>(units) / static_cast<double>(pow10(scale));
}

auto Decimal::to_string() const -> std::string {
    if (scale == 0) {
        return fmt::format("{}", units);
    }
    auto magnitude = units < 0 ? -units : units;
    auto divisor = pow10(scale);
    return fmt::format("{}{}.{:0{}}", units < 0 ? "-" : "", magnitude / divisor,
                       magnitude % divisor, scale);
}

auto operator==(const Decimal& lhs, const Decimal& rhs) -> bool {
    auto left = lhs.normalized();
    auto right = rhs.normalized();
    return left.units == right.units && left.scale == right.scale;
}

// ─── Compound values ─────────────────────────────────────────────────────────

auto operator==(const Array& lhs, const Array& rhs) -> bool {
    return lhs.items == rhs.items;
}

auto operator==(const Map& lhs, const Map& rhs) -> bool {
    return lhs.entries == rhs.entries;
}

auto operator==(const Struct& lhs, const Struct& rhs) -> bool {
    return lhs.entries == rhs.entries;
}

auto operator==(const Value& lhs, const Value& rhs) -> bool {
    return lhs.data == rhs.data;
}

auto Value::hash() const -> std::size_t {
    std::size_t seed = data.index();
    std::visit(
        [&seed](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Decimal>) {
                auto norm = v.normalized();
                seed = combine(seed, std::hash<std::int64_t>{}(norm.units));
                seed = combine(seed, std::hash<std::int32_t>{}(norm.scale));
            } else if constexpr (std::is_same_v<T, Array>) {
                for (const auto& item : v.items) {
                    seed = combine(seed, item.hash());
                }
            } else if constexpr (std::is_same_v<T, Map>) {
                for (const auto& [key, value] : v.entries) {
                    seed = combine(combine(seed, key.hash()), value.hash());
                }
            } else if constexpr (std::is_same_v<T, Struct>) {
                for (const auto& [name, value] : v.entries) {
                    seed = combine(combine(seed, std::hash<std::string>{}(name)), value.hash());
                }
            } else {
                seed = combine(seed, std::hash<T>{}(v));
            }
        },
        data);
    return seed;
}

auto Value::repr() const -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return v ? "True" : "False";
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, double>) {
                return format_double(v);
            } else if constexpr (std::is_same_v<T, Decimal>) {
                return v.to_string();
            } else if constexpr (std::is_same_v<T, std::string>) {
                return quote(v);
            } else if constexpr (std::is_same_v<T, Date>) {
                return format_date(v);
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return format_timestamp(v);
            } else if constexpr (std::is_same_v<T, Array>) {
                std::vector<std::string> parts;
                for (const auto& item : v.items) {
                    parts.push_back(item.repr());
                }
                return fmt::format("[{}]", fmt::join(parts, ", "));
            } else if constexpr (std::is_same_v<T, Map>) {
                std::vector<std::string> parts;
                for (const auto& [key, value] : v.entries) {
                    parts.push_back(fmt::format("{}: {}", key.repr(), value.repr()));
                }
                return fmt::format("{{{}}}", fmt::join(parts, ", "));
            } else {
                std::vector<std::string> parts;
                for (const auto& [name, value] : v.entries) {
                    parts.push_back(fmt::format("{}: {}", quote(name), value.repr()));
                }
                return fmt::format("{{{}}}", fmt::join(parts, ", "));
            }
        },
        data);
}

}  // namespace oryx
