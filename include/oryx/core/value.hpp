#pragma once

#include <oryx/core/time.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace oryx {

/// Fixed-point decimal number: `units * 10^-scale`.
struct Decimal {
    std::int64_t units = 0;
    std::int32_t scale = 0;

    [[nodiscard]] static auto parse(std::string_view text) -> std::optional<Decimal>;
    [[nodiscard]] static auto from_double(double value, std::int32_t scale = 6) -> Decimal;

    /// Equal value with trailing fractional zeros removed.
    [[nodiscard]] auto normalized() const -> Decimal;
    [[nodiscard]] auto to_double() const -> double;
    [[nodiscard]] auto to_string() const -> std::string;

    friend auto operator==(const Decimal& lhs, const Decimal& rhs) -> bool;
};

struct Value;

/// Homogeneous sequence value.
struct Array {
    std::vector<Value> items;
};

/// Key/value pairs in insertion order.
struct Map {
    std::vector<std::pair<Value, Value>> entries;
};

/// Named elements in declaration order.
struct Struct {
    std::vector<std::pair<std::string, Value>> entries;
};

auto operator==(const Array& lhs, const Array& rhs) -> bool;
auto operator==(const Map& lhs, const Map& rhs) -> bool;
auto operator==(const Struct& lhs, const Struct& rhs) -> bool;

/// Native value as accepted by literals, kind reflection and casting.
struct Value {
    using Storage = std::variant<bool, std::int64_t, double, Decimal, std::string, Date,
                                 Timestamp, Array, Map, Struct>;

    Storage data;

    Value(bool v) : data(v) {}
    Value(int v) : data(static_cast<std::int64_t>(v)) {}
    Value(std::int64_t v) : data(v) {}
    Value(double v) : data(v) {}
    Value(Decimal v) : data(v) {}
    Value(const char* v) : data(std::string(v)) {}
    Value(std::string v) : data(std::move(v)) {}
    Value(Date v) : data(v) {}
    Value(Timestamp v) : data(v) {}
    Value(Array v) : data(std::move(v)) {}
    Value(Map v) : data(std::move(v)) {}
    Value(Struct v) : data(std::move(v)) {}

    template <typename T>
    [[nodiscard]] auto is() const noexcept -> bool {
        return std::holds_alternative<T>(data);
    }

    template <typename T>
    [[nodiscard]] auto get() const -> const T& {
        return std::get<T>(data);
    }

    template <typename T>
    [[nodiscard]] auto get_if() const noexcept -> const T* {
        return std::get_if<T>(&data);
    }

    [[nodiscard]] auto hash() const -> std::size_t;

    /// Source-like rendering (`'text'`, `1.5`, `[1, 2]`, `{'a': 1}`).
    [[nodiscard]] auto repr() const -> std::string;

    friend auto operator==(const Value& lhs, const Value& rhs) -> bool;
};

}  // namespace oryx

namespace std {

template <>
struct hash<oryx::Value> {
    auto operator()(const oryx::Value& v) const -> std::size_t { return v.hash(); }
};

}  // namespace std
