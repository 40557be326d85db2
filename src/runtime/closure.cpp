#include <oryx/runtime/closure.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <compare>
#include <cstdlib>
#include <limits>
#include <numeric>
#include <type_traits>
#include <unordered_set>

namespace oryx::runtime {

namespace {

// ─── Cell arithmetic ─────────────────────────────────────────────────────────

constexpr std::int64_t kIntMin = std::numeric_limits<std::int64_t>::min();

/// Integral double as int64; null when out of range or not finite.
auto to_integer(double value) -> Datum {
    // 2^63 is exactly representable; every double below it fits.
    constexpr double kLimit = 9223372036854775808.0;
    if (!std::isfinite(value) || value < -kLimit || value >= kLimit) {
        return std::nullopt;
    }
    return ScalarValue{static_cast<std::int64_t>(value)};
}

auto is_numeric(const ScalarValue& value) -> bool {
    return std::holds_alternative<std::int64_t>(value) || std::holds_alternative<double>(value);
}

auto as_double(const ScalarValue& value) -> double {
    if (const auto* v = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*v);
    }
    return std::get<double>(value);
}

auto compare(const ScalarValue& lhs, const ScalarValue& rhs) -> std::partial_ordering {
    if (is_numeric(lhs) && is_numeric(rhs)) {
        const auto* l = std::get_if<std::int64_t>(&lhs);
        const auto* r = std::get_if<std::int64_t>(&rhs);
        if (l != nullptr && r != nullptr) {
            return *l <=> *r;
        }
        return as_double(lhs) <=> as_double(rhs);
    }
    if (lhs.index() == rhs.index()) {
        return std::visit(
            [&rhs](const auto& l) -> std::partial_ordering {
                using T = std::decay_t<decltype(l)>;
                return l <=> std::get<T>(rhs);
            },
            lhs);
    }
    if (const auto* date = std::get_if<Date>(&lhs); date && std::holds_alternative<Timestamp>(rhs)) {
        return timestamp_of(*date) <=> std::get<Timestamp>(rhs);
    }
    if (const auto* date = std::get_if<Date>(&rhs); date && std::holds_alternative<Timestamp>(lhs)) {
        return std::get<Timestamp>(lhs) <=> timestamp_of(*date);
    }
    throw CastError(fmt::format("Incomparable values {} and {}", format_datum(lhs),
                                format_datum(rhs)));
}

/// Nulls sort first.
auto compare(const Datum& lhs, const Datum& rhs) -> std::partial_ordering {
    if (!lhs || !rhs) {
        return lhs.has_value() <=> rhs.has_value();
    }
    return compare(*lhs, *rhs);
}

auto truth(const Datum& datum) -> std::optional<bool> {
    if (!datum) {
        return std::nullopt;
    }
    if (const auto* v = std::get_if<bool>(&*datum)) {
        return *v;
    }
    throw CastError(fmt::format("Not a boolean value: {}", format_datum(datum)));
}

auto is_true(const Datum& datum) -> bool {
    auto value = truth(datum);
    return value.has_value() && *value;
}

auto arithmetic(dsl::Function function, const ScalarValue& lhs, const ScalarValue& rhs) -> Datum {
    if (!is_numeric(lhs) || !is_numeric(rhs)) {
        throw CastError(fmt::format("Invalid arithmetic operands {} and {}", format_datum(lhs),
                                    format_datum(rhs)));
    }
    const auto* l = std::get_if<std::int64_t>(&lhs);
    const auto* r = std::get_if<std::int64_t>(&rhs);
    if (l != nullptr && r != nullptr) {
        // Overflowing integer results are null, like division by zero.
        std::int64_t result = 0;
        switch (function) {
            case dsl::Function::Addition:
                if (__builtin_add_overflow(*l, *r, &result)) {
                    return std::nullopt;
                }
                return ScalarValue{result};
            case dsl::Function::Subtraction:
                if (__builtin_sub_overflow(*l, *r, &result)) {
                    return std::nullopt;
                }
                return ScalarValue{result};
            case dsl::Function::Multiplication:
                if (__builtin_mul_overflow(*l, *r, &result)) {
                    return std::nullopt;
                }
                return ScalarValue{result};
            case dsl::Function::Division:
                if (*r == 0 || (*l == kIntMin && *r == -1)) {
                    return std::nullopt;
                }
                return ScalarValue{*l / *r};
            case dsl::Function::Modulus:
                if (*r == 0) {
                    return std::nullopt;
                }
                if (*r == -1) {
                    return ScalarValue{std::int64_t{0}};
                }
                return ScalarValue{*l % *r};
            default:
                break;
        }
    }
    auto x = as_double(lhs);
    auto y = as_double(rhs);
    switch (function) {
        case dsl::Function::Addition:
            return ScalarValue{x + y};
        case dsl::Function::Subtraction:
            return ScalarValue{x - y};
        case dsl::Function::Multiplication:
            return ScalarValue{x * y};
        case dsl::Function::Division:
            if (y == 0.0) {
                return std::nullopt;
            }
            return ScalarValue{x / y};
        case dsl::Function::Modulus:
            if (y == 0.0) {
                return std::nullopt;
            }
            return ScalarValue{std::fmod(x, y)};
        default:
            break;
    }
    throw UnsupportedError(fmt::format("Not an arithmetic operator: {}", dsl::symbol(function)));
}

auto comparison(dsl::Function function, const ScalarValue& lhs, const ScalarValue& rhs) -> Datum {
    auto order = compare(lhs, rhs);
    switch (function) {
        case dsl::Function::LessThan:
            return ScalarValue{order < 0};
        case dsl::Function::LessEqual:
            return ScalarValue{order <= 0};
        case dsl::Function::GreaterThan:
            return ScalarValue{order > 0};
        case dsl::Function::GreaterEqual:
            return ScalarValue{order >= 0};
        case dsl::Function::Equal:
            return ScalarValue{order == 0};
        case dsl::Function::NotEqual:
            return ScalarValue{order != 0};
        default:
            break;
    }
    throw UnsupportedError(fmt::format("Not a comparison operator: {}", dsl::symbol(function)));
}

auto math(dsl::Function function, const ScalarValue& operand) -> Datum {
    if (const auto* v = std::get_if<std::int64_t>(&operand)) {
        if (function != dsl::Function::Abs) {
            return ScalarValue{*v};
        }
        if (*v == kIntMin) {
            return std::nullopt;
        }
        return ScalarValue{std::abs(*v)};
    }
    auto x = as_double(operand);
    switch (function) {
        case dsl::Function::Abs:
            return ScalarValue{std::fabs(x)};
        case dsl::Function::Ceil:
            return to_integer(std::ceil(x));
        case dsl::Function::Floor:
            return to_integer(std::floor(x));
        default:
            break;
    }
    throw UnsupportedError(fmt::format("Not a math function: {}", dsl::symbol(function)));
}

// ─── Row keys ────────────────────────────────────────────────────────────────

struct RowKey {
    std::vector<Datum> cells;
};

struct RowKeyHash {
    auto operator()(const RowKey& key) const -> std::size_t {
        std::size_t seed = 0;
        auto hash_combine = [&](std::size_t value) {
            seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        };
        for (const auto& cell : key.cells) {
            hash_combine(std::hash<Datum>{}(cell));
        }
        return seed;
    }
};

struct RowKeyEq {
    auto operator()(const RowKey& a, const RowKey& b) const -> bool { return a.cells == b.cells; }
};

auto row_key(const Table& table, std::size_t row) -> RowKey {
    RowKey key;
    key.cells.reserve(table.columns.size());
    for (std::size_t column = 0; column < table.columns.size(); ++column) {
        key.cells.push_back(table.at(column, row));
    }
    return key;
}

// ─── Table plumbing ──────────────────────────────────────────────────────────

/// Number of rows of a set of series, constants being broadcast.
auto common_length(const std::vector<Series>& inputs) -> std::size_t {
    std::optional<std::size_t> length;
    for (const auto& input : inputs) {
        if (input.size() == 1) {
            continue;
        }
        if (length && *length != input.size()) {
            throw StateError(fmt::format("Misaligned series of {} and {} rows", *length,
                                         input.size()));
        }
        length = input.size();
    }
    return length.value_or(1);
}

auto first(const Series& series) -> Datum {
    return series.size() == 0 ? std::nullopt : series.at(0);
}

/// Cells of a feature over `rows` rows.
auto cells(const Series& series, std::size_t rows) -> std::vector<Datum> {
    if (series.size() != 1 && series.size() != rows) {
        throw StateError(
            fmt::format("Misaligned series of {} rows in a table of {}", series.size(), rows));
    }
    std::vector<Datum> out;
    out.reserve(rows);
    for (std::size_t row = 0; row < rows; ++row) {
        out.push_back(series.at(row));
    }
    return out;
}

/// Positions of rows satisfying the predicate.
auto matching(const Columnizer& predicate, const Table& table) -> std::vector<std::size_t> {
    auto mask = cells(predicate(table), table.rows());
    std::vector<std::size_t> rows;
    for (std::size_t row = 0; row < mask.size(); ++row) {
        if (is_true(mask[row])) {
            rows.push_back(row);
        }
    }
    return rows;
}

auto combine(Table left, const Table& right) -> Table {
    left.columns.insert(left.columns.end(), right.columns.begin(), right.columns.end());
    return left;
}

/// Append the rows of `tail` to `head` column by column.
auto concatenate(const Table& head, const Table& tail) -> Table {
    if (head.columns.size() != tail.columns.size()) {
        throw StateError(fmt::format("Incompatible set operands of {} and {} columns",
                                     head.columns.size(), tail.columns.size()));
    }
    Table output;
    for (std::size_t c = 0; c < head.columns.size(); ++c) {
        const auto& entry = head.columns[c];
        std::vector<Datum> values;
        values.reserve(head.rows() + tail.rows());
        for (std::size_t row = 0; row < head.rows(); ++row) {
            values.push_back(head.at(c, row));
        }
        for (std::size_t row = 0; row < tail.rows(); ++row) {
            values.push_back(tail.at(c, row));
        }
        auto series = std::visit(
            [&values](const auto& col) {
                using T = typename std::decay_t<decltype(col)>::value_type;
                Series out{Column<T>{}, std::nullopt};
                std::vector<bool> validity(values.size(), true);
                auto& target = std::get<Column<T>>(out.values);
                for (std::size_t row = 0; row < values.size(); ++row) {
                    if (!values[row]) {
                        target.push_back(T{});
                        validity[row] = false;
                    } else if (const auto* v = std::get_if<T>(&*values[row])) {
                        target.push_back(*v);
                    } else {
                        throw CastError(fmt::format("Incompatible set operand value {}",
                                                    format_datum(values[row])));
                    }
                }
                if (std::find(validity.begin(), validity.end(), false) != validity.end()) {
                    out.validity = std::move(validity);
                }
                return out;
            },
            *entry.column);
        output.add_column(entry.qualifier, entry.name, std::move(series));
    }
    return output;
}

auto join_tables(const Table& left, const Table& right, const std::optional<Columnizer>& condition,
                 dsl::JoinKind kind) -> Table {
    std::vector<std::optional<std::size_t>> left_rows;
    std::vector<std::optional<std::size_t>> right_rows;
    std::vector<bool> right_matched(right.rows(), false);

    for (std::size_t i = 0; i < left.rows(); ++i) {
        bool matched = false;
        if (!condition) {
            for (std::size_t j = 0; j < right.rows(); ++j) {
                left_rows.emplace_back(i);
                right_rows.emplace_back(j);
            }
            continue;
        }
        if (right.rows() > 0) {
            // Nested loop: evaluate the condition for this left row against all right rows.
            auto pairs = combine(left.take(std::vector<std::size_t>(right.rows(), i)), right);
            for (auto j : matching(*condition, pairs)) {
                left_rows.emplace_back(i);
                right_rows.emplace_back(j);
                right_matched[j] = true;
                matched = true;
            }
        }
        if (!matched && (kind == dsl::JoinKind::Left || kind == dsl::JoinKind::Full)) {
            left_rows.emplace_back(i);
            right_rows.emplace_back(std::nullopt);
        }
    }
    if (kind == dsl::JoinKind::Right || kind == dsl::JoinKind::Full) {
        for (std::size_t j = 0; j < right.rows(); ++j) {
            if (!right_matched[j]) {
                left_rows.emplace_back(std::nullopt);
                right_rows.emplace_back(j);
            }
        }
    }
    return combine(left.take(left_rows), right.take(right_rows));
}

auto set_tables(const Table& left, const Table& right, dsl::SetKind kind) -> Table {
    if (kind == dsl::SetKind::Union) {
        auto all = concatenate(left, right);
        robin_hood::unordered_flat_set<RowKey, RowKeyHash, RowKeyEq> seen;
        std::vector<std::size_t> rows;
        for (std::size_t row = 0; row < all.rows(); ++row) {
            if (seen.insert(row_key(all, row)).second) {
                rows.push_back(row);
            }
        }
        return all.take(rows);
    }
    // Validates column compatibility.
    static_cast<void>(concatenate(left.take(std::vector<std::size_t>{}),
                                  right.take(std::vector<std::size_t>{})));
    robin_hood::unordered_flat_set<RowKey, RowKeyHash, RowKeyEq> other;
    for (std::size_t row = 0; row < right.rows(); ++row) {
        other.insert(row_key(right, row));
    }
    robin_hood::unordered_flat_set<RowKey, RowKeyHash, RowKeyEq> seen;
    std::vector<std::size_t> rows;
    for (std::size_t row = 0; row < left.rows(); ++row) {
        auto key = row_key(left, row);
        bool found = other.count(key) > 0;
        if ((kind == dsl::SetKind::Intersection) != found) {
            continue;
        }
        if (seen.insert(std::move(key)).second) {
            rows.push_back(row);
        }
    }
    return left.take(rows);
}

/// Row positions of each group, groups in order of first appearance. No
/// grouping features make a single group of all rows.
auto group_rows(const Table& table, const std::vector<Columnizer>& grouping)
    -> std::vector<std::vector<std::size_t>> {
    std::vector<std::vector<std::size_t>> groups;
    if (grouping.empty()) {
        groups.emplace_back(table.rows());
        std::iota(groups.front().begin(), groups.front().end(), std::size_t{0});
        return groups;
    }
    std::vector<std::vector<Datum>> keys;
    keys.reserve(grouping.size());
    for (const auto& feature : grouping) {
        keys.push_back(cells(feature(table), table.rows()));
    }
    robin_hood::unordered_flat_map<RowKey, std::size_t, RowKeyHash, RowKeyEq> index;
    for (std::size_t row = 0; row < table.rows(); ++row) {
        RowKey key;
        key.cells.reserve(keys.size());
        for (const auto& column : keys) {
            key.cells.push_back(column[row]);
        }
        auto [it, inserted] = index.try_emplace(std::move(key), groups.size());
        if (inserted) {
            groups.emplace_back();
        }
        groups[it->second].push_back(row);
    }
    return groups;
}

auto is_aggregate(dsl::Function function) -> bool {
    return dsl::category(function) == dsl::Category::Aggregate;
}

}  // namespace

// ─── Evaluation ──────────────────────────────────────────────────────────────

auto apply(const dsl::Expression& expression, const std::vector<Datum>& operands) -> Datum {
    auto function = expression.function();
    switch (function) {
        case dsl::Function::IsNull:
            return ScalarValue{!operands[0].has_value()};
        case dsl::Function::NotNull:
            return ScalarValue{operands[0].has_value()};
        case dsl::Function::And: {
            auto lhs = truth(operands[0]);
            auto rhs = truth(operands[1]);
            if ((lhs && !*lhs) || (rhs && !*rhs)) {
                return ScalarValue{false};
            }
            if (!lhs || !rhs) {
                return std::nullopt;
            }
            return ScalarValue{true};
        }
        case dsl::Function::Or: {
            auto lhs = truth(operands[0]);
            auto rhs = truth(operands[1]);
            if ((lhs && *lhs) || (rhs && *rhs)) {
                return ScalarValue{true};
            }
            if (!lhs || !rhs) {
                return std::nullopt;
            }
            return ScalarValue{false};
        }
        case dsl::Function::Not: {
            auto value = truth(operands[0]);
            if (!value) {
                return std::nullopt;
            }
            return ScalarValue{!*value};
        }
        default:
            break;
    }
    if (std::ranges::any_of(operands, [](const Datum& d) { return !d.has_value(); })) {
        return std::nullopt;
    }
    switch (dsl::category(function)) {
        case dsl::Category::Arithmetic:
            return arithmetic(function, *operands[0], *operands[1]);
        case dsl::Category::Comparison:
            return comparison(function, *operands[0], *operands[1]);
        case dsl::Category::Conversion:
            return to_datum(expression.target()->cast(to_value(*operands[0])));
        case dsl::Category::Datetime: {
            const auto& value = *operands[0];
            auto date = std::holds_alternative<Timestamp>(value)
                            ? date_of(std::get<Timestamp>(value))
                            : std::get<Date>(value);
            return ScalarValue{static_cast<std::int64_t>(year_of(date))};
        }
        case dsl::Category::Math:
            return math(function, *operands[0]);
        default:
            break;
    }
    throw StateError(fmt::format("Aggregate {} applied to a single row", expression.repr()));
}

auto reduce(dsl::Function function, const Series* series, std::size_t rows) -> Datum {
    if (series == nullptr) {
        if (function != dsl::Function::Count) {
            throw StateError(fmt::format("{} requires an operand", dsl::symbol(function)));
        }
        return ScalarValue{static_cast<std::int64_t>(rows)};
    }
    std::vector<ScalarValue> values;
    values.reserve(rows);
    for (auto& cell : cells(*series, rows)) {
        if (cell) {
            values.push_back(std::move(*cell));
        }
    }
    if (function == dsl::Function::Count) {
        return ScalarValue{static_cast<std::int64_t>(values.size())};
    }
    if (values.empty()) {
        return std::nullopt;
    }
    switch (function) {
        case dsl::Function::Min:
            return *std::ranges::min_element(
                values, [](const auto& a, const auto& b) { return compare(a, b) < 0; });
        case dsl::Function::Max:
            return *std::ranges::max_element(
                values, [](const auto& a, const auto& b) { return compare(a, b) < 0; });
        case dsl::Function::Sum: {
            Datum total = values.front();
            for (std::size_t i = 1; i < values.size() && total.has_value(); ++i) {
                total = arithmetic(dsl::Function::Addition, *total, values[i]);
            }
            return total;
        }
        case dsl::Function::Avg: {
            double total = 0.0;
            for (const auto& value : values) {
                total += as_double(value);
            }
            return ScalarValue{total / static_cast<double>(values.size())};
        }
        default:
            break;
    }
    throw UnsupportedError(fmt::format("Not an aggregate function: {}", dsl::symbol(function)));
}

// ─── Generator ───────────────────────────────────────────────────────────────

auto Generator::resolve_source(const dsl::Source& source) -> std::optional<Tabulizer> {
    if (auto mapped = Visitor::resolve_source(source)) {
        return mapped;
    }
    if (source.type() != dsl::SourceType::Table) {
        return std::nullopt;
    }
    auto name = static_cast<const dsl::Table&>(source).name();
    return Tabulizer{name, [name](const Catalog& catalog) -> Table {
                         auto it = catalog.find(name);
                         if (it == catalog.end()) {
                             throw UnprovisionedError(fmt::format("Unknown table {}", name));
                         }
                         return it->second.qualified(name);
                     }};
}

auto Generator::resolve_feature(const dsl::Feature& feature) -> std::optional<Columnizer> {
    if (auto mapped = Visitor::resolve_feature(feature)) {
        return mapped;
    }
    if (feature.type() != dsl::FeatureType::Element) {
        return std::nullopt;
    }
    const auto& element = static_cast<const dsl::Element&>(feature);
    return Columnizer{element.field(), element.kind(), false, nullptr};
}

auto Generator::generate_element(const Tabulizer& origin, const Columnizer& element)
    -> Columnizer {
    if (element.eval) {
        return element;
    }
    if (!element.name) {
        throw UnprovisionedError("Element mapping without a column name");
    }
    Columnizer result = element;
    result.eval = [qualifier = origin.handle, name = *element.name](const Table& table) {
        const auto* entry = table.find(qualifier, name);
        if (entry == nullptr) {
            throw UnprovisionedError(fmt::format("Unknown column {}.{}", qualifier, name));
        }
        return table.series(*entry);
    };
    return result;
}

auto Generator::generate_alias(const Columnizer& feature, const std::string& alias)
    -> Columnizer {
    Columnizer result = feature;
    result.name = alias;
    return result;
}

auto Generator::generate_literal(const Value& value, const dsl::KindPtr& kind) -> Columnizer {
    auto series = Series::of(*kind, {to_datum(value)});
    return Columnizer{std::nullopt, kind, false,
                      [series = std::move(series)](const Table&) { return series; }};
}

auto Generator::generate_expression(const dsl::Expression& expression,
                                    const std::vector<Columnizer>& arguments) -> Columnizer {
    auto function = expression.function();
    Columnizer result;
    result.kind = function == dsl::Function::Avg ? dsl::Kind::floating() : expression.kind();
    result.aggregate = is_aggregate(function) ||
                       std::ranges::any_of(arguments, [](const auto& a) { return a.aggregate; });

    if (is_aggregate(function)) {
        std::optional<Columnizer> operand;
        if (!arguments.empty()) {
            operand = arguments.front();
        }
        result.eval = [function, operand, kind = result.kind](const Table& table) {
            Datum value;
            if (operand) {
                auto series = (*operand)(table);
                value = reduce(function, &series, table.rows());
            } else {
                value = reduce(function, nullptr, table.rows());
            }
            return Series::of(*kind, {value});
        };
        return result;
    }

    auto node = std::static_pointer_cast<const dsl::Expression>(expression.self());
    result.eval = [node, arguments, kind = result.kind](const Table& table) {
        std::vector<Series> inputs;
        inputs.reserve(arguments.size());
        for (const auto& argument : arguments) {
            inputs.push_back(argument(table));
        }
        auto rows = common_length(inputs);
        std::vector<Datum> out;
        out.reserve(rows);
        std::vector<Datum> operands(inputs.size());
        for (std::size_t row = 0; row < rows; ++row) {
            for (std::size_t i = 0; i < inputs.size(); ++i) {
                operands[i] = inputs[i].at(row);
            }
            out.push_back(apply(*node, operands));
        }
        return Series::of(*kind, out);
    };
    return result;
}

auto Generator::generate_table(const Tabulizer& table, const std::vector<Columnizer>& features,
                               const std::optional<Columnizer>& predicate) -> Tabulizer {
    if (predicate) {
        spdlog::debug("Leaving pushed-down predicate of {} to the query filter", table.handle);
    }
    if (features.empty() ||
        std::ranges::any_of(features, [](const auto& f) { return !f.name.has_value(); })) {
        return table;
    }
    std::unordered_set<std::string> names;
    for (const auto& feature : features) {
        names.insert(*feature.name);
    }
    spdlog::debug("Projecting {} onto {} columns", table.handle, names.size());
    return Tabulizer{table.handle, [table, names](const Catalog& catalog) {
                         auto loaded = table(catalog);
                         Table projected;
                         for (const auto& entry : loaded.columns) {
                             if (names.contains(entry.name)) {
                                 projected.columns.push_back(entry);
                             }
                         }
                         // Mapped features may name computed columns; keep
                         // the whole table then.
                         if (projected.columns.size() != names.size()) {
                             return loaded;
                         }
                         return projected;
                     }};
}

auto Generator::generate_reference(const Tabulizer& instance, const std::string& name)
    -> std::pair<Tabulizer, Tabulizer> {
    Tabulizer reference{name, [instance, name](const Catalog& catalog) {
                            return instance(catalog).qualified(name);
                        }};
    return {reference, reference};
}

auto Generator::generate_join(const Tabulizer& left, const Tabulizer& right,
                              const std::optional<Columnizer>& condition, dsl::JoinKind kind)
    -> Tabulizer {
    return Tabulizer{std::string{}, [left, right, condition, kind](const Catalog& catalog) {
                         return join_tables(left(catalog), right(catalog), condition, kind);
                     }};
}

auto Generator::generate_set(const Tabulizer& left, const Tabulizer& right, dsl::SetKind kind)
    -> Tabulizer {
    return Tabulizer{std::string{}, [left, right, kind](const Catalog& catalog) {
                         return set_tables(left(catalog), right(catalog), kind);
                     }};
}

auto Generator::generate_query(const Tabulizer& source, const std::vector<Columnizer>& features,
                               const std::optional<Columnizer>& where,
                               const std::vector<Columnizer>& groupby,
                               const std::optional<Columnizer>& having,
                               const std::vector<OrderSymbol>& orderby,
                               const std::optional<dsl::Rows>& rows) -> Tabulizer {
    auto aggregated = [](const Columnizer& c) { return c.aggregate; };
    bool grouped = !groupby.empty() || std::ranges::any_of(features, aggregated) ||
                   (having && having->aggregate) ||
                   std::ranges::any_of(orderby, [](const auto& o) { return o.first.aggregate; });

    auto load = [=](const Catalog& catalog) -> Table {
        auto input = source(catalog);
        if (where) {
            input = input.take(matching(*where, input));
        }

        std::vector<std::vector<Datum>> columns(features.size());
        std::vector<std::vector<Datum>> keys(orderby.size());
        std::size_t count = 0;
        if (grouped) {
            for (const auto& members : group_rows(input, groupby)) {
                auto group = input.take(members);
                if (having && !is_true(first((*having)(group)))) {
                    continue;
                }
                for (std::size_t f = 0; f < features.size(); ++f) {
                    columns[f].push_back(first(features[f](group)));
                }
                for (std::size_t o = 0; o < orderby.size(); ++o) {
                    keys[o].push_back(first(orderby[o].first(group)));
                }
                ++count;
            }
        } else {
            if (having) {
                input = input.take(matching(*having, input));
            }
            count = input.rows();
            for (std::size_t f = 0; f < features.size(); ++f) {
                columns[f] = cells(features[f](input), count);
            }
            for (std::size_t o = 0; o < orderby.size(); ++o) {
                keys[o] = cells(orderby[o].first(input), count);
            }
        }

        std::vector<std::size_t> order(count);
        std::iota(order.begin(), order.end(), std::size_t{0});
        if (!orderby.empty()) {
            std::ranges::stable_sort(order, [&](std::size_t a, std::size_t b) {
                for (std::size_t o = 0; o < orderby.size(); ++o) {
                    auto cmp = compare(keys[o][a], keys[o][b]);
                    if (cmp == 0) {
                        continue;
                    }
                    bool less = cmp < 0;
                    return orderby[o].second == dsl::Direction::Ascending ? less : !less;
                }
                return false;
            });
        }
        if (rows) {
            auto offset = static_cast<std::size_t>(std::max<std::int64_t>(rows->offset, 0));
            auto limit = static_cast<std::size_t>(std::max<std::int64_t>(rows->count, 0));
            offset = std::min(offset, order.size());
            order = std::vector<std::size_t>(
                order.begin() + static_cast<std::ptrdiff_t>(offset),
                order.begin() + static_cast<std::ptrdiff_t>(std::min(order.size(), offset + limit)));
        }

        Table output;
        for (std::size_t f = 0; f < features.size(); ++f) {
            std::vector<Datum> values;
            values.reserve(order.size());
            for (auto row : order) {
                values.push_back(columns[f][row]);
            }
            auto name = features[f].name.value_or(fmt::format("_{}", f));
            output.add_column(std::string{}, std::move(name),
                              Series::of(*features[f].kind, values));
        }
        return output;
    };
    return Tabulizer{std::string{}, std::move(load)};
}

auto compile(const dsl::SourcePtr& statement, Generator::SourceMap sources,
             Generator::FeatureMap features) -> std::expected<Tabulizer, CompileError> {
    try {
        Generator generator(std::move(sources), std::move(features));
        auto closure = generator.compile(statement);
        spdlog::debug("Compiled {} to a closure", statement->repr());
        return closure;
    } catch (const Error& error) {
        return std::unexpected(CompileError{error.what()});
    }
}

auto execute(const dsl::SourcePtr& statement, const Catalog& catalog)
    -> std::expected<Table, CompileError> {
    auto closure = compile(statement);
    if (!closure) {
        return std::unexpected(closure.error());
    }
    try {
        return (*closure)(catalog);
    } catch (const Error& error) {
        return std::unexpected(CompileError{error.what()});
    }
}

}  // namespace oryx::runtime
