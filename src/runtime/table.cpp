#include <oryx/core/error.hpp>
#include <oryx/runtime/table.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <type_traits>

namespace oryx::runtime {

namespace {

auto column_size(const ColumnValue& column) -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

/// Store a non-null cell in a column of element type T.
template <typename T>
auto convert(const ScalarValue& value) -> T {
    if (const auto* v = std::get_if<T>(&value)) {
        return *v;
    }
    if constexpr (std::is_same_v<T, double>) {
        if (const auto* v = std::get_if<std::int64_t>(&value)) {
            return static_cast<double>(*v);
        }
    } else if constexpr (std::is_same_v<T, std::int64_t>) {
        if (const auto* v = std::get_if<double>(&value)) {
            return static_cast<std::int64_t>(std::trunc(*v));
        }
    } else if constexpr (std::is_same_v<T, Timestamp>) {
        if (const auto* v = std::get_if<Date>(&value)) {
            return timestamp_of(*v);
        }
    }
    throw CastError(fmt::format("Cannot store {} in a column of different type",
                                format_datum(value)));
}

auto header(const ColumnEntry& entry) -> std::string {
    return entry.qualifier.empty() ? entry.name : fmt::format("{}.{}", entry.qualifier, entry.name);
}

}  // namespace

auto make_column(const dsl::Kind& kind) -> ColumnValue {
    switch (kind.id()) {
        case dsl::KindId::Boolean:
            return Column<bool>{};
        case dsl::KindId::Integer:
            return Column<std::int64_t>{};
        case dsl::KindId::Float:
        case dsl::KindId::Decimal:
            return Column<double>{};
        case dsl::KindId::String:
            return Column<std::string>{};
        case dsl::KindId::Date:
            return Column<Date>{};
        case dsl::KindId::Timestamp:
            return Column<Timestamp>{};
        default:
            break;
    }
    throw UnsupportedError(fmt::format("Unsupported column kind {}", kind.name()));
}

auto to_datum(const Value& value) -> Datum {
    return std::visit(
        [&value](const auto& v) -> Datum {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Decimal>) {
                return v.to_double();
            } else if constexpr (std::is_same_v<T, Array> || std::is_same_v<T, Map> ||
                                 std::is_same_v<T, Struct>) {
                throw UnsupportedError(fmt::format("Unsupported cell value {}", value.repr()));
            } else {
                return ScalarValue{v};
            }
        },
        value.data);
}

auto to_value(const ScalarValue& value) -> Value {
    return std::visit([](const auto& v) { return Value(v); }, value);
}

auto format_datum(const Datum& datum) -> std::string {
    if (!datum) {
        return "null";
    }
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Date>) {
                return format_date(v);
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return format_timestamp(v);
            } else {
                return fmt::format("{}", v);
            }
        },
        *datum);
}

// ─── Series ──────────────────────────────────────────────────────────────────

auto Series::of(const dsl::Kind& kind, const std::vector<Datum>& cells) -> Series {
    Series series{make_column(kind), std::nullopt};
    std::vector<bool> validity(cells.size(), true);
    bool has_nulls = false;
    std::visit(
        [&](auto& col) {
            using T = typename std::decay_t<decltype(col)>::value_type;
            col.reserve(cells.size());
            for (std::size_t row = 0; row < cells.size(); ++row) {
                if (!cells[row]) {
                    col.push_back(T{});
                    validity[row] = false;
                    has_nulls = true;
                } else {
                    col.push_back(convert<T>(*cells[row]));
                }
            }
        },
        series.values);
    if (has_nulls) {
        series.validity = std::move(validity);
    }
    return series;
}

auto Series::size() const noexcept -> std::size_t {
    return column_size(values);
}

auto Series::at(std::size_t row) const -> Datum {
    if (size() == 1) {
        row = 0;
    }
    if (is_null(row)) {
        return std::nullopt;
    }
    return std::visit([row](const auto& col) -> Datum { return ScalarValue{col[row]}; }, values);
}

// ─── Table ───────────────────────────────────────────────────────────────────

void Table::add_column(std::string name, ColumnValue column) {
    add_column(std::string{}, std::move(name), Series{std::move(column), std::nullopt});
}

void Table::add_column(std::string name, ColumnValue column, std::vector<bool> validity) {
    add_column(std::string{}, std::move(name), Series{std::move(column), std::move(validity)});
}

void Table::add_column(std::string qualifier, std::string name, Series series) {
    auto column = std::make_shared<ColumnValue>(std::move(series.values));
    for (auto& entry : columns) {
        if (entry.qualifier == qualifier && entry.name == name) {
            // Reseat the shared_ptr rather than mutating shared data (copy-on-write).
            entry.column = std::move(column);
            entry.validity = std::move(series.validity);
            return;
        }
    }
    columns.push_back(ColumnEntry{.qualifier = std::move(qualifier),
                                  .name = std::move(name),
                                  .column = std::move(column),
                                  .validity = std::move(series.validity)});
}

auto Table::find(const std::string& name) const -> const ColumnEntry* {
    auto it = std::ranges::find_if(columns, [&](const auto& entry) { return entry.name == name; });
    return it == columns.end() ? nullptr : &*it;
}

auto Table::find(const std::string& qualifier, const std::string& name) const
    -> const ColumnEntry* {
    auto it = std::ranges::find_if(columns, [&](const auto& entry) {
        return entry.qualifier == qualifier && entry.name == name;
    });
    return it == columns.end() ? nullptr : &*it;
}

auto Table::rows() const noexcept -> std::size_t {
    if (columns.empty()) {
        return 0;
    }
    return column_size(*columns.front().column);
}

auto Table::qualified(const std::string& qualifier) const -> Table {
    Table output = *this;
    for (auto& entry : output.columns) {
        entry.qualifier = qualifier;
    }
    return output;
}

auto Table::take(const std::vector<std::size_t>& rows) const -> Table {
    Table output;
    output.columns.reserve(columns.size());
    for (const auto& entry : columns) {
        auto column = std::visit([&](const auto& col) -> ColumnValue { return col.take(rows); },
                                 *entry.column);
        std::optional<std::vector<bool>> validity;
        if (entry.validity) {
            validity.emplace();
            validity->reserve(rows.size());
            for (auto row : rows) {
                validity->push_back((*entry.validity)[row]);
            }
        }
        output.columns.push_back(ColumnEntry{.qualifier = entry.qualifier,
                                             .name = entry.name,
                                             .column = std::make_shared<ColumnValue>(std::move(column)),
                                             .validity = std::move(validity)});
    }
    return output;
}

auto Table::take(const std::vector<std::optional<std::size_t>>& rows) const -> Table {
    Table output;
    output.columns.reserve(columns.size());
    for (const auto& entry : columns) {
        std::vector<bool> validity(rows.size(), true);
        auto column = std::visit(
            [&](const auto& col) -> ColumnValue {
                using ColType = std::decay_t<decltype(col)>;
                using T = typename ColType::value_type;
                ColType result;
                result.reserve(rows.size());
                for (std::size_t i = 0; i < rows.size(); ++i) {
                    if (!rows[i]) {
                        result.push_back(T{});
                        validity[i] = false;
                        continue;
                    }
                    result.push_back(col[*rows[i]]);
                    validity[i] = !runtime::is_null(entry, *rows[i]);
                }
                return result;
            },
            *entry.column);
        std::optional<std::vector<bool>> bitmap;
        if (std::find(validity.begin(), validity.end(), false) != validity.end()) {
            bitmap = std::move(validity);
        }
        output.columns.push_back(ColumnEntry{.qualifier = entry.qualifier,
                                             .name = entry.name,
                                             .column = std::make_shared<ColumnValue>(std::move(column)),
                                             .validity = std::move(bitmap)});
    }
    return output;
}

auto Table::at(std::size_t column, std::size_t row) const -> Datum {
    const auto& entry = columns.at(column);
    if (runtime::is_null(entry, row)) {
        return std::nullopt;
    }
    return std::visit([row](const auto& col) -> Datum { return ScalarValue{col.at(row)}; },
                      *entry.column);
}

auto Table::series(const ColumnEntry& entry) const -> Series {
    return Series{*entry.column, entry.validity};
}

auto to_string(const Table& table, std::size_t max_rows) -> std::string {
    if (table.columns.empty()) {
        return "<empty>\n";
    }
    std::string out = fmt::format("rows: {}\n", table.rows());

    const std::size_t col_count = table.columns.size();
    const std::size_t shown_rows = std::min(table.rows(), max_rows);

    std::vector<std::size_t> widths(col_count);
    std::vector<std::vector<std::string>> cells(col_count);
    for (std::size_t c = 0; c < col_count; ++c) {
        widths[c] = header(table.columns[c]).size();
        cells[c].reserve(shown_rows);
        for (std::size_t r = 0; r < shown_rows; ++r) {
            auto cell = format_datum(table.at(c, r));
            widths[c] = std::max(widths[c], cell.size());
            cells[c].push_back(std::move(cell));
        }
    }

    auto out_it = std::back_inserter(out);
    auto separator = [&]() {
        fmt::format_to(out_it, "+");
        for (std::size_t c = 0; c < col_count; ++c) {
            fmt::format_to(out_it, "{:-<{}}+", "", widths[c] + 2);
        }
        fmt::format_to(out_it, "\n");
    };

    separator();
    fmt::format_to(out_it, "|");
    for (std::size_t c = 0; c < col_count; ++c) {
        fmt::format_to(out_it, " {:<{}} |", header(table.columns[c]), widths[c]);
    }
    fmt::format_to(out_it, "\n");
    separator();

    for (std::size_t r = 0; r < shown_rows; ++r) {
        fmt::format_to(out_it, "|");
        for (std::size_t c = 0; c < col_count; ++c) {
            fmt::format_to(out_it, " {:<{}} |", cells[c][r], widths[c]);
        }
        fmt::format_to(out_it, "\n");
    }
    separator();

    if (table.rows() > shown_rows) {
        fmt::format_to(out_it, "... ({} more rows)\n", table.rows() - shown_rows);
    }
    return out;
}

}  // namespace oryx::runtime
