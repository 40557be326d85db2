#pragma once

#include <oryx/core/time.hpp>
#include <oryx/core/value.hpp>
#include <oryx/dsl/kind.hpp>
#include <oryx/runtime/column.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace oryx::runtime {

using ColumnValue = std::variant<Column<bool>, Column<std::int64_t>, Column<double>,
                                 Column<std::string>, Column<Date>, Column<Timestamp>>;
using ScalarValue = std::variant<bool, std::int64_t, double, std::string, Date, Timestamp>;

/// A single cell; empty for SQL NULL.
using Datum = std::optional<ScalarValue>;

/// Empty column holding values of the given kind. Decimals are stored as
/// doubles; compound kinds raise UnsupportedError.
[[nodiscard]] auto make_column(const dsl::Kind& kind) -> ColumnValue;

/// Cell of a native DSL value.
[[nodiscard]] auto to_datum(const Value& value) -> Datum;

/// Native DSL value of a non-null cell.
[[nodiscard]] auto to_value(const ScalarValue& value) -> Value;

/// Cell text as printed in tables: `null` for NULL, ISO dates.
[[nodiscard]] auto format_datum(const Datum& datum) -> std::string;

/// Column values with an optional validity bitmap.
///
/// This is the result of evaluating a feature against a table. A series of
/// length one stands for a constant and is broadcast against longer ones.
struct Series {
    ColumnValue values;
    // Validity bitmap: true = valid (not null), false = null.
    // nullopt means every row is valid.
    std::optional<std::vector<bool>> validity;

    /// Series of the given kind holding the cells.
    [[nodiscard]] static auto of(const dsl::Kind& kind, const std::vector<Datum>& cells) -> Series;

    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto is_null(std::size_t row) const -> bool {
        return validity.has_value() && !(*validity)[row];
    }
    /// Cell at `row`; a constant series answers for every row.
    [[nodiscard]] auto at(std::size_t row) const -> Datum;
};

struct ColumnEntry {
    /// Handle of the origin the column belongs to; empty for computed columns.
    std::string qualifier;
    std::string name;
    std::shared_ptr<ColumnValue> column;
    // Validity bitmap: true = valid (not null), false = null.
    // nullopt means every row is valid, the common case, with zero overhead.
    std::optional<std::vector<bool>> validity;
};

/// Returns true if row `row` of `entry` is null.
[[nodiscard]] inline auto is_null(const ColumnEntry& entry, std::size_t row) -> bool {
    return entry.validity.has_value() && !(*entry.validity)[row];
}

/// In-memory columnar table of origin-qualified columns.
struct Table {
    std::vector<ColumnEntry> columns;

    /// Add an unqualified column; an existing column of the same name is
    /// replaced.
    void add_column(std::string name, ColumnValue column);
    /// Add a column with an explicit validity bitmap (true = valid, false = null).
    void add_column(std::string name, ColumnValue column, std::vector<bool> validity);
    /// Add a qualified column from an evaluated series.
    void add_column(std::string qualifier, std::string name, Series series);

    /// Column by name, any qualifier; the first match wins.
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnEntry*;
    /// Column by qualifier and name.
    [[nodiscard]] auto find(const std::string& qualifier, const std::string& name) const
        -> const ColumnEntry*;

    [[nodiscard]] auto rows() const noexcept -> std::size_t;

    /// Copy of this table with every column attributed to `qualifier`.
    [[nodiscard]] auto qualified(const std::string& qualifier) const -> Table;

    /// Rows at the given positions, in that order.
    [[nodiscard]] auto take(const std::vector<std::size_t>& rows) const -> Table;

    /// Rows at the given positions; empty positions produce all-null rows.
    [[nodiscard]] auto take(const std::vector<std::optional<std::size_t>>& rows) const -> Table;

    /// Cell of column `column` at `row`.
    [[nodiscard]] auto at(std::size_t column, std::size_t row) const -> Datum;

    /// Column as a series.
    [[nodiscard]] auto series(const ColumnEntry& entry) const -> Series;
};

/// Named input tables an executed statement reads from.
using Catalog = std::unordered_map<std::string, Table>;

/// Box-drawn rendering of the first `max_rows` rows.
[[nodiscard]] auto to_string(const Table& table, std::size_t max_rows = 10) -> std::string;

}  // namespace oryx::runtime
