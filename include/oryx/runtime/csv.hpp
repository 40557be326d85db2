#pragma once

#include <oryx/dsl/schema.hpp>
#include <oryx/runtime/table.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <unordered_set>

namespace oryx::runtime {

/// Which cells of a CSV file read as null.
struct CsvOptions {
    bool null_if_empty = false;
    std::unordered_set<std::string> null_tokens;
};

/// Parse a comma separated null spec such as `"<empty>,NA"`; the
/// `<empty>` token marks empty cells as null.
[[nodiscard]] auto parse_null_spec(std::string_view spec) -> CsvOptions;

/// Read a CSV file with a header row, inferring int, double or string
/// columns. Columns are unqualified.
[[nodiscard]] auto read_csv(std::string_view path, const CsvOptions& options = {})
    -> std::expected<Table, std::string>;

/// Read the columns named by the schema fields, casting every cell to the
/// field kind. Extra columns in the file are ignored.
[[nodiscard]] auto read_csv(std::string_view path, const dsl::Schema& schema,
                            const CsvOptions& options = {}) -> std::expected<Table, std::string>;

}  // namespace oryx::runtime
