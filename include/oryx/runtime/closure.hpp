#pragma once

#include <oryx/core/error.hpp>
#include <oryx/parser/visitor.hpp>
#include <oryx/runtime/table.hpp>

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace oryx::runtime {

/// Compiled source: loads its rows from the catalog.
struct Tabulizer {
    /// Qualifier of the columns this source contributes as an origin.
    std::string handle;
    std::function<Table(const Catalog&)> load;

    auto operator()(const Catalog& catalog) const -> Table { return load(catalog); }
};

/// Compiled feature: evaluates to a series over a table.
///
/// Aggregates reduce the whole table to a single row; in a grouped query
/// they are applied to one group at a time.
struct Columnizer {
    /// Output column name (alias or field name).
    std::optional<std::string> name;
    dsl::KindPtr kind;
    bool aggregate = false;
    std::function<Series(const Table&)> eval;

    auto operator()(const Table& table) const -> Series { return eval(table); }
};

/// Compiles DSL statements into closures over in-memory tables.
///
/// Unmapped tables load the catalog entry named after their schema and
/// unmapped elements read the column named after their field. Window
/// functions are only available through an explicit feature mapping.
class Generator : public parser::Visitor<Tabulizer, Columnizer> {
   public:
    using Visitor::Visitor;

    [[nodiscard]] auto resolve_source(const dsl::Source& source)
        -> std::optional<Tabulizer> override;
    [[nodiscard]] auto resolve_feature(const dsl::Feature& feature)
        -> std::optional<Columnizer> override;

    auto generate_element(const Tabulizer& origin, const Columnizer& element)
        -> Columnizer override;
    auto generate_alias(const Columnizer& feature, const std::string& alias)
        -> Columnizer override;
    auto generate_literal(const Value& value, const dsl::KindPtr& kind) -> Columnizer override;
    auto generate_expression(const dsl::Expression& expression,
                             const std::vector<Columnizer>& arguments) -> Columnizer override;
    auto generate_table(const Tabulizer& table, const std::vector<Columnizer>& features,
                        const std::optional<Columnizer>& predicate) -> Tabulizer override;
    auto generate_reference(const Tabulizer& instance, const std::string& name)
        -> std::pair<Tabulizer, Tabulizer> override;
    auto generate_join(const Tabulizer& left, const Tabulizer& right,
                       const std::optional<Columnizer>& condition, dsl::JoinKind kind)
        -> Tabulizer override;
    auto generate_set(const Tabulizer& left, const Tabulizer& right, dsl::SetKind kind)
        -> Tabulizer override;
    auto generate_query(const Tabulizer& source, const std::vector<Columnizer>& features,
                        const std::optional<Columnizer>& where,
                        const std::vector<Columnizer>& groupby,
                        const std::optional<Columnizer>& having,
                        const std::vector<OrderSymbol>& orderby,
                        const std::optional<dsl::Rows>& rows) -> Tabulizer override;
};

/// Evaluate an operator or function over cells, with SQL null semantics.
[[nodiscard]] auto apply(const dsl::Expression& expression, const std::vector<Datum>& operands)
    -> Datum;

/// Reduce a series with an aggregate function; `series` is null for `count()`.
[[nodiscard]] auto reduce(dsl::Function function, const Series* series, std::size_t rows) -> Datum;

/// Compile a statement to a closure.
[[nodiscard]] auto compile(const dsl::SourcePtr& statement, Generator::SourceMap sources = {},
                           Generator::FeatureMap features = {})
    -> std::expected<Tabulizer, CompileError>;

/// Compile and run a statement against the catalog.
[[nodiscard]] auto execute(const dsl::SourcePtr& statement, const Catalog& catalog)
    -> std::expected<Table, CompileError>;

}  // namespace oryx::runtime
