#pragma once

#include <oryx/core/error.hpp>
#include <oryx/parser/visitor.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace oryx::codegen::sql {

/// Options for Generator (declared outside the class so it can be a default argument).
struct GeneratorConfig {
    /// Wrap generated identifiers in double quotes.
    bool quote_identifiers = true;
    /// Put every clause on its own line.
    bool pretty = false;
};

/// Translates DSL statements into ANSI SQL text.
///
/// Mapped tables and elements are emitted verbatim. Unmapped tables fall back
/// to their schema name and unmapped elements to their field name, both
/// quoted as identifiers.
class Generator : public parser::Visitor<std::string, std::string> {
   public:
    using Config = GeneratorConfig;

    explicit Generator(Config config = {}, SourceMap sources = {}, FeatureMap features = {});

    [[nodiscard]] auto resolve_source(const dsl::Source& source)
        -> std::optional<std::string> override;
    [[nodiscard]] auto resolve_feature(const dsl::Feature& feature)
        -> std::optional<std::string> override;

    auto generate_element(const std::string& origin, const std::string& element)
        -> std::string override;
    auto generate_alias(const std::string& feature, const std::string& alias)
        -> std::string override;
    auto generate_literal(const Value& value, const dsl::KindPtr& kind) -> std::string override;
    auto generate_expression(const dsl::Expression& expression,
                             const std::vector<std::string>& arguments) -> std::string override;
    auto generate_window(const dsl::Window& window, const std::string& function,
                         const std::vector<std::string>& partition,
                         const std::vector<OrderSymbol>& ordering) -> std::string override;
    auto generate_reference(const std::string& instance, const std::string& name)
        -> std::pair<std::string, std::string> override;
    auto generate_join(const std::string& left, const std::string& right,
                       const std::optional<std::string>& condition, dsl::JoinKind kind)
        -> std::string override;
    auto generate_set(const std::string& left, const std::string& right, dsl::SetKind kind)
        -> std::string override;
    auto generate_query(const std::string& source, const std::vector<std::string>& features,
                        const std::optional<std::string>& where,
                        const std::vector<std::string>& groupby,
                        const std::optional<std::string>& having,
                        const std::vector<OrderSymbol>& orderby,
                        const std::optional<dsl::Rows>& rows) -> std::string override;

    /// Identifier as emitted under the current configuration.
    [[nodiscard]] auto identifier(std::string_view name) const -> std::string;

   private:
    Config config_;
};

/// SQL type name of a kind (`BIGINT`, `VARCHAR`, `ARRAY<BIGINT>`...).
[[nodiscard]] auto type_name(const dsl::Kind& kind) -> std::string;

/// SQL encoding of a literal value of the given kind.
[[nodiscard]] auto literal(const Value& value, const dsl::Kind& kind) -> std::string;

/// SQL spelling of an operator (`=`, `AND`, `IS NOT NULL`...).
[[nodiscard]] auto operator_text(dsl::Function function) -> std::string_view;

/// True if the text can be used as an operand without parentheses: a single
/// word or call at the top level, or a date/timestamp literal.
[[nodiscard]] auto is_atomic(std::string_view text) -> bool;

/// Compile a statement to SQL text.
[[nodiscard]] auto compile(const dsl::SourcePtr& statement, const Generator::Config& config = {},
                           Generator::SourceMap sources = {}, Generator::FeatureMap features = {})
    -> std::expected<std::string, CompileError>;

}  // namespace oryx::codegen::sql
