#include <oryx/codegen/sql.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstring>

namespace oryx::codegen::sql {

namespace {

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

auto lower(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto upper(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

auto is_typed_literal(std::string_view text) -> bool {
    for (std::string_view prefix : {"DATE", "TIMESTAMP"}) {
        if (!text.starts_with(prefix)) {
            continue;
        }
        auto rest = trim(text.substr(prefix.size()));
        return rest.size() >= 2 && rest.front() == '\'' && rest.back() == '\'';
    }
    return false;
}

auto parenthesize(const std::string& text) -> std::string {
    return is_atomic(text) ? text : fmt::format("({})", text);
}

/// SELECT statements get parenthesized when used as a source.
auto subquery(const std::string& text) -> std::string {
    return trim(text).starts_with("SELECT") ? fmt::format("({})", text) : text;
}

auto join_keyword(dsl::JoinKind kind) -> std::string_view {
    switch (kind) {
        case dsl::JoinKind::Inner:
            return "JOIN";
        case dsl::JoinKind::Left:
            return "LEFT JOIN";
        case dsl::JoinKind::Right:
            return "RIGHT JOIN";
        case dsl::JoinKind::Full:
            return "FULL JOIN";
        case dsl::JoinKind::Cross:
            return "CROSS JOIN";
    }
    return "JOIN";
}

auto set_keyword(dsl::SetKind kind) -> std::string_view {
    switch (kind) {
        case dsl::SetKind::Union:
            return "UNION";
        case dsl::SetKind::Intersection:
            return "INTERSECT";
        case dsl::SetKind::Difference:
            return "EXCEPT";
    }
    return "UNION";
}

auto order_keyword(dsl::Direction direction) -> std::string_view {
    return direction == dsl::Direction::Ascending ? "ASC" : "DESC";
}

auto frame_bound(const std::optional<std::int64_t>& offset, bool start) -> std::string {
    if (!offset) {
        return start ? "UNBOUNDED PRECEDING" : "UNBOUNDED FOLLOWING";
    }
    if (*offset < 0) {
        return fmt::format("{} PRECEDING", -*offset);
    }
    if (*offset == 0) {
        return "CURRENT ROW";
    }
    return fmt::format("{} FOLLOWING", *offset);
}

auto orderings(const std::vector<Generator::OrderSymbol>& ordering) -> std::string {
    std::vector<std::string> terms;
    terms.reserve(ordering.size());
    for (const auto& [feature, direction] : ordering) {
        terms.push_back(fmt::format("{} {}", feature, order_keyword(direction)));
    }
    return fmt::format("{}", fmt::join(terms, ", "));
}

}  // namespace

auto is_atomic(std::string_view text) -> bool {
    text = trim(text);
    if (text.empty()) {
        return false;
    }
    if (is_typed_literal(text)) {
        return true;
    }
    int depth = 0;
    char quote = 0;
    for (char c : text) {
        if (quote != 0) {
            if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '(') {
            ++depth;
        } else if (c == ')') {
            --depth;
        } else if (depth == 0 &&
                   (std::isspace(static_cast<unsigned char>(c)) != 0 ||
                    std::strchr("+-*/%", c) != nullptr)) {
            return false;
        }
    }
    return depth == 0;
}

auto type_name(const dsl::Kind& kind) -> std::string {
    switch (kind.id()) {
        case dsl::KindId::Boolean:
            return "BOOLEAN";
        case dsl::KindId::Integer:
            return "BIGINT";
        case dsl::KindId::Float:
            return "DOUBLE";
        case dsl::KindId::Decimal:
            return "DECIMAL";
        case dsl::KindId::String:
            return "VARCHAR";
        case dsl::KindId::Date:
            return "DATE";
        case dsl::KindId::Timestamp:
            return "TIMESTAMP";
        case dsl::KindId::Array:
            return fmt::format("ARRAY<{}>", type_name(*kind.element()));
        case dsl::KindId::Map:
            return fmt::format("MAP<{}, {}>", type_name(*kind.key()), type_name(*kind.value()));
        case dsl::KindId::Struct: {
            std::vector<std::string> fields;
            for (const auto& element : kind.elements()) {
                fields.push_back(fmt::format("{} {}", element.name, type_name(*element.kind)));
            }
            return fmt::format("ROW({})", fmt::join(fields, ", "));
        }
    }
    throw UnsupportedError(fmt::format("Unsupported kind {}", kind.name()));
}

auto operator_text(dsl::Function function) -> std::string_view {
    switch (function) {
        case dsl::Function::Equal:
            return "=";
        case dsl::Function::NotNull:
            return "IS NOT NULL";
        default:
            return dsl::symbol(function);
    }
}

auto literal(const Value& value, const dsl::Kind& kind) -> std::string {
    switch (kind.id()) {
        case dsl::KindId::Boolean:
            return value.get<bool>() ? "TRUE" : "FALSE";
        case dsl::KindId::Integer:
        case dsl::KindId::Float:
        case dsl::KindId::Decimal:
            return value.repr();
        case dsl::KindId::String: {
            std::string quoted = "'";
            for (char c : value.get<std::string>()) {
                if (c == '\'') {
                    quoted += '\'';
                }
                quoted += c;
            }
            quoted += '\'';
            return quoted;
        }
        case dsl::KindId::Date:
            return fmt::format("DATE '{}'", format_date(value.get<Date>()));
        case dsl::KindId::Timestamp:
            return fmt::format("TIMESTAMP '{}'", format_timestamp(value.get<Timestamp>()));
        case dsl::KindId::Array: {
            std::vector<std::string> items;
            for (const auto& item : value.get<Array>().items) {
                items.push_back(literal(item, *kind.element()));
            }
            return fmt::format("ARRAY[{}]", fmt::join(items, ", "));
        }
        default:
            break;
    }
    throw UnsupportedError(fmt::format("Unsupported literal kind: {}", kind.name()));
}

// ─── Generator ───────────────────────────────────────────────────────────────

Generator::Generator(Config config, SourceMap sources, FeatureMap features)
    : Visitor(std::move(sources), std::move(features)), config_(config) {}

auto Generator::identifier(std::string_view name) const -> std::string {
    if (!config_.quote_identifiers) {
        return std::string(name);
    }
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

auto Generator::resolve_source(const dsl::Source& source) -> std::optional<std::string> {
    if (auto mapped = Visitor::resolve_source(source)) {
        return mapped;
    }
    if (source.type() == dsl::SourceType::Table) {
        return identifier(static_cast<const dsl::Table&>(source).name());
    }
    return std::nullopt;
}

auto Generator::resolve_feature(const dsl::Feature& feature) -> std::optional<std::string> {
    if (auto mapped = Visitor::resolve_feature(feature)) {
        return mapped;
    }
    if (feature.type() == dsl::FeatureType::Element) {
        return identifier(static_cast<const dsl::Element&>(feature).field());
    }
    return std::nullopt;
}

auto Generator::generate_element(const std::string& origin, const std::string& element)
    -> std::string {
    return fmt::format("{}.{}", origin, element);
}

auto Generator::generate_alias(const std::string& feature, const std::string& alias)
    -> std::string {
    return fmt::format("{} AS {}", feature, identifier(alias));
}

auto Generator::generate_literal(const Value& value, const dsl::KindPtr& kind) -> std::string {
    return literal(value, *kind);
}

auto Generator::generate_expression(const dsl::Expression& expression,
                                    const std::vector<std::string>& arguments) -> std::string {
    auto function = expression.function();
    switch (dsl::notation(function)) {
        case dsl::Notation::Infix:
            return fmt::format("{} {} {}", parenthesize(arguments[0]), operator_text(function),
                               parenthesize(arguments[1]));
        case dsl::Notation::Prefix:
            return fmt::format("{} {}", operator_text(function), parenthesize(arguments[0]));
        case dsl::Notation::Postfix:
            return fmt::format("{} {}", parenthesize(arguments[0]), operator_text(function));
        case dsl::Notation::Call:
            break;
    }
    if (function == dsl::Function::Cast) {
        return fmt::format("CAST({} AS {})", arguments[0], type_name(*expression.target()));
    }
    if (function == dsl::Function::Count && arguments.empty()) {
        return "count(*)";
    }
    return fmt::format("{}({})", lower(dsl::symbol(function)), fmt::join(arguments, ", "));
}

auto Generator::generate_window(const dsl::Window& window, const std::string& function,
                                const std::vector<std::string>& partition,
                                const std::vector<OrderSymbol>& ordering) -> std::string {
    std::vector<std::string> spec;
    if (!partition.empty()) {
        spec.push_back(fmt::format("PARTITION BY {}", fmt::join(partition, ", ")));
    }
    if (!ordering.empty()) {
        spec.push_back(fmt::format("ORDER BY {}", orderings(ordering)));
    }
    if (const auto& frame = window.frame()) {
        spec.push_back(fmt::format("{} BETWEEN {} AND {}", upper(dsl::to_string(frame->mode)),
                                   frame_bound(frame->start, true),
                                   frame_bound(frame->end, false)));
    }
    return fmt::format("{} OVER ({})", function, fmt::join(spec, " "));
}

auto Generator::generate_reference(const std::string& instance, const std::string& name)
    -> std::pair<std::string, std::string> {
    auto handle = identifier(name);
    return {fmt::format("{} AS {}", parenthesize(instance), handle), handle};
}

auto Generator::generate_join(const std::string& left, const std::string& right,
                              const std::optional<std::string>& condition, dsl::JoinKind kind)
    -> std::string {
    auto join = fmt::format("{} {} {}", subquery(left), join_keyword(kind), subquery(right));
    if (condition) {
        join += fmt::format(" ON {}", *condition);
    }
    return join;
}

auto Generator::generate_set(const std::string& left, const std::string& right,
                             dsl::SetKind kind) -> std::string {
    auto separator = config_.pretty ? "\n" : " ";
    return fmt::format("{}{}{}{}{}", left, separator, set_keyword(kind), separator, right);
}

auto Generator::generate_query(const std::string& source,
                               const std::vector<std::string>& features,
                               const std::optional<std::string>& where,
                               const std::vector<std::string>& groupby,
                               const std::optional<std::string>& having,
                               const std::vector<OrderSymbol>& orderby,
                               const std::optional<dsl::Rows>& rows) -> std::string {
    if (features.empty()) {
        throw GrammarError("Query without features");
    }
    auto separator = config_.pretty ? "\n" : " ";
    auto query = fmt::format("SELECT {}{}FROM {}", fmt::join(features, ", "), separator,
                             subquery(source));
    if (where) {
        query += fmt::format("{}WHERE {}", separator, *where);
    }
    if (!groupby.empty()) {
        query += fmt::format("{}GROUP BY {}", separator, fmt::join(groupby, ", "));
    }
    if (having) {
        query += fmt::format("{}HAVING {}", separator, *having);
    }
    if (!orderby.empty()) {
        query += fmt::format("{}ORDER BY {}", separator, orderings(orderby));
    }
    if (rows) {
        query += fmt::format("{}LIMIT ", separator);
        if (rows->offset != 0) {
            query += fmt::format("{}, ", rows->offset);
        }
        query += fmt::format("{}", rows->count);
    }
    return query;
}

auto compile(const dsl::SourcePtr& statement, const Generator::Config& config,
             Generator::SourceMap sources, Generator::FeatureMap features)
    -> std::expected<std::string, CompileError> {
    try {
        Generator generator(config, std::move(sources), std::move(features));
        auto text = generator.compile(statement);
        spdlog::debug("Compiled {} to SQL: {}", statement->repr(), text);
        return text;
    } catch (const Error& error) {
        return std::unexpected(CompileError{error.what()});
    }
}

}  // namespace oryx::codegen::sql
