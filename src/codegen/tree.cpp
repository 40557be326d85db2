#include <oryx/codegen/sql.hpp>
#include <oryx/codegen/tree.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace oryx::codegen::tree {

namespace {

auto quote(std::string_view name) -> std::string {
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

auto join_keyword(dsl::JoinKind kind) -> std::string_view {
    switch (kind) {
        case dsl::JoinKind::Inner:
            return "JOIN";
        case dsl::JoinKind::Left:
            return "LEFT OUTER JOIN";
        case dsl::JoinKind::Right:
            return "RIGHT OUTER JOIN";
        case dsl::JoinKind::Full:
            return "FULL OUTER JOIN";
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

/// Binding strength of an operator; higher binds tighter.
auto precedence(dsl::Function op) -> int {
    switch (dsl::category(op)) {
        case dsl::Category::Logical:
            return op == dsl::Function::Or ? 1 : op == dsl::Function::And ? 2 : 3;
        case dsl::Category::Comparison:
            return 4;
        case dsl::Category::Arithmetic:
            return op == dsl::Function::Addition || op == dsl::Function::Subtraction ? 5 : 6;
        default:
            return 7;
    }
}

auto precedence(const ColumnExpr& expression) -> int {
    switch (expression.kind()) {
        case NodeKind::BinaryOp:
            return precedence(static_cast<const BinaryOp&>(expression).op());
        case NodeKind::UnaryOp:
            return precedence(static_cast<const UnaryOp&>(expression).op());
        case NodeKind::Label:
            return precedence(*static_cast<const Label&>(expression).element());
        default:
            return 7;
    }
}

auto operand(const ColumnExpr& expression, int parent, bool strict) -> std::string {
    auto own = precedence(expression);
    auto text = render(expression);
    return own < parent || (strict && own == parent) ? fmt::format("({})", text) : text;
}

/// Selectables that need parentheses when nested in a FROM clause.
auto from_item(const Selectable& selectable) -> std::string {
    auto text = render(selectable);
    switch (selectable.kind()) {
        case NodeKind::Select:
        case NodeKind::CompoundSelect:
            return fmt::format("({})", text);
        default:
            return text;
    }
}

auto column_item(const ColumnExpr& expression) -> std::string {
    if (expression.kind() == NodeKind::Label) {
        const auto& label = static_cast<const Label&>(expression);
        return fmt::format("{} AS {}", render(*label.element()), quote(label.name()));
    }
    return render(expression);
}

template <typename Range, typename Renderer>
auto render_list(const Range& items, Renderer&& renderer) -> std::string {
    std::vector<std::string> parts;
    parts.reserve(items.size());
    for (const auto& item : items) {
        parts.push_back(renderer(*item));
    }
    return fmt::format("{}", fmt::join(parts, ", "));
}

auto render_select(const Select& select) -> std::string {
    auto text = fmt::format("SELECT {} FROM {}", render_list(select.columns(), column_item),
                            from_item(*select.from()));
    auto plain = [](const ColumnExpr& e) { return render(e); };
    if (select.where()) {
        text += fmt::format(" WHERE {}", render(*select.where()));
    }
    if (!select.group_by().empty()) {
        text += fmt::format(" GROUP BY {}", render_list(select.group_by(), plain));
    }
    if (select.having()) {
        text += fmt::format(" HAVING {}", render(*select.having()));
    }
    if (!select.order_by().empty()) {
        text += fmt::format(" ORDER BY {}", render_list(select.order_by(), plain));
    }
    if (select.limit()) {
        text += fmt::format(" LIMIT {}", *select.limit());
    }
    if (select.offset() != 0) {
        text += fmt::format(" OFFSET {}", select.offset());
    }
    return text;
}

}  // namespace

auto Selectable::handle() const -> std::string {
    throw UnsupportedError("Selectable without a handle cannot qualify columns");
}

auto TableRef::of(const dsl::Schema& schema) -> SelectablePtr {
    std::vector<Column> columns;
    columns.reserve(schema.size());
    for (const auto& entry : schema.entries()) {
        columns.push_back({entry.field.name().value_or(entry.key), entry.field.kind()});
    }
    return std::make_shared<TableRef>(schema.name(), std::move(columns));
}

// ─── Rendering ───────────────────────────────────────────────────────────────

auto render(const Selectable& statement) -> std::string {
    switch (statement.kind()) {
        case NodeKind::TableRef:
            return quote(static_cast<const TableRef&>(statement).name());
        case NodeKind::AliasRef: {
            const auto& alias = static_cast<const AliasRef&>(statement);
            return fmt::format("{} AS {}", from_item(*alias.element()), quote(alias.alias()));
        }
        case NodeKind::JoinRef: {
            const auto& join = static_cast<const JoinRef&>(statement);
            auto text = fmt::format("{} {} {}", from_item(*join.left()), join_keyword(join.join()),
                                    from_item(*join.right()));
            if (join.onclause()) {
                text += fmt::format(" ON {}", render(*join.onclause()));
            }
            return text;
        }
        case NodeKind::CompoundSelect: {
            const auto& compound = static_cast<const CompoundSelect&>(statement);
            return fmt::format("{} {} {}", render(*compound.left()), set_keyword(compound.set()),
                               render(*compound.right()));
        }
        case NodeKind::Select:
            return render_select(static_cast<const Select&>(statement));
        default:
            break;
    }
    throw UnsupportedError("Not a selectable node");
}

auto render(const ColumnExpr& expression) -> std::string {
    switch (expression.kind()) {
        case NodeKind::ColumnRef: {
            const auto& column = static_cast<const ColumnRef&>(expression);
            if (column.table()) {
                return fmt::format("{}.{}", quote(*column.table()), quote(column.name()));
            }
            return quote(column.name());
        }
        case NodeKind::Label:
            return render(*static_cast<const Label&>(expression).element());
        case NodeKind::BoundLiteral: {
            const auto& literal = static_cast<const BoundLiteral&>(expression);
            return sql::literal(literal.value(), *literal.type());
        }
        case NodeKind::UnaryOp: {
            const auto& unary = static_cast<const UnaryOp&>(expression);
            auto own = precedence(unary.op());
            if (dsl::notation(unary.op()) == dsl::Notation::Prefix) {
                return fmt::format("{} {}", sql::operator_text(unary.op()),
                                   operand(*unary.operand(), own, false));
            }
            return fmt::format("{} {}", operand(*unary.operand(), own, true),
                               sql::operator_text(unary.op()));
        }
        case NodeKind::BinaryOp: {
            const auto& binary = static_cast<const BinaryOp&>(expression);
            auto own = precedence(binary.op());
            return fmt::format("{} {} {}", operand(*binary.left(), own, false),
                               sql::operator_text(binary.op()),
                               operand(*binary.right(), own, true));
        }
        case NodeKind::FunctionCall: {
            const auto& call = static_cast<const FunctionCall&>(expression);
            if (call.args().empty()) {
                return fmt::format("{}(*)", call.name());
            }
            return fmt::format("{}({})", call.name(),
                               render_list(call.args(), [](const ColumnExpr& e) { return render(e); }));
        }
        case NodeKind::CastExpr: {
            const auto& cast = static_cast<const CastExpr&>(expression);
            return fmt::format("CAST({} AS {})", render(*cast.operand()),
                               sql::type_name(*cast.type()));
        }
        case NodeKind::OrderBy: {
            const auto& order = static_cast<const OrderBy&>(expression);
            return fmt::format("{} {}", render(*order.element()),
                               order.direction() == dsl::Direction::Ascending ? "ASC" : "DESC");
        }
        default:
            break;
    }
    throw UnsupportedError("Not a column expression node");
}

// ─── Generator ───────────────────────────────────────────────────────────────

auto Generator::resolve_source(const dsl::Source& source) -> std::optional<SelectablePtr> {
    if (auto mapped = Visitor::resolve_source(source)) {
        return mapped;
    }
    if (source.type() == dsl::SourceType::Table) {
        return TableRef::of(*source.schema());
    }
    return std::nullopt;
}

auto Generator::resolve_feature(const dsl::Feature& feature) -> std::optional<ColumnExprPtr> {
    if (auto mapped = Visitor::resolve_feature(feature)) {
        return mapped;
    }
    if (feature.type() == dsl::FeatureType::Element) {
        const auto& element = static_cast<const dsl::Element&>(feature);
        return std::make_shared<ColumnRef>(std::nullopt, element.field(), element.kind());
    }
    return std::nullopt;
}

auto Generator::generate_element(const SelectablePtr& origin, const ColumnExprPtr& element)
    -> ColumnExprPtr {
    if (element->kind() != NodeKind::ColumnRef) {
        return element;
    }
    const auto& column = static_cast<const ColumnRef&>(*element);
    return std::make_shared<ColumnRef>(origin->handle(), column.name(), column.type());
}

auto Generator::generate_alias(const ColumnExprPtr& feature, const std::string& alias)
    -> ColumnExprPtr {
    return std::make_shared<Label>(alias, feature);
}

auto Generator::generate_literal(const Value& value, const dsl::KindPtr& kind) -> ColumnExprPtr {
    return std::make_shared<BoundLiteral>(value, kind);
}

auto Generator::generate_expression(const dsl::Expression& expression,
                                    const std::vector<ColumnExprPtr>& arguments)
    -> ColumnExprPtr {
    auto function = expression.function();
    switch (dsl::notation(function)) {
        case dsl::Notation::Infix:
            return std::make_shared<BinaryOp>(function, arguments[0], arguments[1],
                                              expression.kind());
        case dsl::Notation::Prefix:
        case dsl::Notation::Postfix:
            return std::make_shared<UnaryOp>(function, arguments[0], expression.kind());
        case dsl::Notation::Call:
            break;
    }
    if (function == dsl::Function::Cast) {
        return std::make_shared<CastExpr>(arguments[0], expression.target());
    }
    std::string name(dsl::symbol(function));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::make_shared<FunctionCall>(std::move(name), arguments, expression.kind());
}

auto Generator::generate_reference(const SelectablePtr& instance, const std::string& name)
    -> std::pair<SelectablePtr, SelectablePtr> {
    auto alias = std::make_shared<AliasRef>(instance, name);
    return {alias, alias};
}

auto Generator::generate_join(const SelectablePtr& left, const SelectablePtr& right,
                              const std::optional<ColumnExprPtr>& condition, dsl::JoinKind kind)
    -> SelectablePtr {
    return std::make_shared<JoinRef>(left, right, kind, condition.value_or(nullptr));
}

auto Generator::generate_set(const SelectablePtr& left, const SelectablePtr& right,
                             dsl::SetKind kind) -> SelectablePtr {
    return std::make_shared<CompoundSelect>(left, right, kind);
}

auto Generator::generate_query(const SelectablePtr& source,
                               const std::vector<ColumnExprPtr>& features,
                               const std::optional<ColumnExprPtr>& where,
                               const std::vector<ColumnExprPtr>& groupby,
                               const std::optional<ColumnExprPtr>& having,
                               const std::vector<OrderSymbol>& orderby,
                               const std::optional<dsl::Rows>& rows) -> SelectablePtr {
    Select::Clauses clauses;
    clauses.columns = features;
    clauses.from = source;
    clauses.where = where.value_or(nullptr);
    clauses.group_by = groupby;
    clauses.having = having.value_or(nullptr);
    for (const auto& [feature, direction] : orderby) {
        clauses.order_by.push_back(std::make_shared<OrderBy>(feature, direction));
    }
    if (rows) {
        clauses.limit = rows->count;
        clauses.offset = rows->offset;
    }
    return std::make_shared<Select>(std::move(clauses));
}

auto compile(const dsl::SourcePtr& statement, Generator::SourceMap sources,
             Generator::FeatureMap features) -> std::expected<SelectablePtr, CompileError> {
    try {
        Generator generator(std::move(sources), std::move(features));
        auto tree = generator.compile(statement);
        spdlog::debug("Compiled {} to tree: {}", statement->repr(), render(*tree));
        return tree;
    } catch (const Error& error) {
        return std::unexpected(CompileError{error.what()});
    }
}

}  // namespace oryx::codegen::tree
