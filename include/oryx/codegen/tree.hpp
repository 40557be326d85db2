#pragma once

#include <oryx/core/error.hpp>
#include <oryx/parser/visitor.hpp>

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace oryx::codegen::tree {

/// Tree node types.
enum class NodeKind : std::uint8_t {
    TableRef,
    AliasRef,
    JoinRef,
    CompoundSelect,
    Select,
    ColumnRef,
    Label,
    BoundLiteral,
    UnaryOp,
    BinaryOp,
    FunctionCall,
    CastExpr,
    OrderBy,
};

/// Base node of the SQL expression tree.
///
/// Nodes are immutable and shared: a subtree produced once by the generator
/// can be referenced from several parents.
class Node {
   public:
    explicit Node(NodeKind kind) : kind_(kind) {}
    virtual ~Node() = default;

    Node(const Node&) = delete;
    auto operator=(const Node&) -> Node& = delete;

    [[nodiscard]] auto kind() const noexcept -> NodeKind { return kind_; }

   private:
    NodeKind kind_;
};

/// Anything that can appear in a FROM clause.
class Selectable : public Node {
   public:
    using Node::Node;

    /// Name that qualifies columns taken from this selectable. Only table and
    /// alias references have one.
    [[nodiscard]] virtual auto handle() const -> std::string;
};
using SelectablePtr = std::shared_ptr<const Selectable>;

/// Typed column expression.
class ColumnExpr : public Node {
   public:
    ColumnExpr(NodeKind kind, dsl::KindPtr type) : Node(kind), type_(std::move(type)) {}

    [[nodiscard]] auto type() const noexcept -> const dsl::KindPtr& { return type_; }

   private:
    dsl::KindPtr type_;
};
using ColumnExprPtr = std::shared_ptr<const ColumnExpr>;

// ─── Selectables ─────────────────────────────────────────────────────────────

class TableRef final : public Selectable {
   public:
    struct Column {
        std::string name;
        dsl::KindPtr type;
    };

    TableRef(std::string name, std::vector<Column> columns)
        : Selectable(NodeKind::TableRef), name_(std::move(name)), columns_(std::move(columns)) {}

    /// Table declared by a DSL schema, columns named after its fields.
    [[nodiscard]] static auto of(const dsl::Schema& schema) -> SelectablePtr;

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
    [[nodiscard]] auto columns() const noexcept -> const std::vector<Column>& { return columns_; }
    [[nodiscard]] auto handle() const -> std::string override { return name_; }

   private:
    std::string name_;
    std::vector<Column> columns_;
};

class AliasRef final : public Selectable {
   public:
    AliasRef(SelectablePtr element, std::string alias)
        : Selectable(NodeKind::AliasRef), element_(std::move(element)), alias_(std::move(alias)) {}

    [[nodiscard]] auto element() const noexcept -> const SelectablePtr& { return element_; }
    [[nodiscard]] auto alias() const noexcept -> const std::string& { return alias_; }
    [[nodiscard]] auto handle() const -> std::string override { return alias_; }

   private:
    SelectablePtr element_;
    std::string alias_;
};

class JoinRef final : public Selectable {
   public:
    JoinRef(SelectablePtr left, SelectablePtr right, dsl::JoinKind join, ColumnExprPtr onclause)
        : Selectable(NodeKind::JoinRef),
          left_(std::move(left)),
          right_(std::move(right)),
          join_(join),
          onclause_(std::move(onclause)) {}

    [[nodiscard]] auto left() const noexcept -> const SelectablePtr& { return left_; }
    [[nodiscard]] auto right() const noexcept -> const SelectablePtr& { return right_; }
    [[nodiscard]] auto join() const noexcept -> dsl::JoinKind { return join_; }
    /// Null for cross joins.
    [[nodiscard]] auto onclause() const noexcept -> const ColumnExprPtr& { return onclause_; }

   private:
    SelectablePtr left_;
    SelectablePtr right_;
    dsl::JoinKind join_;
    ColumnExprPtr onclause_;
};

class CompoundSelect final : public Selectable {
   public:
    CompoundSelect(SelectablePtr left, SelectablePtr right, dsl::SetKind set)
        : Selectable(NodeKind::CompoundSelect),
          left_(std::move(left)),
          right_(std::move(right)),
          set_(set) {}

    [[nodiscard]] auto left() const noexcept -> const SelectablePtr& { return left_; }
    [[nodiscard]] auto right() const noexcept -> const SelectablePtr& { return right_; }
    [[nodiscard]] auto set() const noexcept -> dsl::SetKind { return set_; }

   private:
    SelectablePtr left_;
    SelectablePtr right_;
    dsl::SetKind set_;
};

class Select final : public Selectable {
   public:
    struct Clauses {
        std::vector<ColumnExprPtr> columns;
        SelectablePtr from;
        ColumnExprPtr where;
        std::vector<ColumnExprPtr> group_by;
        ColumnExprPtr having;
        std::vector<ColumnExprPtr> order_by;
        std::optional<std::int64_t> limit;
        std::int64_t offset = 0;
    };

    explicit Select(Clauses clauses)
        : Selectable(NodeKind::Select), clauses_(std::move(clauses)) {}

    [[nodiscard]] auto columns() const noexcept -> const std::vector<ColumnExprPtr>& {
        return clauses_.columns;
    }
    [[nodiscard]] auto from() const noexcept -> const SelectablePtr& { return clauses_.from; }
    [[nodiscard]] auto where() const noexcept -> const ColumnExprPtr& { return clauses_.where; }
    [[nodiscard]] auto group_by() const noexcept -> const std::vector<ColumnExprPtr>& {
        return clauses_.group_by;
    }
    [[nodiscard]] auto having() const noexcept -> const ColumnExprPtr& { return clauses_.having; }
    [[nodiscard]] auto order_by() const noexcept -> const std::vector<ColumnExprPtr>& {
        return clauses_.order_by;
    }
    [[nodiscard]] auto limit() const noexcept -> const std::optional<std::int64_t>& {
        return clauses_.limit;
    }
    [[nodiscard]] auto offset() const noexcept -> std::int64_t { return clauses_.offset; }

   private:
    Clauses clauses_;
};

// ─── Column expressions ──────────────────────────────────────────────────────

class ColumnRef final : public ColumnExpr {
   public:
    ColumnRef(std::optional<std::string> table, std::string name, dsl::KindPtr type)
        : ColumnExpr(NodeKind::ColumnRef, std::move(type)),
          table_(std::move(table)),
          name_(std::move(name)) {}

    [[nodiscard]] auto table() const noexcept -> const std::optional<std::string>& {
        return table_;
    }
    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }

   private:
    std::optional<std::string> table_;
    std::string name_;
};

class Label final : public ColumnExpr {
   public:
    Label(std::string name, ColumnExprPtr element)
        : ColumnExpr(NodeKind::Label, element->type()),
          name_(std::move(name)),
          element_(std::move(element)) {}

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
    [[nodiscard]] auto element() const noexcept -> const ColumnExprPtr& { return element_; }

   private:
    std::string name_;
    ColumnExprPtr element_;
};

class BoundLiteral final : public ColumnExpr {
   public:
    BoundLiteral(Value value, dsl::KindPtr type)
        : ColumnExpr(NodeKind::BoundLiteral, std::move(type)), value_(std::move(value)) {}

    [[nodiscard]] auto value() const noexcept -> const Value& { return value_; }

   private:
    Value value_;
};

/// `NOT x`, `x IS NULL`, `x IS NOT NULL`.
class UnaryOp final : public ColumnExpr {
   public:
    UnaryOp(dsl::Function op, ColumnExprPtr operand, dsl::KindPtr type)
        : ColumnExpr(NodeKind::UnaryOp, std::move(type)), op_(op), operand_(std::move(operand)) {}

    [[nodiscard]] auto op() const noexcept -> dsl::Function { return op_; }
    [[nodiscard]] auto operand() const noexcept -> const ColumnExprPtr& { return operand_; }

   private:
    dsl::Function op_;
    ColumnExprPtr operand_;
};

class BinaryOp final : public ColumnExpr {
   public:
    BinaryOp(dsl::Function op, ColumnExprPtr left, ColumnExprPtr right, dsl::KindPtr type)
        : ColumnExpr(NodeKind::BinaryOp, std::move(type)),
          op_(op),
          left_(std::move(left)),
          right_(std::move(right)) {}

    [[nodiscard]] auto op() const noexcept -> dsl::Function { return op_; }
    [[nodiscard]] auto left() const noexcept -> const ColumnExprPtr& { return left_; }
    [[nodiscard]] auto right() const noexcept -> const ColumnExprPtr& { return right_; }

   private:
    dsl::Function op_;
    ColumnExprPtr left_;
    ColumnExprPtr right_;
};

/// Named SQL function; `count` without arguments renders as `count(*)`.
class FunctionCall final : public ColumnExpr {
   public:
    FunctionCall(std::string name, std::vector<ColumnExprPtr> args, dsl::KindPtr type)
        : ColumnExpr(NodeKind::FunctionCall, std::move(type)),
          name_(std::move(name)),
          args_(std::move(args)) {}

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
    [[nodiscard]] auto args() const noexcept -> const std::vector<ColumnExprPtr>& { return args_; }

   private:
    std::string name_;
    std::vector<ColumnExprPtr> args_;
};

class CastExpr final : public ColumnExpr {
   public:
    CastExpr(ColumnExprPtr operand, dsl::KindPtr type)
        : ColumnExpr(NodeKind::CastExpr, std::move(type)), operand_(std::move(operand)) {}

    [[nodiscard]] auto operand() const noexcept -> const ColumnExprPtr& { return operand_; }

   private:
    ColumnExprPtr operand_;
};

class OrderBy final : public ColumnExpr {
   public:
    OrderBy(ColumnExprPtr element, dsl::Direction direction)
        : ColumnExpr(NodeKind::OrderBy, element->type()),
          element_(std::move(element)),
          direction_(direction) {}

    [[nodiscard]] auto element() const noexcept -> const ColumnExprPtr& { return element_; }
    [[nodiscard]] auto direction() const noexcept -> dsl::Direction { return direction_; }

   private:
    ColumnExprPtr element_;
    dsl::Direction direction_;
};

// ─── Generator ───────────────────────────────────────────────────────────────

/// Builds a typed SQL expression tree from a DSL statement.
///
/// Unmapped tables become `TableRef`s named after their schema and unmapped
/// elements `ColumnRef`s named after their field.
class Generator : public parser::Visitor<SelectablePtr, ColumnExprPtr> {
   public:
    using Visitor::Visitor;

    [[nodiscard]] auto resolve_source(const dsl::Source& source)
        -> std::optional<SelectablePtr> override;
    [[nodiscard]] auto resolve_feature(const dsl::Feature& feature)
        -> std::optional<ColumnExprPtr> override;

    auto generate_element(const SelectablePtr& origin, const ColumnExprPtr& element)
        -> ColumnExprPtr override;
    auto generate_alias(const ColumnExprPtr& feature, const std::string& alias)
        -> ColumnExprPtr override;
    auto generate_literal(const Value& value, const dsl::KindPtr& kind) -> ColumnExprPtr override;
    auto generate_expression(const dsl::Expression& expression,
                             const std::vector<ColumnExprPtr>& arguments)
        -> ColumnExprPtr override;
    auto generate_reference(const SelectablePtr& instance, const std::string& name)
        -> std::pair<SelectablePtr, SelectablePtr> override;
    auto generate_join(const SelectablePtr& left, const SelectablePtr& right,
                       const std::optional<ColumnExprPtr>& condition, dsl::JoinKind kind)
        -> SelectablePtr override;
    auto generate_set(const SelectablePtr& left, const SelectablePtr& right, dsl::SetKind kind)
        -> SelectablePtr override;
    auto generate_query(const SelectablePtr& source, const std::vector<ColumnExprPtr>& features,
                        const std::optional<ColumnExprPtr>& where,
                        const std::vector<ColumnExprPtr>& groupby,
                        const std::optional<ColumnExprPtr>& having,
                        const std::vector<OrderSymbol>& orderby,
                        const std::optional<dsl::Rows>& rows) -> SelectablePtr override;
};

/// Render a selectable to SQL text.
[[nodiscard]] auto render(const Selectable& statement) -> std::string;

/// Render a column expression to SQL text. Labels render as their element.
[[nodiscard]] auto render(const ColumnExpr& expression) -> std::string;

/// Compile a statement to a SQL expression tree.
[[nodiscard]] auto compile(const dsl::SourcePtr& statement, Generator::SourceMap sources = {},
                           Generator::FeatureMap features = {})
    -> std::expected<SelectablePtr, CompileError>;

}  // namespace oryx::codegen::tree
