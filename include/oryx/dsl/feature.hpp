#pragma once

#include <oryx/core/value.hpp>
#include <oryx/dsl/kind.hpp>

#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace oryx::dsl {

class Source;
using SourcePtr = std::shared_ptr<const Source>;

class Feature;
using FeaturePtr = std::shared_ptr<const Feature>;

class FeatureVisitor;

/// Structural hash/equality for feature handles (use in hashed containers).
struct FeatureHash {
    auto operator()(const FeaturePtr& feature) const noexcept -> std::size_t;
};
struct FeatureEqual {
    auto operator()(const FeaturePtr& lhs, const FeaturePtr& rhs) const -> bool;
};
using FeatureSet = std::unordered_set<FeaturePtr, FeatureHash, FeatureEqual>;

/// Feature node categories.
enum class FeatureType : std::uint8_t {
    Aliased,
    Literal,
    Element,
    Expression,
    Window,
};

/// Operators and functions an Expression node can apply.
enum class Function : std::uint8_t {
    // arithmetic
    Addition,
    Subtraction,
    Multiplication,
    Division,
    Modulus,
    // comparison
    LessThan,
    LessEqual,
    GreaterThan,
    GreaterEqual,
    Equal,
    NotEqual,
    IsNull,
    NotNull,
    // logical
    And,
    Or,
    Not,
    // conversion
    Cast,
    // datetime
    Year,
    // math
    Abs,
    Ceil,
    Floor,
    // aggregate
    Count,
    Avg,
    Min,
    Max,
    Sum,
};

enum class Category : std::uint8_t {
    Arithmetic,
    Comparison,
    Logical,
    Conversion,
    Datetime,
    Math,
    Aggregate,
};

/// How an operator is spelled relative to its operands.
enum class Notation : std::uint8_t {
    Infix,
    Prefix,
    Postfix,
    Call,
};

[[nodiscard]] auto category(Function function) noexcept -> Category;
[[nodiscard]] auto notation(Function function) noexcept -> Notation;
/// Operator symbol (`+`, `==`, `AND`, `IS NULL`) or function class name (`Count`).
[[nodiscard]] auto symbol(Function function) noexcept -> std::string_view;
/// Comparison and logical expressions produce predicates.
[[nodiscard]] auto is_predicate(Function function) noexcept -> bool;

/// Base class of the feature algebra.
///
/// Features are immutable, shared and compared structurally: two separately
/// built `student.score > 2` trees are equal and hash alike. Nodes are created
/// through the builder functions below, never mutated afterwards.
class Feature : public std::enable_shared_from_this<Feature> {
   public:
    virtual ~Feature() = default;

    Feature(const Feature&) = delete;
    auto operator=(const Feature&) -> Feature& = delete;

    [[nodiscard]] auto type() const noexcept -> FeatureType { return type_; }
    [[nodiscard]] auto hash() const noexcept -> std::size_t { return hash_; }

    /// Explicit name (element field name or alias); expressions have none.
    [[nodiscard]] virtual auto name() const -> std::optional<std::string> { return std::nullopt; }
    [[nodiscard]] virtual auto kind() const -> const KindPtr& = 0;
    [[nodiscard]] virtual auto repr() const -> std::string = 0;

    /// Shared handle to this node.
    [[nodiscard]] auto self() const -> FeaturePtr { return shared_from_this(); }

    /// The operable part of this feature (the aliased operand for an alias).
    [[nodiscard]] virtual auto operable() const -> FeaturePtr { return self(); }

    virtual void accept(FeatureVisitor& visitor) const = 0;

    friend auto operator==(const Feature& lhs, const Feature& rhs) -> bool {
        return &lhs == &rhs ||
               (lhs.type_ == rhs.type_ && lhs.hash_ == rhs.hash_ && lhs.equals(rhs));
    }

   protected:
    Feature(FeatureType type, std::size_t hash) : type_(type), hash_(hash) {}

    /// Field-wise comparison against a node of the same type.
    [[nodiscard]] virtual auto equals(const Feature& other) const -> bool = 0;

   private:
    FeatureType type_;
    std::size_t hash_;
};

// ─── Ordering ────────────────────────────────────────────────────────────────

enum class Direction : std::uint8_t {
    Ascending,
    Descending,
};

/// Case insensitive `asc`/`ascending`/`desc`/`descending`.
[[nodiscard]] auto parse_direction(std::string_view token) -> Direction;
[[nodiscard]] auto to_string(Direction direction) noexcept -> std::string_view;

class OrderTerm;

/// Ordering specification: an operable feature and a direction.
struct Ordering {
    Ordering(FeaturePtr feature, Direction direction = Direction::Ascending);

    /// Pair features with directions. A feature followed by a direction token
    /// takes that direction, a bare feature is ascending, a pair is taken as
    /// is. A direction without a preceding feature raises GrammarError.
    [[nodiscard]] static auto make(const std::vector<OrderTerm>& terms) -> std::vector<Ordering>;

    [[nodiscard]] auto hash() const noexcept -> std::size_t;
    [[nodiscard]] auto repr() const -> std::string;

    friend auto operator==(const Ordering& lhs, const Ordering& rhs) -> bool;

    FeaturePtr feature;
    Direction direction;
};

/// One item of an ordering specification.
class OrderTerm {
   public:
    OrderTerm(FeaturePtr feature) : term_(std::move(feature)) {}
    template <typename T>
        requires std::convertible_to<T*, const Feature*>
    OrderTerm(std::shared_ptr<T> feature) : term_(FeaturePtr(std::move(feature))) {}
    OrderTerm(Direction direction) : term_(direction) {}
    OrderTerm(const char* direction) : term_(parse_direction(direction)) {}
    OrderTerm(const std::string& direction) : term_(parse_direction(direction)) {}
    OrderTerm(Ordering ordering) : term_(std::move(ordering)) {}
    OrderTerm(FeaturePtr feature, Direction direction)
        : term_(Ordering(std::move(feature), direction)) {}
    OrderTerm(FeaturePtr feature, std::string_view direction)
        : term_(Ordering(std::move(feature), parse_direction(direction))) {}

    [[nodiscard]] auto feature() const -> const FeaturePtr* { return std::get_if<FeaturePtr>(&term_); }
    [[nodiscard]] auto direction() const -> const Direction* { return std::get_if<Direction>(&term_); }
    [[nodiscard]] auto ordering() const -> const Ordering* { return std::get_if<Ordering>(&term_); }

   private:
    std::variant<FeaturePtr, Direction, Ordering> term_;
};

// ─── Nodes ───────────────────────────────────────────────────────────────────

/// A named wrapper around an operable feature.
class Aliased final : public Feature {
   public:
    Aliased(FeaturePtr operable, std::string name);

    [[nodiscard]] auto name() const -> std::optional<std::string> override { return name_; }
    [[nodiscard]] auto alias() const noexcept -> const std::string& { return name_; }
    [[nodiscard]] auto kind() const -> const KindPtr& override { return operable_->kind(); }
    [[nodiscard]] auto operable() const -> FeaturePtr override { return operable_; }
    [[nodiscard]] auto repr() const -> std::string override;
    void accept(FeatureVisitor& visitor) const override;

   protected:
    [[nodiscard]] auto equals(const Feature& other) const -> bool override;

   private:
    FeaturePtr operable_;
    std::string name_;
};

/// A constant; the kind is inferred from the value.
class Literal final : public Feature {
   public:
    explicit Literal(Value value);

    [[nodiscard]] auto value() const noexcept -> const Value& { return value_; }
    [[nodiscard]] auto kind() const -> const KindPtr& override { return kind_; }
    [[nodiscard]] auto repr() const -> std::string override { return value_.repr(); }
    void accept(FeatureVisitor& visitor) const override;

   protected:
    [[nodiscard]] auto equals(const Feature& other) const -> bool override;

   private:
    Value value_;
    KindPtr kind_;
};

/// A named field of an origin (Table or Reference).
class Element : public Feature {
   public:
    Element(SourcePtr origin, std::string name);

    [[nodiscard]] auto origin() const noexcept -> const SourcePtr& { return origin_; }
    [[nodiscard]] auto field() const noexcept -> const std::string& { return name_; }
    [[nodiscard]] auto name() const -> std::optional<std::string> override { return name_; }
    [[nodiscard]] auto kind() const -> const KindPtr& override { return kind_; }
    [[nodiscard]] auto repr() const -> std::string override;
    /// True when the origin is a Table.
    [[nodiscard]] virtual auto is_column() const noexcept -> bool { return false; }
    void accept(FeatureVisitor& visitor) const override;

   protected:
    [[nodiscard]] auto equals(const Feature& other) const -> bool override;

   private:
    SourcePtr origin_;
    std::string name_;
    KindPtr kind_;
};

/// Element whose origin is a Table.
class Column final : public Element {
   public:
    Column(SourcePtr table, std::string name);

    [[nodiscard]] auto is_column() const noexcept -> bool override { return true; }
};

/// Operator or function application.
class Expression final : public Feature {
   public:
    /// `target` is the destination kind of a Cast and null otherwise.
    Expression(Function function, std::vector<FeaturePtr> operands, KindPtr target = nullptr);

    [[nodiscard]] auto function() const noexcept -> Function { return function_; }
    [[nodiscard]] auto operands() const noexcept -> const std::vector<FeaturePtr>& {
        return operands_;
    }
    [[nodiscard]] auto target() const noexcept -> const KindPtr& { return target_; }
    [[nodiscard]] auto kind() const -> const KindPtr& override { return kind_; }
    [[nodiscard]] auto repr() const -> std::string override;
    void accept(FeatureVisitor& visitor) const override;

   protected:
    [[nodiscard]] auto equals(const Feature& other) const -> bool override;

   private:
    Function function_;
    std::vector<FeaturePtr> operands_;
    KindPtr target_;
    KindPtr kind_;
};

/// Aggregate function applied over a partitioned and ordered window frame.
class Window final : public Feature {
   public:
    struct Frame {
        enum class Mode : std::uint8_t { Rows, Groups, Range };

        Mode mode = Mode::Rows;
        /// Bound offsets relative to the current row: nullopt is unbounded,
        /// negative preceding, zero the current row and positive following.
        std::optional<std::int64_t> start;
        std::optional<std::int64_t> end;

        friend auto operator==(const Frame&, const Frame&) -> bool = default;
    };

    Window(FeaturePtr function, std::vector<FeaturePtr> partition, std::vector<Ordering> ordering,
           std::optional<Frame> frame);

    [[nodiscard]] auto function() const noexcept -> const FeaturePtr& { return function_; }
    [[nodiscard]] auto partition() const noexcept -> const std::vector<FeaturePtr>& {
        return partition_;
    }
    [[nodiscard]] auto ordering() const noexcept -> const std::vector<Ordering>& {
        return ordering_;
    }
    [[nodiscard]] auto frame() const noexcept -> const std::optional<Frame>& { return frame_; }
    [[nodiscard]] auto kind() const -> const KindPtr& override { return function_->kind(); }
    [[nodiscard]] auto repr() const -> std::string override;
    void accept(FeatureVisitor& visitor) const override;

   protected:
    [[nodiscard]] auto equals(const Feature& other) const -> bool override;

   private:
    FeaturePtr function_;
    std::vector<FeaturePtr> partition_;
    std::vector<Ordering> ordering_;
    std::optional<Frame> frame_;
};

[[nodiscard]] auto to_string(Window::Frame::Mode mode) noexcept -> std::string_view;

// ─── Visitor ─────────────────────────────────────────────────────────────────

/// Feature tree visitor. The defaults descend into the operands first and
/// then call `visit_feature` on the node itself.
class FeatureVisitor {
   public:
    virtual ~FeatureVisitor() = default;

    virtual void visit_feature(const Feature& feature);
    virtual void visit_aliased(const Aliased& feature);
    virtual void visit_literal(const Literal& feature);
    virtual void visit_element(const Element& feature);
    virtual void visit_expression(const Expression& feature);
    virtual void visit_window(const Window& feature);
};

// ─── Predicate factors ───────────────────────────────────────────────────────

/// Mapping of Tables to the primitive predicates involving only that table.
class Factors {
   public:
    using Item = std::pair<SourcePtr, FeaturePtr>;

    Factors() = default;
    /// Each predicate must involve exactly one table.
    explicit Factors(const std::vector<FeaturePtr>& predicates);

    /// Combine two factor maps: shared tables with differing predicates are
    /// joined with `op` (And/Or), the rest is taken from whichever side has it.
    [[nodiscard]] static auto merge(const Factors& left, const Factors& right, Function op)
        -> Factors;

    [[nodiscard]] auto operator&(const Factors& other) const -> Factors {
        return merge(*this, other, Function::And);
    }
    [[nodiscard]] auto operator|(const Factors& other) const -> Factors {
        return merge(*this, other, Function::Or);
    }

    /// Predicate of the given table or nullptr.
    [[nodiscard]] auto find(const Source& table) const -> FeaturePtr;
    [[nodiscard]] auto size() const noexcept -> std::size_t { return items_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return items_.empty(); }
    [[nodiscard]] auto begin() const noexcept { return items_.begin(); }
    [[nodiscard]] auto end() const noexcept { return items_.end(); }

   private:
    std::vector<Item> items_;
};

/// Break a predicate down into its single-table factors.
///
/// And/Or merge their operands' factors, Not passes its operand's factors
/// through, any other predicate is a factor of its table when its columns
/// involve exactly one table.
[[nodiscard]] auto factors(const FeaturePtr& predicate) -> Factors;

// ─── Traits ──────────────────────────────────────────────────────────────────

/// Feature classes usable with dissect/ensure_in/ensure_notin.
enum class Trait : std::uint8_t {
    Aliased,
    Literal,
    Element,
    Column,
    Expression,
    Aggregate,
    Window,
    Cumulative,  ///< aggregate or window
};

[[nodiscard]] auto trait_name(Trait trait) noexcept -> std::string_view;
[[nodiscard]] auto is(Trait trait, const Feature& feature) noexcept -> bool;

/// All (deduplicated) sub-features of the given trait, the features included.
[[nodiscard]] auto dissect(Trait trait, const std::vector<FeaturePtr>& features) -> FeatureSet;
[[nodiscard]] auto dissect(Trait trait, const FeaturePtr& feature) -> FeatureSet;

/// Raise GrammarError unless the feature contains a node of the trait.
auto ensure_in(Trait trait, const FeaturePtr& feature) -> const FeaturePtr&;
/// Raise GrammarError if the feature contains a node of the trait.
auto ensure_notin(Trait trait, const FeaturePtr& feature) -> const FeaturePtr&;

/// Return the feature if operable (not an alias), raise GrammarError otherwise.
auto ensure_operable(const FeaturePtr& feature) -> const FeaturePtr&;
/// Return the operable feature if of Boolean kind, raise GrammarError otherwise.
auto ensure_predicate(const FeaturePtr& feature) -> const FeaturePtr&;

// ─── Builders ────────────────────────────────────────────────────────────────

/// Operand of the builder functions: a feature, or a native value that gets
/// wrapped into a Literal. Aliases are reduced to their operable.
class Term {
   public:
    Term(FeaturePtr feature);
    template <typename T>
        requires std::convertible_to<T*, const Feature*>
    Term(std::shared_ptr<T> feature) : Term(FeaturePtr(std::move(feature))) {}
    Term(bool value);
    Term(int value);
    Term(std::int64_t value);
    Term(double value);
    Term(const char* value);
    Term(std::string value);
    Term(Decimal value);
    Term(Date value);
    Term(Timestamp value);
    Term(Value value);

    [[nodiscard]] auto feature() const noexcept -> const FeaturePtr& { return feature_; }
    operator const FeaturePtr&() const noexcept { return feature_; }

   private:
    FeaturePtr feature_;
};

[[nodiscard]] auto literal(Value value) -> FeaturePtr;
[[nodiscard]] auto alias(const FeaturePtr& feature, std::string name) -> FeaturePtr;
/// Element of an origin; yields a Column when the origin is a Table.
[[nodiscard]] auto element(const SourcePtr& origin, std::string name) -> FeaturePtr;

[[nodiscard]] auto add(const Term& lhs, const Term& rhs) -> FeaturePtr;
[[nodiscard]] auto sub(const Term& lhs, const Term& rhs) -> FeaturePtr;
[[nodiscard]] auto mul(const Term& lhs, const Term& rhs) -> FeaturePtr;
[[nodiscard]] auto div(const Term& lhs, const Term& rhs) -> FeaturePtr;
[[nodiscard]] auto mod(const Term& lhs, const Term& rhs) -> FeaturePtr;

[[nodiscard]] auto lt(const Term& lhs, const Term& rhs) -> FeaturePtr;
[[nodiscard]] auto le(const Term& lhs, const Term& rhs) -> FeaturePtr;
[[nodiscard]] auto gt(const Term& lhs, const Term& rhs) -> FeaturePtr;
[[nodiscard]] auto ge(const Term& lhs, const Term& rhs) -> FeaturePtr;
[[nodiscard]] auto eq(const Term& lhs, const Term& rhs) -> FeaturePtr;
[[nodiscard]] auto ne(const Term& lhs, const Term& rhs) -> FeaturePtr;
[[nodiscard]] auto is_null(const Term& operand) -> FeaturePtr;
[[nodiscard]] auto not_null(const Term& operand) -> FeaturePtr;

[[nodiscard]] auto and_(const Term& lhs, const Term& rhs) -> FeaturePtr;
[[nodiscard]] auto or_(const Term& lhs, const Term& rhs) -> FeaturePtr;
[[nodiscard]] auto not_(const Term& operand) -> FeaturePtr;

[[nodiscard]] auto cast(const Term& operand, KindPtr kind) -> FeaturePtr;
[[nodiscard]] auto year(const Term& operand) -> FeaturePtr;
[[nodiscard]] auto abs(const Term& operand) -> FeaturePtr;
[[nodiscard]] auto ceil(const Term& operand) -> FeaturePtr;
[[nodiscard]] auto floor(const Term& operand) -> FeaturePtr;

/// `count(*)`.
[[nodiscard]] auto count() -> FeaturePtr;
[[nodiscard]] auto count(const Term& operand) -> FeaturePtr;
[[nodiscard]] auto avg(const Term& operand) -> FeaturePtr;
[[nodiscard]] auto min(const Term& operand) -> FeaturePtr;
[[nodiscard]] auto max(const Term& operand) -> FeaturePtr;
[[nodiscard]] auto sum(const Term& operand) -> FeaturePtr;

/// Window of an aggregate function.
[[nodiscard]] auto over(const FeaturePtr& aggregate, std::vector<FeaturePtr> partition,
                        const std::vector<OrderTerm>& ordering = {},
                        std::optional<Window::Frame> frame = std::nullopt) -> FeaturePtr;

[[nodiscard]] inline auto operator+(const Term& lhs, const Term& rhs) -> FeaturePtr {
    return add(lhs, rhs);
}
[[nodiscard]] inline auto operator-(const Term& lhs, const Term& rhs) -> FeaturePtr {
    return sub(lhs, rhs);
}
[[nodiscard]] inline auto operator*(const Term& lhs, const Term& rhs) -> FeaturePtr {
    return mul(lhs, rhs);
}
[[nodiscard]] inline auto operator/(const Term& lhs, const Term& rhs) -> FeaturePtr {
    return div(lhs, rhs);
}
[[nodiscard]] inline auto operator%(const Term& lhs, const Term& rhs) -> FeaturePtr {
    return mod(lhs, rhs);
}
[[nodiscard]] inline auto operator&(const Term& lhs, const Term& rhs) -> FeaturePtr {
    return and_(lhs, rhs);
}
[[nodiscard]] inline auto operator|(const Term& lhs, const Term& rhs) -> FeaturePtr {
    return or_(lhs, rhs);
}
[[nodiscard]] inline auto operator~(const Term& operand) -> FeaturePtr {
    return not_(operand);
}

}  // namespace oryx::dsl
