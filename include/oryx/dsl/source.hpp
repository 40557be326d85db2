#pragma once

#include <oryx/dsl/feature.hpp>
#include <oryx/dsl/schema.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace oryx::dsl {

class SourceVisitor;
class Table;
class Reference;
class Join;
class Set;
class Query;

using TablePtr = std::shared_ptr<const Table>;
using ReferencePtr = std::shared_ptr<const Reference>;
using JoinPtr = std::shared_ptr<const Join>;
using SetPtr = std::shared_ptr<const Set>;
using QueryPtr = std::shared_ptr<const Query>;

/// Structural hash/equality for source handles (use in hashed containers).
struct SourceHash {
    auto operator()(const SourcePtr& source) const noexcept -> std::size_t;
};
struct SourceEqual {
    auto operator()(const SourcePtr& lhs, const SourcePtr& rhs) const -> bool;
};

/// Source node categories.
enum class SourceType : std::uint8_t {
    Table,
    Reference,
    Join,
    Set,
    Query,
};

enum class JoinKind : std::uint8_t {
    Inner,
    Left,
    Right,
    Full,
    Cross,
};

enum class SetKind : std::uint8_t {
    Union,
    Intersection,
    Difference,
};

[[nodiscard]] auto to_string(JoinKind kind) noexcept -> std::string_view;
[[nodiscard]] auto to_string(SetKind kind) noexcept -> std::string_view;

/// Row restriction of a query.
struct Rows {
    std::int64_t count = 0;
    std::int64_t offset = 0;

    [[nodiscard]] auto repr() const -> std::string;

    friend auto operator==(const Rows&, const Rows&) -> bool = default;
};

/// Base class of the frame algebra.
///
/// Sources are immutable, shared and structurally comparable. Every
/// transformation returns a new node. Sources must be owned by a shared_ptr
/// (use the `make` factories) since their features refer back to them.
class Source : public std::enable_shared_from_this<Source> {
   public:
    virtual ~Source() = default;

    Source(const Source&) = delete;
    auto operator=(const Source&) -> Source& = delete;

    [[nodiscard]] auto type() const noexcept -> SourceType { return type_; }
    [[nodiscard]] auto hash() const noexcept -> std::size_t { return hash_; }
    [[nodiscard]] auto self() const -> SourcePtr { return shared_from_this(); }

    /// Features logically provided by this source.
    [[nodiscard]] virtual auto features() const -> std::vector<FeaturePtr> = 0;
    /// Schema of this source (derived from its features unless a Table or Reference).
    [[nodiscard]] virtual auto schema() const -> const SchemaPtr& = 0;
    [[nodiscard]] virtual auto repr() const -> std::string = 0;

    /// Feature by schema attribute key or field name; GrammarError if unknown.
    [[nodiscard]] auto at(std::string_view key_or_name) const -> FeaturePtr;
    [[nodiscard]] auto operator[](std::string_view key_or_name) const -> FeaturePtr {
        return at(key_or_name);
    }

    /// Underlying source (differs from self only for a Reference).
    [[nodiscard]] virtual auto instance() const -> SourcePtr { return self(); }
    /// Query over this source (a Query returns itself).
    [[nodiscard]] virtual auto query() const -> QueryPtr;
    /// Complete statement: a Query or a Set.
    [[nodiscard]] virtual auto statement() const -> SourcePtr;

    /// Independent alias of this source; a random 8 letter name when not given.
    [[nodiscard]] auto reference(std::optional<std::string> name = std::nullopt) const
        -> ReferencePtr;

    [[nodiscard]] auto union_(const SourcePtr& other) const -> SetPtr;
    [[nodiscard]] auto intersection(const SourcePtr& other) const -> SetPtr;
    [[nodiscard]] auto difference(const SourcePtr& other) const -> SetPtr;

    // Queryable interface. Repeated select/groupby/orderby/limit replace the
    // earlier setting, repeated where/having combine conditions with AND.
    [[nodiscard]] virtual auto select(std::vector<FeaturePtr> features) const -> QueryPtr;
    [[nodiscard]] virtual auto where(const FeaturePtr& condition) const -> QueryPtr;
    [[nodiscard]] virtual auto having(const FeaturePtr& condition) const -> QueryPtr;
    [[nodiscard]] virtual auto groupby(std::vector<FeaturePtr> features) const -> QueryPtr;
    [[nodiscard]] virtual auto orderby(const std::vector<OrderTerm>& terms) const -> QueryPtr;
    [[nodiscard]] virtual auto limit(std::int64_t count, std::int64_t offset = 0) const
        -> QueryPtr;

    // Origin interface (Table, Reference and Join only).
    [[nodiscard]] auto join(const SourcePtr& other, JoinKind kind,
                            FeaturePtr condition = nullptr) const -> JoinPtr;
    [[nodiscard]] auto inner_join(const SourcePtr& other, FeaturePtr condition) const -> JoinPtr;
    [[nodiscard]] auto left_join(const SourcePtr& other, FeaturePtr condition) const -> JoinPtr;
    [[nodiscard]] auto right_join(const SourcePtr& other, FeaturePtr condition) const -> JoinPtr;
    [[nodiscard]] auto full_join(const SourcePtr& other, FeaturePtr condition) const -> JoinPtr;
    [[nodiscard]] auto cross_join(const SourcePtr& other) const -> JoinPtr;

    /// Table, Reference or Join.
    [[nodiscard]] auto is_origin() const noexcept -> bool {
        return type_ == SourceType::Table || type_ == SourceType::Reference ||
               type_ == SourceType::Join;
    }

    virtual void accept(SourceVisitor& visitor) const = 0;

    friend auto operator==(const Source& lhs, const Source& rhs) -> bool {
        return &lhs == &rhs ||
               (lhs.type_ == rhs.type_ && lhs.hash_ == rhs.hash_ && lhs.equals(rhs));
    }

   protected:
    Source(SourceType type, std::size_t hash) : type_(type), hash_(hash) {}

    [[nodiscard]] virtual auto equals(const Source& other) const -> bool = 0;

    /// For nodes whose structure is only known after validating their members.
    void set_hash(std::size_t hash) noexcept { hash_ = hash; }

    /// Schema named `name` with a field per feature keyed by its name (or `_i`).
    [[nodiscard]] static auto derive_schema(std::string name,
                                            const std::vector<FeaturePtr>& features)
        -> SchemaPtr;

   private:
    SourceType type_;
    std::size_t hash_;
};

/// Leaf source backed by a schema.
class Table final : public Source {
   public:
    explicit Table(SchemaPtr schema);

    [[nodiscard]] static auto make(SchemaPtr schema) -> TablePtr;

    [[nodiscard]] auto name() const noexcept -> const std::string& { return schema_->name(); }
    [[nodiscard]] auto features() const -> std::vector<FeaturePtr> override;
    [[nodiscard]] auto schema() const -> const SchemaPtr& override { return schema_; }
    [[nodiscard]] auto repr() const -> std::string override { return schema_->name(); }
    void accept(SourceVisitor& visitor) const override;

   protected:
    [[nodiscard]] auto equals(const Source& other) const -> bool override;

   private:
    SchemaPtr schema_;
};

/// Named alias of another source's instance.
class Reference final : public Source {
   public:
    Reference(SourcePtr instance, std::string name);

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
    [[nodiscard]] auto instance() const -> SourcePtr override { return instance_; }
    [[nodiscard]] auto features() const -> std::vector<FeaturePtr> override;
    [[nodiscard]] auto schema() const -> const SchemaPtr& override { return instance_->schema(); }
    [[nodiscard]] auto repr() const -> std::string override;
    void accept(SourceVisitor& visitor) const override;

   protected:
    [[nodiscard]] auto equals(const Source& other) const -> bool override;

   private:
    SourcePtr instance_;
    std::string name_;
};

/// Two origins combined by a join condition (none for a cross join).
class Join final : public Source {
   public:
    Join(SourcePtr left, SourcePtr right, JoinKind kind, FeaturePtr condition = nullptr);

    [[nodiscard]] auto left() const noexcept -> const SourcePtr& { return left_; }
    [[nodiscard]] auto right() const noexcept -> const SourcePtr& { return right_; }
    [[nodiscard]] auto kind() const noexcept -> JoinKind { return kind_; }
    /// Null for a cross join.
    [[nodiscard]] auto condition() const noexcept -> const FeaturePtr& { return condition_; }
    [[nodiscard]] auto features() const -> std::vector<FeaturePtr> override;
    [[nodiscard]] auto schema() const -> const SchemaPtr& override { return schema_; }
    [[nodiscard]] auto repr() const -> std::string override;
    void accept(SourceVisitor& visitor) const override;

   protected:
    [[nodiscard]] auto equals(const Source& other) const -> bool override;

   private:
    SourcePtr left_;
    SourcePtr right_;
    JoinKind kind_;
    FeaturePtr condition_;
    SchemaPtr schema_;
};

/// Set operation of two statements with equal schemas.
class Set final : public Source {
   public:
    Set(const SourcePtr& left, const SourcePtr& right, SetKind kind);

    [[nodiscard]] auto left() const noexcept -> const SourcePtr& { return left_; }
    [[nodiscard]] auto right() const noexcept -> const SourcePtr& { return right_; }
    [[nodiscard]] auto kind() const noexcept -> SetKind { return kind_; }
    [[nodiscard]] auto statement() const -> SourcePtr override { return self(); }
    [[nodiscard]] auto features() const -> std::vector<FeaturePtr> override;
    [[nodiscard]] auto schema() const -> const SchemaPtr& override { return left_->schema(); }
    [[nodiscard]] auto repr() const -> std::string override;
    void accept(SourceVisitor& visitor) const override;

   protected:
    [[nodiscard]] auto equals(const Source& other) const -> bool override;

   private:
    SourcePtr left_;
    SourcePtr right_;
    SetKind kind_;
};

/// Source with projection, filtering, grouping, ordering and row limits.
class Query final : public Source {
   public:
    /// Validates that every clause only refers to the source's features and
    /// obeys the clause rules (predicates, aggregates, no windows in having).
    Query(SourcePtr source, std::vector<FeaturePtr> selection = {}, FeaturePtr prefilter = nullptr,
          std::vector<FeaturePtr> grouping = {}, FeaturePtr postfilter = nullptr,
          const std::vector<OrderTerm>& ordering = {}, std::optional<Rows> rows = std::nullopt);

    [[nodiscard]] auto source() const noexcept -> const SourcePtr& { return source_; }
    [[nodiscard]] auto selection() const noexcept -> const std::vector<FeaturePtr>& {
        return selection_;
    }
    [[nodiscard]] auto prefilter() const noexcept -> const FeaturePtr& { return prefilter_; }
    [[nodiscard]] auto grouping() const noexcept -> const std::vector<FeaturePtr>& {
        return grouping_;
    }
    [[nodiscard]] auto postfilter() const noexcept -> const FeaturePtr& { return postfilter_; }
    [[nodiscard]] auto ordering() const noexcept -> const std::vector<Ordering>& {
        return ordering_;
    }
    [[nodiscard]] auto rows() const noexcept -> const std::optional<Rows>& { return rows_; }

    [[nodiscard]] auto query() const -> QueryPtr override;
    [[nodiscard]] auto statement() const -> SourcePtr override { return self(); }
    /// The selection, or the source features when nothing is selected.
    [[nodiscard]] auto features() const -> std::vector<FeaturePtr> override;
    [[nodiscard]] auto schema() const -> const SchemaPtr& override { return schema_; }
    [[nodiscard]] auto repr() const -> std::string override;
    void accept(SourceVisitor& visitor) const override;

    [[nodiscard]] auto select(std::vector<FeaturePtr> features) const -> QueryPtr override;
    [[nodiscard]] auto where(const FeaturePtr& condition) const -> QueryPtr override;
    [[nodiscard]] auto having(const FeaturePtr& condition) const -> QueryPtr override;
    [[nodiscard]] auto groupby(std::vector<FeaturePtr> features) const -> QueryPtr override;
    [[nodiscard]] auto orderby(const std::vector<OrderTerm>& terms) const -> QueryPtr override;
    [[nodiscard]] auto limit(std::int64_t count, std::int64_t offset = 0) const
        -> QueryPtr override;

   protected:
    [[nodiscard]] auto equals(const Source& other) const -> bool override;

   private:
    [[nodiscard]] auto order_terms() const -> std::vector<OrderTerm>;

    SourcePtr source_;
    std::vector<FeaturePtr> selection_;
    FeaturePtr prefilter_;
    std::vector<FeaturePtr> grouping_;
    FeaturePtr postfilter_;
    std::vector<Ordering> ordering_;
    std::optional<Rows> rows_;
    SchemaPtr schema_;
};

// ─── Visitor ─────────────────────────────────────────────────────────────────

/// Source tree visitor. The defaults descend into the children first and then
/// call `visit_source` on the node itself.
class SourceVisitor {
   public:
    virtual ~SourceVisitor() = default;

    virtual void visit_source(const Source& source);
    virtual void visit_table(const Table& source);
    virtual void visit_reference(const Reference& source);
    virtual void visit_join(const Join& source);
    virtual void visit_set(const Set& source);
    virtual void visit_query(const Query& source);
};

}  // namespace oryx::dsl
