#pragma once

#include <oryx/core/value.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace oryx::dsl {

class Kind;
using KindPtr = std::shared_ptr<const Kind>;

/// Concrete kind variants.
enum class KindId : std::uint8_t {
    Boolean,
    Integer,
    Float,
    Decimal,
    String,
    Date,
    Timestamp,
    Array,
    Map,
    Struct,
};

/// Kind categories usable in `match`/`ensure` tests. Abstract categories
/// (`Any`, `Primitive`, `Numeric`, `Compound`) cover several variants and
/// `Date` also covers `Timestamp`.
enum class KindClass : std::uint8_t {
    Any,
    Primitive,
    Numeric,
    Boolean,
    Integer,
    Float,
    Decimal,
    String,
    Date,
    Timestamp,
    Compound,
    Array,
    Map,
    Struct,
};

/// DSL value type descriptor.
///
/// Primitive kinds are interned: `Kind::integer()` always returns the same
/// instance. Compound kinds are compared structurally by their parameters.
class Kind {
   public:
    struct Element {
        std::string name;
        KindPtr kind;
    };

    [[nodiscard]] static auto boolean() -> const KindPtr&;
    [[nodiscard]] static auto integer() -> const KindPtr&;
    [[nodiscard]] static auto floating() -> const KindPtr&;
    [[nodiscard]] static auto decimal() -> const KindPtr&;
    [[nodiscard]] static auto string() -> const KindPtr&;
    [[nodiscard]] static auto date() -> const KindPtr&;
    [[nodiscard]] static auto timestamp() -> const KindPtr&;
    [[nodiscard]] static auto primitive(KindId id) -> const KindPtr&;

    [[nodiscard]] static auto array(KindPtr element) -> KindPtr;
    [[nodiscard]] static auto map(KindPtr key, KindPtr value) -> KindPtr;
    [[nodiscard]] static auto structure(std::vector<Element> elements) -> KindPtr;

    [[nodiscard]] auto id() const noexcept -> KindId { return id_; }
    [[nodiscard]] auto is_primitive() const noexcept -> bool { return id_ < KindId::Array; }
    [[nodiscard]] auto is_numeric() const noexcept -> bool {
        return id_ == KindId::Integer || id_ == KindId::Float || id_ == KindId::Decimal;
    }

    /// Relative size used to pick the widest kind in mixed arithmetic.
    [[nodiscard]] auto rank() const noexcept -> std::size_t;

    [[nodiscard]] auto name() const -> std::string;

    /// Array element kind.
    [[nodiscard]] auto element() const -> const KindPtr&;
    /// Map key kind.
    [[nodiscard]] auto key() const -> const KindPtr&;
    /// Map value kind.
    [[nodiscard]] auto value() const -> const KindPtr&;
    /// Struct elements.
    [[nodiscard]] auto elements() const noexcept -> const std::vector<Element>& {
        return elements_;
    }

    /// True if `other` is an instance of this kind's class (a `Date` matches
    /// a `Timestamp`, an `Array` matches any array).
    [[nodiscard]] auto match(const Kind& other) const noexcept -> bool;

    /// Convert a native value to this kind, raising CastError on failure.
    [[nodiscard]] auto cast(const Value& value) const -> Value;

    [[nodiscard]] auto hash() const noexcept -> std::size_t { return hash_; }

    friend auto operator==(const Kind& lhs, const Kind& rhs) -> bool;

    Kind(KindId id, std::vector<KindPtr> params, std::vector<Element> elements);

   private:
    KindId id_;
    std::vector<KindPtr> params_;
    std::vector<Element> elements_;
    std::size_t hash_ = 0;
};

/// True if `kind` belongs to the category.
[[nodiscard]] auto match(KindClass cls, const Kind& kind) noexcept -> bool;

/// Return `kind` if it belongs to the category, raise GrammarError otherwise.
auto ensure(KindClass cls, const KindPtr& kind) -> const KindPtr&;

[[nodiscard]] auto class_name(KindClass cls) -> std::string_view;

/// Infer the kind of a native value.
///
/// Scalars map to their primitive kind; a non-empty array to `Array` of its
/// first item; a non-empty map with homogeneous keys and values to `Map`, with
/// heterogeneous values but string keys to `Struct`. Empty containers and
/// other mappings raise GrammarError.
[[nodiscard]] auto reflect(const Value& value) -> KindPtr;

/// Structural equality of two (possibly null) kind handles.
[[nodiscard]] inline auto same(const KindPtr& lhs, const KindPtr& rhs) -> bool {
    return lhs == rhs || (lhs && rhs && *lhs == *rhs);
}

}  // namespace oryx::dsl
