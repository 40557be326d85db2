#pragma once

#include <oryx/dsl/kind.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace oryx::dsl {

/// Schema field: a kind and an optional name.
class Field {
   public:
    explicit Field(KindPtr kind, std::optional<std::string> name = std::nullopt);

    [[nodiscard]] auto kind() const noexcept -> const KindPtr& { return kind_; }
    [[nodiscard]] auto name() const noexcept -> const std::optional<std::string>& { return name_; }

    /// Copy of this field with a different name.
    [[nodiscard]] auto renamed(std::string name) const -> Field;

    [[nodiscard]] auto hash() const noexcept -> std::size_t;
    [[nodiscard]] auto repr() const -> std::string;

    friend auto operator==(const Field& lhs, const Field& rhs) -> bool;

   private:
    KindPtr kind_;
    std::optional<std::string> name_;
};

class Schema;
using SchemaPtr = std::shared_ptr<const Schema>;

/// Ordered, named collection of fields.
///
/// Each field is registered under an attribute key and carries a (possibly
/// different) final name; lookups accept either. Equality and hashing are
/// purely structural over the ordered fields.
class Schema {
   public:
    struct Entry {
        std::string key;
        Field field;
    };

    Schema(std::string name, std::vector<Entry> entries);

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
    [[nodiscard]] auto entries() const noexcept -> const std::vector<Entry>& { return entries_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }

    /// Field by attribute key or by field name; nullptr if unknown.
    [[nodiscard]] auto find(std::string_view key_or_name) const -> const Field*;
    /// Position of the field by attribute key or by field name.
    [[nodiscard]] auto position(std::string_view key_or_name) const -> std::optional<std::size_t>;
    /// Field by attribute key or by field name; GrammarError if unknown.
    [[nodiscard]] auto at(std::string_view key_or_name) const -> const Field&;
    [[nodiscard]] auto operator[](std::string_view key_or_name) const -> const Field& {
        return at(key_or_name);
    }

    /// Final field names in order.
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    [[nodiscard]] auto hash() const noexcept -> std::size_t { return hash_; }

    friend auto operator==(const Schema& lhs, const Schema& rhs) -> bool;

   private:
    std::string name_;
    std::vector<Entry> entries_;
    std::size_t hash_ = 0;
};

/// Builds a schema from base schemas and keyed field declarations.
///
///     auto student = SchemaBuilder("student")
///                        .field("surname", Kind::string())
///                        .field("dob", Kind::date(), "birthday")
///                        .build();
class SchemaBuilder {
   public:
    explicit SchemaBuilder(std::string name);

    auto base(SchemaPtr schema) -> SchemaBuilder&;
    auto field(std::string key, KindPtr kind, std::optional<std::string> name = std::nullopt)
        -> SchemaBuilder&;
    auto field(std::string key, Field field) -> SchemaBuilder&;

    /// Validate and produce the schema. Raises GrammarError on colliding
    /// bases or colliding field names.
    [[nodiscard]] auto build() const -> SchemaPtr;

   private:
    std::string name_;
    std::vector<SchemaPtr> bases_;
    std::vector<Schema::Entry> fields_;
};

}  // namespace oryx::dsl
