#include <oryx/dsl/schema.hpp>

#include <oryx/core/error.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace oryx::dsl {

// ─── Field ───────────────────────────────────────────────────────────────────

Field::Field(KindPtr kind, std::optional<std::string> name)
    : kind_(std::move(kind)), name_(std::move(name)) {
    if (!kind_) {
        throw GrammarError("Field requires a kind");
    }
}

auto Field::renamed(std::string name) const -> Field {
    return Field(kind_, std::move(name));
}

auto Field::hash() const noexcept -> std::size_t {
    return kind_->hash() * 31 + (name_ ? std::hash<std::string>{}(*name_) : 0);
}

auto Field::repr() const -> std::string {
    return fmt::format("Field({}, {})", kind_->name(), name_ ? fmt::format("'{}'", *name_) : "None");
}

auto operator==(const Field& lhs, const Field& rhs) -> bool {
    return lhs.name_ == rhs.name_ && *lhs.kind_ == *rhs.kind_;
}

// ─── Schema ──────────────────────────────────────────────────────────────────

Schema::Schema(std::string name, std::vector<Entry> entries)
    : name_(std::move(name)), entries_(std::move(entries)) {
    for (const auto& entry : entries_) {
        hash_ ^= entry.field.hash();
    }
}

auto Schema::position(std::string_view key_or_name) const -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].key == key_or_name) {
            return i;
        }
    }
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].field.name() == key_or_name) {
            return i;
        }
    }
    return std::nullopt;
}

auto Schema::find(std::string_view key_or_name) const -> const Field* {
    auto pos = position(key_or_name);
    return pos ? &entries_[*pos].field : nullptr;
}

auto Schema::at(std::string_view key_or_name) const -> const Field& {
    const auto* field = find(key_or_name);
    if (field == nullptr) {
        throw GrammarError(fmt::format("Unknown field {}", key_or_name));
    }
    return *field;
}

auto Schema::names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
        names.push_back(*entry.field.name());
    }
    return names;
}

auto operator==(const Schema& lhs, const Schema& rhs) -> bool {
    if (&lhs == &rhs) {
        return true;
    }
    if (lhs.hash_ != rhs.hash_ || lhs.entries_.size() != rhs.entries_.size()) {
        return false;
    }
    return std::equal(lhs.entries_.begin(), lhs.entries_.end(), rhs.entries_.begin(),
                      [](const auto& a, const auto& b) { return a.field == b.field; });
}

// ─── SchemaBuilder ───────────────────────────────────────────────────────────

SchemaBuilder::SchemaBuilder(std::string name) : name_(std::move(name)) {}

auto SchemaBuilder::base(SchemaPtr schema) -> SchemaBuilder& {
    bases_.push_back(std::move(schema));
    return *this;
}

auto SchemaBuilder::field(std::string key, KindPtr kind, std::optional<std::string> name)
    -> SchemaBuilder& {
    return field(std::move(key), Field(std::move(kind), std::move(name)));
}

auto SchemaBuilder::field(std::string key, Field field) -> SchemaBuilder& {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&key](const auto& entry) { return entry.key == key; });
    if (it != fields_.end()) {
        it->field = std::move(field);
    } else {
        fields_.push_back({std::move(key), std::move(field)});
    }
    return *this;
}

auto SchemaBuilder::build() const -> SchemaPtr {
    // Inherited fields keyed by attribute key, first base wins on repeated keys.
    std::vector<Schema::Entry> entries;
    std::unordered_set<std::string> seen;
    std::unordered_map<std::string, std::string> existing;  // field name -> key
    std::size_t inherited = 0;
    for (const auto& base : bases_) {
        for (const auto& entry : base->entries()) {
            if (!seen.insert(entry.key).second) {
                continue;
            }
            ++inherited;
            existing.emplace(*entry.field.name(), entry.key);
            entries.push_back(entry);
        }
    }
    if (existing.size() < inherited) {
        throw GrammarError(fmt::format("Colliding base classes in schema {}", name_));
    }

    for (const auto& declared : fields_) {
        auto field = declared.field.name() ? declared.field : declared.field.renamed(declared.key);
        const auto& name = *field.name();
        if (auto it = existing.find(name); it != existing.end() && it->second != declared.key) {
            throw GrammarError(fmt::format("Colliding field name {} in schema {}", name, name_));
        }
        auto pos = std::find_if(entries.begin(), entries.end(),
                                [&declared](const auto& entry) { return entry.key == declared.key; });
        if (pos != entries.end()) {
            // An overridden key releases its previous name.
            if (const auto& previous = *pos->field.name(); previous != name) {
                existing.erase(previous);
            }
        }
        existing[name] = declared.key;
        if (pos != entries.end()) {
            pos->field = std::move(field);
        } else {
            entries.push_back({declared.key, std::move(field)});
        }
    }
    return std::make_shared<const Schema>(name_, std::move(entries));
}

}  // namespace oryx::dsl
