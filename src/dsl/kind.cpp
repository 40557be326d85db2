#include <oryx/dsl/kind.hpp>

#include <oryx/core/error.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <array>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace oryx::dsl {

namespace {

auto make_primitive(KindId id) -> KindPtr {
    return std::make_shared<const Kind>(id, std::vector<KindPtr>{}, std::vector<Kind::Element>{});
}

auto lower(std::string_view text) -> std::string {
    std::string out(text);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

auto parse_int64(std::string_view text) -> std::optional<std::int64_t> {
    std::int64_t out = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    if (result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return out;
}

auto parse_double(const std::string& text) -> std::optional<double> {
    if (text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    double out = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return out;
}

[[noreturn]] void fail_cast(const Value& value, const Kind& kind) {
    throw CastError(fmt::format("Can not cast {} to {}", value.repr(), kind.name()));
}

}  // namespace

Kind::Kind(KindId id, std::vector<KindPtr> params, std::vector<Element> elements)
    : id_(id), params_(std::move(params)), elements_(std::move(elements)) {
    hash_ = std::hash<int>{}(static_cast<int>(id_));
    for (const auto& param : params_) {
        hash_ = hash_ * 31 + param->hash();
    }
    for (const auto& element : elements_) {
        hash_ = hash_ * 31 + (std::hash<std::string>{}(element.name) ^ element.kind->hash());
    }
}

// ─── Singletons and factories ────────────────────────────────────────────────

auto Kind::primitive(KindId id) -> const KindPtr& {
    static const std::array<KindPtr, 7> instances{
        make_primitive(KindId::Boolean), make_primitive(KindId::Integer),
        make_primitive(KindId::Float),   make_primitive(KindId::Decimal),
        make_primitive(KindId::String),  make_primitive(KindId::Date),
        make_primitive(KindId::Timestamp),
    };
    if (id >= KindId::Array) {
        throw GrammarError("Compound kind is not a primitive");
    }
    return instances[static_cast<std::size_t>(id)];
}

auto Kind::boolean() -> const KindPtr& { return primitive(KindId::Boolean); }
auto Kind::integer() -> const KindPtr& { return primitive(KindId::Integer); }
auto Kind::floating() -> const KindPtr& { return primitive(KindId::Float); }
auto Kind::decimal() -> const KindPtr& { return primitive(KindId::Decimal); }
auto Kind::string() -> const KindPtr& { return primitive(KindId::String); }
auto Kind::date() -> const KindPtr& { return primitive(KindId::Date); }
auto Kind::timestamp() -> const KindPtr& { return primitive(KindId::Timestamp); }

auto Kind::array(KindPtr element) -> KindPtr {
    return std::make_shared<const Kind>(KindId::Array, std::vector<KindPtr>{std::move(element)},
                                        std::vector<Element>{});
}

auto Kind::map(KindPtr key, KindPtr value) -> KindPtr {
    return std::make_shared<const Kind>(
        KindId::Map, std::vector<KindPtr>{std::move(key), std::move(value)}, std::vector<Element>{});
}

auto Kind::structure(std::vector<Element> elements) -> KindPtr {
    return std::make_shared<const Kind>(KindId::Struct, std::vector<KindPtr>{},
                                        std::move(elements));
}

// ─── Properties ──────────────────────────────────────────────────────────────

auto Kind::rank() const noexcept -> std::size_t {
    switch (id_) {
        case KindId::Boolean:
            return 0;
        case KindId::Integer:
        case KindId::Decimal:
        case KindId::String:
        case KindId::Timestamp:
            return 1;
        case KindId::Float:
        case KindId::Date:
            return 2;
        case KindId::Array:
        case KindId::Map:
            return params_.size();
        case KindId::Struct:
            return elements_.size();
    }
    return 0;
}

auto Kind::name() const -> std::string {
    switch (id_) {
        case KindId::Boolean:
            return "Boolean";
        case KindId::Integer:
            return "Integer";
        case KindId::Float:
            return "Float";
        case KindId::Decimal:
            return "Decimal";
        case KindId::String:
            return "String";
        case KindId::Date:
            return "Date";
        case KindId::Timestamp:
            return "Timestamp";
        case KindId::Array:
            return fmt::format("Array({})", params_[0]->name());
        case KindId::Map:
            return fmt::format("Map({}, {})", params_[0]->name(), params_[1]->name());
        case KindId::Struct: {
            std::vector<std::string> parts;
            for (const auto& element : elements_) {
                parts.push_back(fmt::format("{}={}", element.name, element.kind->name()));
            }
            return fmt::format("Struct({})", fmt::join(parts, ", "));
        }
    }
    return "Any";
}

auto Kind::element() const -> const KindPtr& {
    if (id_ != KindId::Array) {
        throw GrammarError(fmt::format("{} has no element kind", name()));
    }
    return params_[0];
}

auto Kind::key() const -> const KindPtr& {
    if (id_ != KindId::Map) {
        throw GrammarError(fmt::format("{} has no key kind", name()));
    }
    return params_[0];
}

auto Kind::value() const -> const KindPtr& {
    if (id_ != KindId::Map) {
        throw GrammarError(fmt::format("{} has no value kind", name()));
    }
    return params_[1];
}

auto Kind::match(const Kind& other) const noexcept -> bool {
    if (id_ == KindId::Date) {
        return other.id_ == KindId::Date || other.id_ == KindId::Timestamp;
    }
    return other.id_ == id_;
}

auto operator==(const Kind& lhs, const Kind& rhs) -> bool {
    if (&lhs == &rhs) {
        return true;
    }
    if (lhs.id_ != rhs.id_ || lhs.hash_ != rhs.hash_ || lhs.params_.size() != rhs.params_.size() ||
        lhs.elements_.size() != rhs.elements_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.params_.size(); ++i) {
        if (!(*lhs.params_[i] == *rhs.params_[i])) {
            return false;
        }
    }
    for (std::size_t i = 0; i < lhs.elements_.size(); ++i) {
        if (lhs.elements_[i].name != rhs.elements_[i].name ||
            !(*lhs.elements_[i].kind == *rhs.elements_[i].kind)) {
            return false;
        }
    }
    return true;
}

// ─── Casting ─────────────────────────────────────────────────────────────────

auto Kind::cast(const Value& value) const -> Value {
    switch (id_) {
        case KindId::Boolean:
            if (const auto* v = value.get_if<bool>()) {
                return *v;
            }
            if (const auto* v = value.get_if<std::int64_t>()) {
                return *v != 0;
            }
            if (const auto* v = value.get_if<double>()) {
                return *v != 0.0;
            }
            if (const auto* v = value.get_if<Decimal>()) {
                return v->units != 0;
            }
            if (const auto* v = value.get_if<std::string>()) {
                auto text = lower(*v);
                if (text == "true" || text == "1") {
                    return true;
                }
                if (text == "false" || text == "0" || text.empty()) {
                    return false;
                }
            }
            break;
        case KindId::Integer:
            if (const auto* v = value.get_if<bool>()) {
                return static_cast<std::int64_t>(*v ? 1 : 0);
            }
            if (const auto* v = value.get_if<std::int64_t>()) {
                return *v;
            }
            if (const auto* v = value.get_if<double>()) {
                if (std::isfinite(*v)) {
                    return static_cast<std::int64_t>(std::trunc(*v));
                }
            }
            if (const auto* v = value.get_if<Decimal>()) {
                return static_cast<std::int64_t>(std::trunc(v->to_double()));
            }
            if (const auto* v = value.get_if<std::string>()) {
                if (auto parsed = parse_int64(*v)) {
                    return *parsed;
                }
            }
            break;
        case KindId::Float:
            if (const auto* v = value.get_if<bool>()) {
                return *v ? 1.0 : 0.0;
            }
            if (const auto* v = value.get_if<std::int64_t>()) {
                return static_cast<double>(*v);
            }
            if (const auto* v = value.get_if<double>()) {
                return *v;
            }
            if (const auto* v = value.get_if<Decimal>()) {
                return v->to_double();
            }
            if (const auto* v = value.get_if<std::string>()) {
                if (auto parsed = parse_double(*v)) {
                    return *parsed;
                }
            }
            break;
        case KindId::Decimal:
            if (const auto* v = value.get_if<bool>()) {
                return Decimal{*v ? 1 : 0, 0};
            }
            if (const auto* v = value.get_if<std::int64_t>()) {
                return Decimal{*v, 0};
            }
            if (const auto* v = value.get_if<double>()) {
                if (std::isfinite(*v)) {
                    return Decimal::from_double(*v);
                }
            }
            if (const auto* v = value.get_if<Decimal>()) {
                return *v;
            }
            if (const auto* v = value.get_if<std::string>()) {
                if (auto parsed = Decimal::parse(*v)) {
                    return *parsed;
                }
            }
            break;
        case KindId::String:
            if (const auto* v = value.get_if<std::string>()) {
                return *v;
            }
            if (const auto* v = value.get_if<Date>()) {
                return format_date(*v);
            }
            if (const auto* v = value.get_if<Timestamp>()) {
                return format_timestamp(*v);
            }
            return value.repr();
        case KindId::Date:
            if (const auto* v = value.get_if<Date>()) {
                return *v;
            }
            if (const auto* v = value.get_if<Timestamp>()) {
                return date_of(*v);
            }
            if (const auto* v = value.get_if<std::string>()) {
                if (auto parsed = parse_date(*v)) {
                    return *parsed;
                }
                if (auto parsed = parse_timestamp(*v)) {
                    return date_of(*parsed);
                }
            }
            break;
        case KindId::Timestamp:
            if (const auto* v = value.get_if<Timestamp>()) {
                return *v;
            }
            if (const auto* v = value.get_if<Date>()) {
                return timestamp_of(*v);
            }
            if (const auto* v = value.get_if<std::string>()) {
                if (auto parsed = parse_timestamp(*v)) {
                    return *parsed;
                }
            }
            break;
        case KindId::Array:
        case KindId::Map:
        case KindId::Struct:
            throw UnsupportedError(fmt::format("Casting to {} not supported", name()));
    }
    fail_cast(value, *this);
}

// ─── Categories ──────────────────────────────────────────────────────────────

auto match(KindClass cls, const Kind& kind) noexcept -> bool {
    switch (cls) {
        case KindClass::Any:
            return true;
        case KindClass::Primitive:
            return kind.is_primitive();
        case KindClass::Numeric:
            return kind.is_numeric();
        case KindClass::Compound:
            return !kind.is_primitive();
        case KindClass::Boolean:
            return kind.id() == KindId::Boolean;
        case KindClass::Integer:
            return kind.id() == KindId::Integer;
        case KindClass::Float:
            return kind.id() == KindId::Float;
        case KindClass::Decimal:
            return kind.id() == KindId::Decimal;
        case KindClass::String:
            return kind.id() == KindId::String;
        case KindClass::Date:
            return kind.id() == KindId::Date || kind.id() == KindId::Timestamp;
        case KindClass::Timestamp:
            return kind.id() == KindId::Timestamp;
        case KindClass::Array:
            return kind.id() == KindId::Array;
        case KindClass::Map:
            return kind.id() == KindId::Map;
        case KindClass::Struct:
            return kind.id() == KindId::Struct;
    }
    return false;
}

auto ensure(KindClass cls, const KindPtr& kind) -> const KindPtr& {
    if (!kind || !match(cls, *kind)) {
        throw GrammarError(fmt::format("{} not an instance of a {}", kind ? kind->name() : "None",
                                       class_name(cls)));
    }
    return kind;
}

auto class_name(KindClass cls) -> std::string_view {
    switch (cls) {
        case KindClass::Any:
            return "Any";
        case KindClass::Primitive:
            return "Primitive";
        case KindClass::Numeric:
            return "Numeric";
        case KindClass::Boolean:
            return "Boolean";
        case KindClass::Integer:
            return "Integer";
        case KindClass::Float:
            return "Float";
        case KindClass::Decimal:
            return "Decimal";
        case KindClass::String:
            return "String";
        case KindClass::Date:
            return "Date";
        case KindClass::Timestamp:
            return "Timestamp";
        case KindClass::Compound:
            return "Compound";
        case KindClass::Array:
            return "Array";
        case KindClass::Map:
            return "Map";
        case KindClass::Struct:
            return "Struct";
    }
    return "Any";
}

// ─── Reflection ──────────────────────────────────────────────────────────────

auto reflect(const Value& value) -> KindPtr {
    auto same = [](const auto& range, auto project) {
        for (const auto& item : range) {
            if (project(item).data.index() != project(range.front()).data.index()) {
                return false;
            }
        }
        return true;
    };

    if (value.is<bool>()) {
        return Kind::boolean();
    }
    if (value.is<std::int64_t>()) {
        return Kind::integer();
    }
    if (value.is<double>()) {
        return Kind::floating();
    }
    if (value.is<Decimal>()) {
        return Kind::decimal();
    }
    if (value.is<std::string>()) {
        return Kind::string();
    }
    if (value.is<Date>()) {
        return Kind::date();
    }
    if (value.is<Timestamp>()) {
        return Kind::timestamp();
    }
    if (const auto* array = value.get_if<Array>()) {
        if (!array->items.empty()) {
            return Kind::array(reflect(array->items.front()));
        }
    } else if (const auto* mapping = value.get_if<Map>()) {
        const auto& entries = mapping->entries;
        if (!entries.empty()) {
            auto key = [](const auto& entry) -> const Value& { return entry.first; };
            auto val = [](const auto& entry) -> const Value& { return entry.second; };
            if (same(entries, key)) {
                auto key_kind = reflect(entries.front().first);
                if (same(entries, val)) {
                    return Kind::map(key_kind, reflect(entries.front().second));
                }
                if (key_kind->id() == KindId::String) {
                    std::vector<Kind::Element> elements;
                    for (const auto& [k, v] : entries) {
                        elements.push_back({k.get<std::string>(), reflect(v)});
                    }
                    return Kind::structure(std::move(elements));
                }
            }
        }
    } else if (const auto* record = value.get_if<Struct>()) {
        if (!record->entries.empty()) {
            std::vector<Kind::Element> elements;
            for (const auto& [name, v] : record->entries) {
                elements.push_back({name, reflect(v)});
            }
            return Kind::structure(std::move(elements));
        }
    }
    throw GrammarError(fmt::format("Value {} is of unknown kind", value.repr()));
}

}  // namespace oryx::dsl
