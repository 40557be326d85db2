#pragma once

#include <oryx/core/error.hpp>
#include <oryx/dsl/source.hpp>
#include <oryx/parser/container.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace oryx::parser {

/// Generic translator of a DSL statement into backend symbols.
///
/// `S` is the backend representation of a source and `F` of a feature. The
/// traversal and validation is shared, a backend only implements the
/// `generate_*` hooks. Explicit mappings passed at construction are used to
/// resolve tables and elements, and they also override the generated result
/// of any other mapped source or feature.
template <typename S, typename F>
class Visitor : public Container<S, F>, public dsl::SourceVisitor, public dsl::FeatureVisitor {
   public:
    using SourceMap = std::unordered_map<dsl::SourcePtr, S, dsl::SourceHash, dsl::SourceEqual>;
    using FeatureMap = std::unordered_map<dsl::FeaturePtr, F, dsl::FeatureHash, dsl::FeatureEqual>;
    using OrderSymbol = std::pair<F, dsl::Direction>;

    explicit Visitor(SourceMap sources = {}, FeatureMap features = {})
        : sources_(std::move(sources)), features_(std::move(features)) {}

    /// Translate a complete statement.
    [[nodiscard]] auto compile(const dsl::SourcePtr& statement) -> S {
        typename Container<S, F>::Scope scope(*this);
        statement->accept(*this);
        auto result = this->fetch_source();
        scope.close();
        return result;
    }

    /// Explicit symbol for a source, if mapped.
    [[nodiscard]] virtual auto resolve_source(const dsl::Source& source) -> std::optional<S> {
        if (auto it = sources_.find(source.self()); it != sources_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    /// Explicit symbol for a feature, if mapped.
    [[nodiscard]] virtual auto resolve_feature(const dsl::Feature& feature) -> std::optional<F> {
        if (auto it = features_.find(feature.self()); it != features_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    /// Translate a feature in its own context. Results are memoized.
    [[nodiscard]] auto generate_feature(const dsl::FeaturePtr& feature) -> F {
        if (auto it = memo_.find(feature); it != memo_.end()) {
            return it->second;
        }
        typename Container<S, F>::Scope scope(*this);
        feature->accept(*this);
        auto symbol = this->fetch_feature();
        scope.close();
        memo_.emplace(feature, symbol);
        return symbol;
    }

    // ─── Generators ──────────────────────────────────────────────────────────

    virtual auto generate_element(const S& origin, const F& element) -> F = 0;
    virtual auto generate_alias(const F& feature, const std::string& alias) -> F = 0;
    virtual auto generate_literal(const Value& value, const dsl::KindPtr& kind) -> F = 0;
    virtual auto generate_expression(const dsl::Expression& expression,
                                     const std::vector<F>& arguments) -> F = 0;

    virtual auto generate_window(const dsl::Window& window, const F& /*function*/,
                                 const std::vector<F>& /*partition*/,
                                 const std::vector<OrderSymbol>& /*ordering*/) -> F {
        throw UnsupportedError(
            fmt::format("Window functions not yet supported ({})", window.repr()));
    }

    /// Table accessor given the fields actually required and the predicate
    /// that can be pushed down to it.
    virtual auto generate_table(const S& table, const std::vector<F>& /*features*/,
                                const std::optional<F>& /*predicate*/) -> S {
        return table;
    }

    /// Returns the referenced source symbol and the handle its elements
    /// should be generated against.
    virtual auto generate_reference(const S& instance, const std::string& name)
        -> std::pair<S, S> = 0;
    virtual auto generate_join(const S& left, const S& right, const std::optional<F>& condition,
                               dsl::JoinKind kind) -> S = 0;
    virtual auto generate_set(const S& left, const S& right, dsl::SetKind kind) -> S = 0;
    virtual auto generate_query(const S& source, const std::vector<F>& features,
                                const std::optional<F>& where, const std::vector<F>& groupby,
                                const std::optional<F>& having,
                                const std::vector<OrderSymbol>& orderby,
                                const std::optional<dsl::Rows>& rows) -> S = 0;

    // ─── Sources ─────────────────────────────────────────────────────────────

    void visit_table(const dsl::Table& table) override {
        auto origin = resolve_source(table);
        if (!origin) {
            throw UnprovisionedError(fmt::format("Unknown mapping for table {}", table.repr()));
        }
        auto& context = this->context();
        context.origins.insert_or_assign(table.self(), *origin);
        auto& segment = context.tables.segment(table.self());
        auto required = segment.sorted_fields();
        auto restriction = segment.predicate();

        std::vector<F> fields;
        fields.reserve(required.size());
        for (const auto& field : required) {
            fields.push_back(generate_feature(field));
        }
        std::optional<F> predicate;
        if (restriction) {
            predicate = generate_feature(restriction);
        }
        this->push_source(generate_table(*origin, fields, predicate));
    }

    void visit_reference(const dsl::Reference& reference) override {
        typename Container<S, F>::Scope scope(*this);
        reference.instance()->accept(*this);
        auto instance = this->fetch_source();
        scope.close();

        auto [origin, handle] = generate_reference(instance, reference.name());
        this->context().origins.insert_or_assign(reference.self(), std::move(handle));
        this->push_source(std::move(origin));
    }

    void visit_join(const dsl::Join& join) override {
        bypass_source(join, [&] {
            if (join.condition()) {
                this->context().tables.filter(join.condition());
            }
            join.left()->accept(*this);
            join.right()->accept(*this);
            auto right = this->pop_source();
            auto left = this->pop_source();
            std::optional<F> condition;
            if (join.condition()) {
                condition = generate_feature(join.condition());
            }
            this->push_source(generate_join(left, right, condition, join.kind()));
        });
    }

    void visit_set(const dsl::Set& set) override {
        bypass_source(set, [&] {
            set.left()->accept(*this);
            set.right()->accept(*this);
            auto right = this->pop_source();
            auto left = this->pop_source();
            this->push_source(generate_set(left, right, set.kind()));
        });
    }

    void visit_query(const dsl::Query& query) override {
        bypass_source(query, [&] {
            typename Container<S, F>::Scope scope(*this);
            auto features = query.features();
            auto& tables = this->context().tables;
            tables.select(features);
            if (query.prefilter()) {
                tables.filter(query.prefilter());
            }
            if (query.postfilter()) {
                tables.select({query.postfilter()});
            }
            tables.select(query.grouping());
            std::vector<dsl::FeaturePtr> ordered;
            for (const auto& ordering : query.ordering()) {
                ordered.push_back(ordering.feature);
            }
            tables.select(ordered);

            query.source()->accept(*this);

            auto columns = generate_features(features);
            std::optional<F> where;
            if (query.prefilter()) {
                where = generate_feature(query.prefilter());
            }
            auto groupby = generate_features(query.grouping());
            std::optional<F> having;
            if (query.postfilter()) {
                having = generate_feature(query.postfilter());
            }
            std::vector<OrderSymbol> orderby;
            for (const auto& ordering : query.ordering()) {
                orderby.emplace_back(generate_feature(ordering.feature), ordering.direction);
            }
            auto result = generate_query(this->pop_source(), columns, where, groupby, having,
                                         orderby, query.rows());
            scope.close();
            this->push_source(std::move(result));
        });
    }

    // ─── Features ────────────────────────────────────────────────────────────

    void visit_aliased(const dsl::Aliased& feature) override {
        bypass_feature(feature, [&] {
            this->push_feature(
                generate_alias(generate_feature(feature.operable()), feature.alias()));
        });
    }

    void visit_literal(const dsl::Literal& feature) override {
        this->push_feature(generate_literal(feature.value(), feature.kind()));
    }

    void visit_element(const dsl::Element& feature) override {
        const auto* origin = this->find_origin(feature.origin());
        if (origin == nullptr) {
            throw UnprovisionedError(
                fmt::format("Unknown origin {} of {}", feature.origin()->repr(), feature.repr()));
        }
        auto element = resolve_feature(feature);
        if (!element) {
            throw UnprovisionedError(fmt::format("Unknown mapping for {}", feature.repr()));
        }
        this->push_feature(generate_element(*origin, *element));
    }

    void visit_expression(const dsl::Expression& feature) override {
        bypass_feature(feature, [&] {
            this->push_feature(generate_expression(feature, generate_features(feature.operands())));
        });
    }

    void visit_window(const dsl::Window& feature) override {
        if (auto mapped = resolve_feature(feature)) {
            this->push_feature(std::move(*mapped));
            return;
        }
        auto function = generate_feature(feature.function());
        auto partition = generate_features(feature.partition());
        std::vector<OrderSymbol> ordering;
        for (const auto& order : feature.ordering()) {
            ordering.emplace_back(generate_feature(order.feature), order.direction);
        }
        this->push_feature(generate_window(feature, function, partition, ordering));
    }

   protected:
    [[nodiscard]] auto generate_features(const std::vector<dsl::FeaturePtr>& features)
        -> std::vector<F> {
        std::vector<F> symbols;
        symbols.reserve(features.size());
        for (const auto& feature : features) {
            symbols.push_back(generate_feature(feature));
        }
        return symbols;
    }

   private:
    /// Run the default translation, then replace its result with an explicit
    /// mapping if there is one.
    template <typename Method>
    void bypass_source(const dsl::Source& subject, Method&& method) {
        method();
        if (auto replacement = resolve_source(subject)) {
            this->pop_source();
            spdlog::debug("Overriding result for {}", subject.repr());
            this->push_source(std::move(*replacement));
        }
    }

    template <typename Method>
    void bypass_feature(const dsl::Feature& subject, Method&& method) {
        method();
        if (auto replacement = resolve_feature(subject)) {
            this->pop_feature();
            spdlog::debug("Overriding result for {}", subject.repr());
            this->push_feature(std::move(*replacement));
        }
    }

    SourceMap sources_;
    FeatureMap features_;
    FeatureMap memo_;
};

}  // namespace oryx::parser
