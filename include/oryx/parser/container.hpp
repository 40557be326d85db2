#pragma once

#include <oryx/core/error.hpp>
#include <oryx/dsl/source.hpp>

#include <memory>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace oryx::parser {

/// Stack of symbols produced while translating a tree.
template <typename Symbol>
class Symbols {
   public:
    void push(Symbol symbol) { stack_.push_back(std::move(symbol)); }

    auto pop() -> Symbol {
        if (stack_.empty()) {
            throw StateError("Empty context");
        }
        Symbol symbol = std::move(stack_.back());
        stack_.pop_back();
        return symbol;
    }

    [[nodiscard]] auto dirty() const noexcept -> bool { return !stack_.empty(); }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return stack_.size(); }

   private:
    std::vector<Symbol> stack_;
};

/// Per-table requirements collected while parsing a query: the columns it
/// needs (vertical) and the predicates restricting its rows (horizontal).
class Tables {
   public:
    struct Segment {
        dsl::FeatureSet fields;
        dsl::FeatureSet factors;

        /// Fields ordered by their textual form.
        [[nodiscard]] auto sorted_fields() const -> std::vector<dsl::FeaturePtr>;
        /// Disjunction of the factors ordered by their textual form, null if none.
        [[nodiscard]] auto predicate() const -> dsl::FeaturePtr;
    };

    /// Segment of the table, created empty on first access.
    auto segment(const dsl::SourcePtr& table) -> Segment&;
    [[nodiscard]] auto find(const dsl::SourcePtr& table) const -> const Segment*;
    [[nodiscard]] auto size() const noexcept -> std::size_t { return segments_.size(); }

    /// Register the columns used by the features into their table segments.
    void select(const std::vector<dsl::FeaturePtr>& features);
    /// Register the predicate's columns and its single-table factors.
    void filter(const dsl::FeaturePtr& predicate);

   private:
    std::unordered_map<dsl::SourcePtr, Segment, dsl::SourceHash, dsl::SourceEqual> segments_;
};

/// Nested parsing contexts holding pending symbols.
///
/// Every context must be fully depleted (`fetch`ed) before it is left. Source
/// symbols of type `S` and feature symbols of type `F` share one stack.
template <typename S, typename F>
class Container {
   public:
    using Symbol = std::variant<S, F>;
    using Origins = std::unordered_map<dsl::SourcePtr, S, dsl::SourceHash, dsl::SourceEqual>;

    struct Context {
        Symbols<Symbol> symbols;
        Tables tables;
        Origins origins;

        [[nodiscard]] auto dirty() const noexcept -> bool { return symbols.dirty(); }
    };

    /// Guard entering a context on construction. `close()` leaves it checking
    /// for leftovers; a guard destroyed without `close()` (unwinding) simply
    /// restores the outer context.
    class Scope {
       public:
        explicit Scope(Container& container) : container_(container) { container_.enter(); }
        Scope(const Scope&) = delete;
        auto operator=(const Scope&) -> Scope& = delete;
        ~Scope() {
            if (!closed_) {
                container_.abandon();
            }
        }

        void close() {
            container_.exit();
            closed_ = true;
        }

       private:
        Container& container_;
        bool closed_ = false;
    };

    Container() = default;
    virtual ~Container() = default;

    Container(const Container&) = delete;
    auto operator=(const Container&) -> Container& = delete;

    /// Current context; StateError if none is active.
    [[nodiscard]] auto context() -> Context& {
        if (!context_) {
            throw StateError("Invalid context");
        }
        return *context_;
    }

    void enter() {
        stack_.push_back(std::move(context_));
        context_ = std::make_unique<Context>();
    }

    void exit() {
        if (context_ && context_->dirty()) {
            throw StateError("Context not fetched");
        }
        abandon();
    }

    /// Retrieve the single pending symbol and close the context.
    [[nodiscard]] auto fetch() -> Symbol {
        auto symbol = context().symbols.pop();
        if (context_->dirty()) {
            throw StateError("Premature fetch");
        }
        context_.reset();
        return symbol;
    }

    /// Symbol registered for the origin in this or any enclosing context.
    [[nodiscard]] auto find_origin(const dsl::SourcePtr& origin) const -> const S* {
        if (context_) {
            if (auto it = context_->origins.find(origin); it != context_->origins.end()) {
                return &it->second;
            }
        }
        for (auto level = stack_.rbegin(); level != stack_.rend(); ++level) {
            if (*level) {
                if (auto it = (*level)->origins.find(origin); it != (*level)->origins.end()) {
                    return &it->second;
                }
            }
        }
        return nullptr;
    }

   protected:
    void push_source(S symbol) {
        context().symbols.push(Symbol(std::in_place_index<0>, std::move(symbol)));
    }
    void push_feature(F symbol) {
        context().symbols.push(Symbol(std::in_place_index<1>, std::move(symbol)));
    }
    auto pop_source() -> S { return take<0>(context().symbols.pop()); }
    auto pop_feature() -> F { return take<1>(context().symbols.pop()); }
    auto fetch_source() -> S { return take<0>(fetch()); }
    auto fetch_feature() -> F { return take<1>(fetch()); }

   private:
    template <std::size_t I>
    static auto take(Symbol symbol) -> std::variant_alternative_t<I, Symbol> {
        if (symbol.index() != I) {
            throw StateError(I == 0 ? "Expecting source symbol" : "Expecting feature symbol");
        }
        return std::get<I>(std::move(symbol));
    }

    void abandon() noexcept {
        if (stack_.empty()) {
            context_.reset();
            return;
        }
        context_ = std::move(stack_.back());
        stack_.pop_back();
    }

    std::unique_ptr<Context> context_;
    std::vector<std::unique_ptr<Context>> stack_;
};

}  // namespace oryx::parser
