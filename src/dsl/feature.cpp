#include <oryx/dsl/feature.hpp>

#include <oryx/core/error.hpp>
#include <oryx/dsl/source.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace oryx::dsl {

namespace {

auto combine(std::size_t seed, std::size_t value) -> std::size_t {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

auto tag(FeatureType type) -> std::size_t {
    return std::hash<int>{}(static_cast<int>(type) + 101);
}

auto same_feature(const FeaturePtr& lhs, const FeaturePtr& rhs) -> bool {
    return lhs == rhs || (lhs && rhs && *lhs == *rhs);
}

auto same_features(const std::vector<FeaturePtr>& lhs, const std::vector<FeaturePtr>& rhs)
    -> bool {
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), same_feature);
}

auto reprs(const std::vector<FeaturePtr>& features) -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(features.size());
    for (const auto& feature : features) {
        out.push_back(feature->repr());
    }
    return out;
}

auto render(Function function, const std::vector<FeaturePtr>& operands, const KindPtr& target)
    -> std::string {
    auto sym = symbol(function);
    switch (notation(function)) {
        case Notation::Infix:
            return fmt::format("{} {} {}", operands[0]->repr(), sym, operands[1]->repr());
        case Notation::Prefix:
            return fmt::format("{} {}", sym, operands[0]->repr());
        case Notation::Postfix:
            return fmt::format("{} {}", operands[0]->repr(), sym);
        case Notation::Call:
            break;
    }
    auto args = reprs(operands);
    if (target) {
        args.push_back(target->name());
    }
    return fmt::format("{}({})", sym, fmt::join(args, ", "));
}

auto arity_ok(Function function, std::size_t count) -> bool {
    switch (notation(function)) {
        case Notation::Infix:
            return count == 2;
        case Notation::Prefix:
        case Notation::Postfix:
            return count == 1;
        case Notation::Call:
            break;
    }
    return function == Function::Count ? count <= 1 : count == 1;
}

/// Validate the operands of a function and compute its result kind.
auto resolve_kind(Function function, const std::vector<FeaturePtr>& operands,
                  const KindPtr& target) -> KindPtr {
    auto numeric = [&operands]() {
        return std::all_of(operands.begin(), operands.end(), [](const auto& operand) {
            return match(KindClass::Numeric, *operand->kind());
        });
    };
    switch (category(function)) {
        case Category::Arithmetic: {
            if (!numeric()) {
                throw GrammarError(fmt::format("Invalid arithmetic operands for {}",
                                               render(function, operands, target)));
            }
            KindPtr widest = operands.front()->kind();
            for (const auto& operand : operands) {
                if (operand->kind()->rank() > widest->rank()) {
                    widest = operand->kind();
                }
            }
            return widest;
        }
        case Category::Comparison: {
            const auto& first = operands.front()->kind();
            bool uniform = std::all_of(operands.begin(), operands.end(), [&first](const auto& o) {
                return *o->kind() == *first;
            });
            if (!numeric() && !uniform) {
                throw GrammarError(fmt::format("Invalid operands for {} comparison",
                                               render(function, operands, target)));
            }
            return Kind::boolean();
        }
        case Category::Logical:
            for (const auto& operand : operands) {
                ensure(KindClass::Boolean, operand->kind());
            }
            return Kind::boolean();
        case Category::Conversion:
            if (!target) {
                throw GrammarError("Cast requires a target kind");
            }
            return target;
        case Category::Datetime:
            ensure(KindClass::Date, operands.front()->kind());
            return Kind::integer();
        case Category::Math:
            ensure(KindClass::Numeric, operands.front()->kind());
            return function == Function::Abs ? operands.front()->kind() : Kind::integer();
        case Category::Aggregate:
            if (function == Function::Count) {
                return Kind::integer();
            }
            if (!numeric()) {
                throw GrammarError(fmt::format("Invalid arithmetic operands for {}",
                                               render(function, operands, target)));
            }
            return operands.front()->kind();
    }
    throw GrammarError("Unknown function");
}

auto make_expression(Function function, std::vector<FeaturePtr> operands,
                     KindPtr target = nullptr) -> FeaturePtr {
    return std::make_shared<const Expression>(function, std::move(operands), std::move(target));
}

/// Distinct Tables referred by the columns of a feature.
auto tables_of(const FeaturePtr& feature) -> std::vector<SourcePtr> {
    std::vector<SourcePtr> tables;
    for (const auto& column : dissect(Trait::Column, feature)) {
        const auto& origin = static_cast<const Element&>(*column).origin();
        if (std::none_of(tables.begin(), tables.end(),
                         [&origin](const auto& table) { return *table == *origin; })) {
            tables.push_back(origin);
        }
    }
    return tables;
}

class Dissect final : public FeatureVisitor {
   public:
    explicit Dissect(Trait trait) : trait_(trait) {}

    void visit_feature(const Feature& feature) override {
        if (is(trait_, feature)) {
            found_.insert(feature.self());
        }
    }

    [[nodiscard]] auto found() -> FeatureSet& { return found_; }

   private:
    Trait trait_;
    FeatureSet found_;
};

}  // namespace

auto FeatureHash::operator()(const FeaturePtr& feature) const noexcept -> std::size_t {
    return feature ? feature->hash() : 0;
}

auto FeatureEqual::operator()(const FeaturePtr& lhs, const FeaturePtr& rhs) const -> bool {
    return same_feature(lhs, rhs);
}

// ─── Functions ───────────────────────────────────────────────────────────────

auto category(Function function) noexcept -> Category {
    switch (function) {
        case Function::Addition:
        case Function::Subtraction:
        case Function::Multiplication:
        case Function::Division:
        case Function::Modulus:
            return Category::Arithmetic;
        case Function::LessThan:
        case Function::LessEqual:
        case Function::GreaterThan:
        case Function::GreaterEqual:
        case Function::Equal:
        case Function::NotEqual:
        case Function::IsNull:
        case Function::NotNull:
            return Category::Comparison;
        case Function::And:
        case Function::Or:
        case Function::Not:
            return Category::Logical;
        case Function::Cast:
            return Category::Conversion;
        case Function::Year:
            return Category::Datetime;
        case Function::Abs:
        case Function::Ceil:
        case Function::Floor:
            return Category::Math;
        case Function::Count:
        case Function::Avg:
        case Function::Min:
        case Function::Max:
        case Function::Sum:
            return Category::Aggregate;
    }
    return Category::Arithmetic;
}

auto notation(Function function) noexcept -> Notation {
    switch (function) {
        case Function::Not:
            return Notation::Prefix;
        case Function::IsNull:
        case Function::NotNull:
            return Notation::Postfix;
        default:
            break;
    }
    auto cat = category(function);
    return cat == Category::Arithmetic || cat == Category::Comparison || cat == Category::Logical
               ? Notation::Infix
               : Notation::Call;
}

auto symbol(Function function) noexcept -> std::string_view {
    switch (function) {
        case Function::Addition:
            return "+";
        case Function::Subtraction:
            return "-";
        case Function::Multiplication:
            return "*";
        case Function::Division:
            return "/";
        case Function::Modulus:
            return "%";
        case Function::LessThan:
            return "<";
        case Function::LessEqual:
            return "<=";
        case Function::GreaterThan:
            return ">";
        case Function::GreaterEqual:
            return ">=";
        case Function::Equal:
            return "==";
        case Function::NotEqual:
            return "!=";
        case Function::IsNull:
            return "IS NULL";
        case Function::NotNull:
            return "NOT NULL";
        case Function::And:
            return "AND";
        case Function::Or:
            return "OR";
        case Function::Not:
            return "NOT";
        case Function::Cast:
            return "Cast";
        case Function::Year:
            return "Year";
        case Function::Abs:
            return "Abs";
        case Function::Ceil:
            return "Ceil";
        case Function::Floor:
            return "Floor";
        case Function::Count:
            return "Count";
        case Function::Avg:
            return "Avg";
        case Function::Min:
            return "Min";
        case Function::Max:
            return "Max";
        case Function::Sum:
            return "Sum";
    }
    return "?";
}

auto is_predicate(Function function) noexcept -> bool {
    auto cat = category(function);
    return cat == Category::Comparison || cat == Category::Logical;
}

// ─── Ordering ────────────────────────────────────────────────────────────────

auto parse_direction(std::string_view token) -> Direction {
    std::string lower(token);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "asc" || lower == "ascending") {
        return Direction::Ascending;
    }
    if (lower == "desc" || lower == "descending") {
        return Direction::Descending;
    }
    throw GrammarError(fmt::format("Invalid ordering direction {}", token));
}

auto to_string(Direction direction) noexcept -> std::string_view {
    return direction == Direction::Ascending ? "ascending" : "descending";
}

Ordering::Ordering(FeaturePtr feature, Direction direction)
    : feature(ensure_operable(feature)), direction(direction) {}

auto Ordering::make(const std::vector<OrderTerm>& terms) -> std::vector<Ordering> {
    std::vector<Ordering> orderings;
    for (std::size_t i = 0; i < terms.size(); ++i) {
        if (const auto* feature = terms[i].feature()) {
            if (i + 1 < terms.size()) {
                if (const auto* direction = terms[i + 1].direction()) {
                    orderings.emplace_back(*feature, *direction);
                    ++i;
                    continue;
                }
            }
            orderings.emplace_back(*feature);
        } else if (const auto* ordering = terms[i].ordering()) {
            orderings.push_back(*ordering);
        } else {
            throw GrammarError("Expecting pair of feature and direction");
        }
    }
    return orderings;
}

auto Ordering::hash() const noexcept -> std::size_t {
    return combine(feature->hash(), static_cast<std::size_t>(direction));
}

auto Ordering::repr() const -> std::string {
    return fmt::format("{}<{}>", feature->repr(), to_string(direction));
}

auto operator==(const Ordering& lhs, const Ordering& rhs) -> bool {
    return lhs.direction == rhs.direction && same_feature(lhs.feature, rhs.feature);
}

// ─── Aliased ─────────────────────────────────────────────────────────────────

Aliased::Aliased(FeaturePtr operable, std::string name)
    : Feature(FeatureType::Aliased,
              combine(combine(tag(FeatureType::Aliased), operable->operable()->hash()),
                      std::hash<std::string>{}(name))),
      operable_(operable->operable()),
      name_(std::move(name)) {}

auto Aliased::repr() const -> std::string {
    return fmt::format("{}=[{}]", name_, operable_->repr());
}

void Aliased::accept(FeatureVisitor& visitor) const {
    visitor.visit_aliased(*this);
}

auto Aliased::equals(const Feature& other) const -> bool {
    const auto& that = static_cast<const Aliased&>(other);
    return name_ == that.name_ && *operable_ == *that.operable_;
}

// ─── Literal ─────────────────────────────────────────────────────────────────

Literal::Literal(Value value)
    : Feature(FeatureType::Literal, combine(tag(FeatureType::Literal), value.hash())),
      value_(std::move(value)),
      kind_(reflect(value_)) {}

void Literal::accept(FeatureVisitor& visitor) const {
    visitor.visit_literal(*this);
}

auto Literal::equals(const Feature& other) const -> bool {
    return value_ == static_cast<const Literal&>(other).value_;
}

// ─── Element ─────────────────────────────────────────────────────────────────

Element::Element(SourcePtr origin, std::string name)
    : Feature(FeatureType::Element,
              combine(combine(tag(FeatureType::Element), origin ? origin->hash() : 0),
                      std::hash<std::string>{}(name))),
      origin_(std::move(origin)),
      name_(std::move(name)) {
    if (!origin_ || !(origin_->type() == SourceType::Table ||
                      origin_->type() == SourceType::Reference)) {
        throw GrammarError(fmt::format("Invalid origin of element {}", name_));
    }
    kind_ = origin_->schema()->at(name_).kind();
}

auto Element::repr() const -> std::string {
    return fmt::format("{}.{}", origin_->repr(), name_);
}

void Element::accept(FeatureVisitor& visitor) const {
    visitor.visit_element(*this);
}

auto Element::equals(const Feature& other) const -> bool {
    const auto& that = static_cast<const Element&>(other);
    return name_ == that.name_ && *origin_ == *that.origin_;
}

Column::Column(SourcePtr table, std::string name) : Element(table, std::move(name)) {
    if (table->type() != SourceType::Table) {
        throw GrammarError("Invalid field source");
    }
}

// ─── Expression ──────────────────────────────────────────────────────────────

Expression::Expression(Function function, std::vector<FeaturePtr> operands, KindPtr target)
    : Feature(FeatureType::Expression,
              [&] {
                  auto seed = combine(tag(FeatureType::Expression),
                                      static_cast<std::size_t>(function));
                  for (const auto& operand : operands) {
                      seed = combine(seed, operand ? operand->hash() : 0);
                  }
                  return target ? combine(seed, target->hash()) : seed;
              }()),
      function_(function),
      operands_(std::move(operands)),
      target_(std::move(target)) {
    if (!arity_ok(function_, operands_.size())) {
        throw GrammarError(fmt::format("Invalid number of operands for {}", symbol(function_)));
    }
    for (const auto& operand : operands_) {
        ensure_operable(operand);
    }
    kind_ = resolve_kind(function_, operands_, target_);
}

auto Expression::repr() const -> std::string {
    return render(function_, operands_, target_);
}

void Expression::accept(FeatureVisitor& visitor) const {
    visitor.visit_expression(*this);
}

auto Expression::equals(const Feature& other) const -> bool {
    const auto& that = static_cast<const Expression&>(other);
    return function_ == that.function_ && same(target_, that.target_) &&
           same_features(operands_, that.operands_);
}

// ─── Window ──────────────────────────────────────────────────────────────────

Window::Window(FeaturePtr function, std::vector<FeaturePtr> partition,
               std::vector<Ordering> ordering, std::optional<Frame> frame)
    : Feature(FeatureType::Window,
              [&] {
                  auto seed = combine(tag(FeatureType::Window), function ? function->hash() : 0);
                  for (const auto& feature : partition) {
                      seed = combine(seed, feature ? feature->hash() : 0);
                  }
                  for (const auto& order : ordering) {
                      seed = combine(seed, order.hash());
                  }
                  return seed;
              }()),
      function_(std::move(function)),
      partition_(std::move(partition)),
      ordering_(std::move(ordering)),
      frame_(frame) {
    if (!function_ || !is(Trait::Aggregate, *function_)) {
        throw GrammarError(fmt::format("{} not an instance of a Window.Function",
                                       function_ ? function_->repr() : "None"));
    }
    for (const auto& feature : partition_) {
        ensure_operable(feature);
    }
}

auto Window::repr() const -> std::string {
    std::vector<std::string> orders;
    orders.reserve(ordering_.size());
    for (const auto& order : ordering_) {
        orders.push_back(order.repr());
    }
    std::string frame = "None";
    if (frame_) {
        auto bound = [](const std::optional<std::int64_t>& offset) {
            return offset ? std::to_string(*offset) : std::string("None");
        };
        frame = fmt::format("Frame({}, {}, {})", to_string(frame_->mode), bound(frame_->start),
                            bound(frame_->end));
    }
    return fmt::format("Window({}, ({}), ({}), {})", function_->repr(),
                       fmt::join(reprs(partition_), ", "), fmt::join(orders, ", "), frame);
}

void Window::accept(FeatureVisitor& visitor) const {
    visitor.visit_window(*this);
}

auto Window::equals(const Feature& other) const -> bool {
    const auto& that = static_cast<const Window&>(other);
    return *function_ == *that.function_ && same_features(partition_, that.partition_) &&
           ordering_ == that.ordering_ && frame_ == that.frame_;
}

auto to_string(Window::Frame::Mode mode) noexcept -> std::string_view {
    switch (mode) {
        case Window::Frame::Mode::Rows:
            return "rows";
        case Window::Frame::Mode::Groups:
            return "groups";
        case Window::Frame::Mode::Range:
            return "range";
    }
    return "rows";
}

// ─── Visitor ─────────────────────────────────────────────────────────────────

void FeatureVisitor::visit_feature(const Feature& /*feature*/) {}

void FeatureVisitor::visit_aliased(const Aliased& feature) {
    feature.operable()->accept(*this);
    visit_feature(feature);
}

void FeatureVisitor::visit_literal(const Literal& feature) {
    visit_feature(feature);
}

void FeatureVisitor::visit_element(const Element& feature) {
    visit_feature(feature);
}

void FeatureVisitor::visit_expression(const Expression& feature) {
    for (const auto& operand : feature.operands()) {
        operand->accept(*this);
    }
    visit_feature(feature);
}

void FeatureVisitor::visit_window(const Window& feature) {
    feature.function()->accept(*this);
    for (const auto& partition : feature.partition()) {
        partition->accept(*this);
    }
    for (const auto& ordering : feature.ordering()) {
        ordering.feature->accept(*this);
    }
    visit_feature(feature);
}

// ─── Factors ─────────────────────────────────────────────────────────────────

Factors::Factors(const std::vector<FeaturePtr>& predicates) {
    for (const auto& predicate : predicates) {
        auto tables = tables_of(predicate);
        if (tables.size() != 1 || find(*tables.front())) {
            throw GrammarError("Repeated or non-primitive predicates");
        }
        items_.emplace_back(tables.front(), predicate);
    }
}

auto Factors::merge(const Factors& left, const Factors& right, Function op) -> Factors {
    std::vector<FeaturePtr> predicates;
    for (const auto& [table, predicate] : left) {
        auto other = right.find(*table);
        if (other && !(*other == *predicate)) {
            predicates.push_back(make_expression(op, {predicate, other}));
        } else {
            predicates.push_back(predicate);
        }
    }
    for (const auto& [table, predicate] : right) {
        if (!left.find(*table)) {
            predicates.push_back(predicate);
        }
    }
    return Factors(predicates);
}

auto Factors::find(const Source& table) const -> FeaturePtr {
    for (const auto& [key, predicate] : items_) {
        if (*key == table) {
            return predicate;
        }
    }
    return nullptr;
}

auto factors(const FeaturePtr& predicate) -> Factors {
    if (const auto* expression = dynamic_cast<const Expression*>(predicate.get())) {
        const auto& operands = expression->operands();
        switch (expression->function()) {
            case Function::And:
                return factors(operands[0]) & factors(operands[1]);
            case Function::Or:
                return factors(operands[0]) | factors(operands[1]);
            case Function::Not:
                return factors(operands[0]);
            default:
                break;
        }
    }
    if (tables_of(predicate).size() == 1) {
        return Factors({predicate});
    }
    return {};
}

// ─── Traits ──────────────────────────────────────────────────────────────────

auto trait_name(Trait trait) noexcept -> std::string_view {
    switch (trait) {
        case Trait::Aliased:
            return "Aliased";
        case Trait::Literal:
            return "Literal";
        case Trait::Element:
            return "Element";
        case Trait::Column:
            return "Column";
        case Trait::Expression:
            return "Expression";
        case Trait::Aggregate:
            return "Aggregate";
        case Trait::Window:
            return "Window";
        case Trait::Cumulative:
            return "Cumulative";
    }
    return "Feature";
}

auto is(Trait trait, const Feature& feature) noexcept -> bool {
    switch (trait) {
        case Trait::Aliased:
            return feature.type() == FeatureType::Aliased;
        case Trait::Literal:
            return feature.type() == FeatureType::Literal;
        case Trait::Element:
            return feature.type() == FeatureType::Element;
        case Trait::Column:
            return feature.type() == FeatureType::Element &&
                   static_cast<const Element&>(feature).is_column();
        case Trait::Expression:
            return feature.type() == FeatureType::Expression ||
                   feature.type() == FeatureType::Window;
        case Trait::Aggregate:
            return feature.type() == FeatureType::Expression &&
                   category(static_cast<const Expression&>(feature).function()) ==
                       Category::Aggregate;
        case Trait::Window:
            return feature.type() == FeatureType::Window;
        case Trait::Cumulative:
            return is(Trait::Aggregate, feature) || is(Trait::Window, feature);
    }
    return false;
}

auto dissect(Trait trait, const std::vector<FeaturePtr>& features) -> FeatureSet {
    Dissect visitor(trait);
    for (const auto& feature : features) {
        feature->accept(visitor);
    }
    return std::move(visitor.found());
}

auto dissect(Trait trait, const FeaturePtr& feature) -> FeatureSet {
    return dissect(trait, std::vector<FeaturePtr>{feature});
}

auto ensure_in(Trait trait, const FeaturePtr& feature) -> const FeaturePtr& {
    if (dissect(trait, feature).empty()) {
        throw GrammarError(
            fmt::format("No {} instance(s) found in {}", trait_name(trait), feature->repr()));
    }
    return feature;
}

auto ensure_notin(Trait trait, const FeaturePtr& feature) -> const FeaturePtr& {
    if (!dissect(trait, feature).empty()) {
        throw GrammarError(
            fmt::format("{} instance(s) found in {}", trait_name(trait), feature->repr()));
    }
    return feature;
}

auto ensure_operable(const FeaturePtr& feature) -> const FeaturePtr& {
    if (!feature) {
        throw GrammarError("Missing feature");
    }
    if (feature->type() == FeatureType::Aliased) {
        throw GrammarError(fmt::format("{} not an instance of a Operable", feature->repr()));
    }
    return feature;
}

auto ensure_predicate(const FeaturePtr& feature) -> const FeaturePtr& {
    ensure(KindClass::Boolean, ensure_operable(feature)->kind());
    return feature;
}

// ─── Builders ────────────────────────────────────────────────────────────────

namespace {

auto featurize(Value value) -> FeaturePtr {
    spdlog::debug("Converting value of {} to a literal type", value.repr());
    return literal(std::move(value));
}

}  // namespace

Term::Term(FeaturePtr feature) {
    if (!feature) {
        throw GrammarError("Missing feature");
    }
    feature_ = feature->operable();
}

Term::Term(bool value) : feature_(featurize(value)) {}
Term::Term(int value) : feature_(featurize(value)) {}
Term::Term(std::int64_t value) : feature_(featurize(value)) {}
Term::Term(double value) : feature_(featurize(value)) {}
Term::Term(const char* value) : feature_(featurize(value)) {}
Term::Term(std::string value) : feature_(featurize(std::move(value))) {}
Term::Term(Decimal value) : feature_(featurize(value)) {}
Term::Term(Date value) : feature_(featurize(value)) {}
Term::Term(Timestamp value) : feature_(featurize(value)) {}
Term::Term(Value value) : feature_(featurize(std::move(value))) {}

auto literal(Value value) -> FeaturePtr {
    return std::make_shared<const Literal>(std::move(value));
}

auto alias(const FeaturePtr& feature, std::string name) -> FeaturePtr {
    return std::make_shared<const Aliased>(Term(feature).feature(), std::move(name));
}

auto element(const SourcePtr& origin, std::string name) -> FeaturePtr {
    if (origin && origin->type() == SourceType::Table) {
        return std::make_shared<const Column>(origin, std::move(name));
    }
    return std::make_shared<const Element>(origin, std::move(name));
}

auto add(const Term& lhs, const Term& rhs) -> FeaturePtr {
    return make_expression(Function::Addition, {lhs, rhs});
}
auto sub(const Term& lhs, const Term& rhs) -> FeaturePtr {
    return make_expression(Function::Subtraction, {lhs, rhs});
}
auto mul(const Term& lhs, const Term& rhs) -> FeaturePtr {
    return make_expression(Function::Multiplication, {lhs, rhs});
}
auto div(const Term& lhs, const Term& rhs) -> FeaturePtr {
    return make_expression(Function::Division, {lhs, rhs});
}
auto mod(const Term& lhs, const Term& rhs) -> FeaturePtr {
    return make_expression(Function::Modulus, {lhs, rhs});
}

auto lt(const Term& lhs, const Term& rhs) -> FeaturePtr {
    return make_expression(Function::LessThan, {lhs, rhs});
}
auto le(const Term& lhs, const Term& rhs) -> FeaturePtr {
    return make_expression(Function::LessEqual, {lhs, rhs});
}
auto gt(const Term& lhs, const Term& rhs) -> FeaturePtr {
    return make_expression(Function::GreaterThan, {lhs, rhs});
}
auto ge(const Term& lhs, const Term& rhs) -> FeaturePtr {
    return make_expression(Function::GreaterEqual, {lhs, rhs});
}
auto eq(const Term& lhs, const Term& rhs) -> FeaturePtr {
    return make_expression(Function::Equal, {lhs, rhs});
}
auto ne(const Term& lhs, const Term& rhs) -> FeaturePtr {
    return make_expression(Function::NotEqual, {lhs, rhs});
}
auto is_null(const Term& operand) -> FeaturePtr {
    return make_expression(Function::IsNull, {operand});
}
auto not_null(const Term& operand) -> FeaturePtr {
    return make_expression(Function::NotNull, {operand});
}

auto and_(const Term& lhs, const Term& rhs) -> FeaturePtr {
    return make_expression(Function::And, {lhs, rhs});
}
auto or_(const Term& lhs, const Term& rhs) -> FeaturePtr {
    return make_expression(Function::Or, {lhs, rhs});
}
auto not_(const Term& operand) -> FeaturePtr {
    return make_expression(Function::Not, {operand});
}

auto cast(const Term& operand, KindPtr kind) -> FeaturePtr {
    return make_expression(Function::Cast, {operand}, std::move(kind));
}
auto year(const Term& operand) -> FeaturePtr {
    return make_expression(Function::Year, {operand});
}
auto abs(const Term& operand) -> FeaturePtr {
    return make_expression(Function::Abs, {operand});
}
auto ceil(const Term& operand) -> FeaturePtr {
    return make_expression(Function::Ceil, {operand});
}
auto floor(const Term& operand) -> FeaturePtr {
    return make_expression(Function::Floor, {operand});
}

auto count() -> FeaturePtr {
    return make_expression(Function::Count, {});
}
auto count(const Term& operand) -> FeaturePtr {
    return make_expression(Function::Count, {operand});
}
auto avg(const Term& operand) -> FeaturePtr {
    return make_expression(Function::Avg, {operand});
}
auto min(const Term& operand) -> FeaturePtr {
    return make_expression(Function::Min, {operand});
}
auto max(const Term& operand) -> FeaturePtr {
    return make_expression(Function::Max, {operand});
}
auto sum(const Term& operand) -> FeaturePtr {
    return make_expression(Function::Sum, {operand});
}

auto over(const FeaturePtr& aggregate, std::vector<FeaturePtr> partition,
          const std::vector<OrderTerm>& ordering, std::optional<Window::Frame> frame)
    -> FeaturePtr {
    return std::make_shared<const Window>(aggregate, std::move(partition),
                                          Ordering::make(ordering), frame);
}

}  // namespace oryx::dsl
