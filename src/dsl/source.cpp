#include <oryx/dsl/source.hpp>

#include <oryx/core/error.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <random>

namespace oryx::dsl {

namespace {

constexpr std::size_t kReferenceNameLength = 8;

auto combine(std::size_t seed, std::size_t value) -> std::size_t {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

auto tag(SourceType type) -> std::size_t {
    return std::hash<int>{}(static_cast<int>(type) + 211);
}

auto hash_all(std::size_t seed, const std::vector<FeaturePtr>& features) -> std::size_t {
    for (const auto& feature : features) {
        seed = combine(seed, feature ? feature->hash() : 0);
    }
    return seed;
}

auto same_feature(const FeaturePtr& lhs, const FeaturePtr& rhs) -> bool {
    return lhs == rhs || (lhs && rhs && *lhs == *rhs);
}

auto same_features(const std::vector<FeaturePtr>& lhs, const std::vector<FeaturePtr>& rhs)
    -> bool {
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), same_feature);
}

auto random_name() -> std::string {
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<int> letter('a', 'z');
    std::string name(kReferenceNameLength, 'a');
    for (auto& c : name) {
        c = static_cast<char>(letter(engine));
    }
    return name;
}

auto reprs(const std::vector<FeaturePtr>& features) -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(features.size());
    for (const auto& feature : features) {
        out.push_back(feature->repr());
    }
    return out;
}

/// Raise unless every element used by `features` is provided by `superset`.
void ensure_subset(const std::vector<FeaturePtr>& features, const FeatureSet& superset) {
    for (const auto& element : dissect(Trait::Element, features)) {
        if (!superset.contains(element)) {
            throw GrammarError(fmt::format("({}) not a subset of source features",
                                           fmt::join(reprs(features), ", ")));
        }
    }
}

void ensure_subset(const FeaturePtr& feature, const FeatureSet& superset) {
    ensure_subset(std::vector<FeaturePtr>{feature}, superset);
}

auto concat(std::vector<FeaturePtr> left, const std::vector<FeaturePtr>& right)
    -> std::vector<FeaturePtr> {
    left.insert(left.end(), right.begin(), right.end());
    return left;
}

}  // namespace

auto SourceHash::operator()(const SourcePtr& source) const noexcept -> std::size_t {
    return source ? source->hash() : 0;
}

auto SourceEqual::operator()(const SourcePtr& lhs, const SourcePtr& rhs) const -> bool {
    return lhs == rhs || (lhs && rhs && *lhs == *rhs);
}

auto to_string(JoinKind kind) noexcept -> std::string_view {
    switch (kind) {
        case JoinKind::Inner:
            return "inner";
        case JoinKind::Left:
            return "left";
        case JoinKind::Right:
            return "right";
        case JoinKind::Full:
            return "full";
        case JoinKind::Cross:
            return "cross";
    }
    return "inner";
}

auto to_string(SetKind kind) noexcept -> std::string_view {
    switch (kind) {
        case SetKind::Union:
            return "union";
        case SetKind::Intersection:
            return "intersection";
        case SetKind::Difference:
            return "difference";
    }
    return "union";
}

auto Rows::repr() const -> std::string {
    return fmt::format("{}:{}", offset, count);
}

// ─── Source ──────────────────────────────────────────────────────────────────

auto Source::at(std::string_view key_or_name) const -> FeaturePtr {
    auto position = schema()->position(key_or_name);
    auto features = this->features();
    if (!position || *position >= features.size()) {
        throw GrammarError(fmt::format("Invalid feature {}", key_or_name));
    }
    return features[*position];
}

auto Source::query() const -> QueryPtr {
    return std::make_shared<const Query>(self());
}

auto Source::statement() const -> SourcePtr {
    return query();
}

auto Source::reference(std::optional<std::string> name) const -> ReferencePtr {
    if (!name || name->empty()) {
        name = random_name();
    }
    return std::make_shared<const Reference>(instance(), std::move(*name));
}

auto Source::union_(const SourcePtr& other) const -> SetPtr {
    return std::make_shared<const Set>(self(), other, SetKind::Union);
}

auto Source::intersection(const SourcePtr& other) const -> SetPtr {
    return std::make_shared<const Set>(self(), other, SetKind::Intersection);
}

auto Source::difference(const SourcePtr& other) const -> SetPtr {
    return std::make_shared<const Set>(self(), other, SetKind::Difference);
}

auto Source::select(std::vector<FeaturePtr> features) const -> QueryPtr {
    return query()->select(std::move(features));
}

auto Source::where(const FeaturePtr& condition) const -> QueryPtr {
    return query()->where(condition);
}

auto Source::having(const FeaturePtr& condition) const -> QueryPtr {
    return query()->having(condition);
}

auto Source::groupby(std::vector<FeaturePtr> features) const -> QueryPtr {
    return query()->groupby(std::move(features));
}

auto Source::orderby(const std::vector<OrderTerm>& terms) const -> QueryPtr {
    return query()->orderby(terms);
}

auto Source::limit(std::int64_t count, std::int64_t offset) const -> QueryPtr {
    return query()->limit(count, offset);
}

auto Source::join(const SourcePtr& other, JoinKind kind, FeaturePtr condition) const -> JoinPtr {
    return std::make_shared<const Join>(self(), other, kind, std::move(condition));
}

auto Source::inner_join(const SourcePtr& other, FeaturePtr condition) const -> JoinPtr {
    return join(other, JoinKind::Inner, std::move(condition));
}

auto Source::left_join(const SourcePtr& other, FeaturePtr condition) const -> JoinPtr {
    return join(other, JoinKind::Left, std::move(condition));
}

auto Source::right_join(const SourcePtr& other, FeaturePtr condition) const -> JoinPtr {
    return join(other, JoinKind::Right, std::move(condition));
}

auto Source::full_join(const SourcePtr& other, FeaturePtr condition) const -> JoinPtr {
    return join(other, JoinKind::Full, std::move(condition));
}

auto Source::cross_join(const SourcePtr& other) const -> JoinPtr {
    return join(other, JoinKind::Cross);
}

auto Source::derive_schema(std::string name, const std::vector<FeaturePtr>& features)
    -> SchemaPtr {
    SchemaBuilder builder(std::move(name));
    for (std::size_t i = 0; i < features.size(); ++i) {
        auto field_name = features[i]->name();
        auto key = field_name ? *field_name : fmt::format("_{}", i);
        builder.field(std::move(key), Field(features[i]->kind(), std::move(field_name)));
    }
    return builder.build();
}

// ─── Table ───────────────────────────────────────────────────────────────────

Table::Table(SchemaPtr schema)
    : Source(SourceType::Table, combine(tag(SourceType::Table), schema ? schema->hash() : 0)),
      schema_(std::move(schema)) {
    if (!schema_) {
        throw GrammarError("Table requires a schema");
    }
}

auto Table::make(SchemaPtr schema) -> TablePtr {
    return std::make_shared<const Table>(std::move(schema));
}

auto Table::features() const -> std::vector<FeaturePtr> {
    std::vector<FeaturePtr> features;
    features.reserve(schema_->size());
    for (const auto& entry : schema_->entries()) {
        features.push_back(element(self(), *entry.field.name()));
    }
    return features;
}

void Table::accept(SourceVisitor& visitor) const {
    visitor.visit_table(*this);
}

auto Table::equals(const Source& other) const -> bool {
    const auto& that = static_cast<const Table&>(other);
    return schema_->name() == that.schema_->name() && *schema_ == *that.schema_;
}

// ─── Reference ───────────────────────────────────────────────────────────────

Reference::Reference(SourcePtr instance, std::string name)
    : Source(SourceType::Reference,
             combine(combine(tag(SourceType::Reference), instance ? instance->instance()->hash() : 0),
                     std::hash<std::string>{}(name))),
      instance_(std::move(instance)),
      name_(std::move(name)) {
    if (!instance_) {
        throw GrammarError("Reference requires an instance");
    }
    instance_ = instance_->instance();
}

auto Reference::features() const -> std::vector<FeaturePtr> {
    std::vector<FeaturePtr> features;
    const auto& schema = instance_->schema();
    features.reserve(schema->size());
    for (const auto& entry : schema->entries()) {
        features.push_back(element(self(), *entry.field.name()));
    }
    return features;
}

auto Reference::repr() const -> std::string {
    return fmt::format("{}=[{}]", name_, instance_->repr());
}

void Reference::accept(SourceVisitor& visitor) const {
    visitor.visit_reference(*this);
}

auto Reference::equals(const Source& other) const -> bool {
    const auto& that = static_cast<const Reference&>(other);
    return name_ == that.name_ && *instance_ == *that.instance_;
}

// ─── Join ────────────────────────────────────────────────────────────────────

Join::Join(SourcePtr left, SourcePtr right, JoinKind kind, FeaturePtr condition)
    : Source(SourceType::Join,
             combine(combine(combine(combine(tag(SourceType::Join), left ? left->hash() : 0),
                                     right ? right->hash() : 0),
                             static_cast<std::size_t>(kind)),
                     condition ? condition->hash() : 0)),
      left_(std::move(left)),
      right_(std::move(right)),
      kind_(kind),
      condition_(std::move(condition)) {
    if (!left_ || !right_ || !left_->is_origin() || !right_->is_origin()) {
        throw GrammarError("Join operands must be tables, references or joins");
    }
    if ((kind_ == JoinKind::Cross) == (condition_ != nullptr)) {
        throw GrammarError("Illegal use of condition and join type");
    }
    auto features = this->features();
    if (condition_) {
        ensure_notin(Trait::Cumulative, ensure_predicate(condition_));
        ensure_subset(condition_, dissect(Trait::Element, features));
    }
    schema_ = derive_schema("Join", features);
}

auto Join::features() const -> std::vector<FeaturePtr> {
    return concat(left_->features(), right_->features());
}

auto Join::repr() const -> std::string {
    return fmt::format("{}<{}-join>{}", left_->repr(), to_string(kind_), right_->repr());
}

void Join::accept(SourceVisitor& visitor) const {
    visitor.visit_join(*this);
}

auto Join::equals(const Source& other) const -> bool {
    const auto& that = static_cast<const Join&>(other);
    return kind_ == that.kind_ && *left_ == *that.left_ && *right_ == *that.right_ &&
           same_feature(condition_, that.condition_);
}

// ─── Set ─────────────────────────────────────────────────────────────────────

Set::Set(const SourcePtr& left, const SourcePtr& right, SetKind kind)
    : Source(SourceType::Set,
             combine(combine(combine(tag(SourceType::Set), left->statement()->hash()),
                             right->statement()->hash()),
                     static_cast<std::size_t>(kind))),
      left_(left->statement()),
      right_(right->statement()),
      kind_(kind) {
    if (!(*left->schema() == *right->schema())) {
        throw GrammarError("Incompatible sources");
    }
}

auto Set::features() const -> std::vector<FeaturePtr> {
    return concat(left_->features(), right_->features());
}

auto Set::repr() const -> std::string {
    return fmt::format("{} {} {}", left_->repr(), to_string(kind_), right_->repr());
}

void Set::accept(SourceVisitor& visitor) const {
    visitor.visit_set(*this);
}

auto Set::equals(const Source& other) const -> bool {
    const auto& that = static_cast<const Set&>(other);
    return kind_ == that.kind_ && *left_ == *that.left_ && *right_ == *that.right_;
}

// ─── Query ───────────────────────────────────────────────────────────────────

Query::Query(SourcePtr source, std::vector<FeaturePtr> selection, FeaturePtr prefilter,
             std::vector<FeaturePtr> grouping, FeaturePtr postfilter,
             const std::vector<OrderTerm>& ordering, std::optional<Rows> rows)
    : Source(SourceType::Query, 0),
      source_(std::move(source)),
      selection_(std::move(selection)),
      prefilter_(std::move(prefilter)),
      grouping_(std::move(grouping)),
      postfilter_(std::move(postfilter)),
      ordering_(Ordering::make(ordering)),
      rows_(rows) {
    if (!source_) {
        throw GrammarError("Query requires a source");
    }
    auto superset = dissect(Trait::Element, source_->features());

    for (const auto& feature : selection_) {
        if (!feature) {
            throw GrammarError("Missing feature");
        }
    }
    ensure_subset(selection_, superset);

    if (prefilter_) {
        ensure_subset(ensure_operable(prefilter_), superset);
        ensure_notin(Trait::Cumulative, ensure_predicate(prefilter_));
    }

    if (!grouping_.empty()) {
        for (const auto& feature : grouping_) {
            ensure_notin(Trait::Cumulative, ensure_operable(feature));
        }
        ensure_subset(grouping_, superset);
        FeatureSet grouped(grouping_.begin(), grouping_.end());
        for (const auto& feature : selection_.empty() ? source_->features() : selection_) {
            auto operable = feature->operable();
            if (!grouped.contains(operable)) {
                ensure_in(Trait::Aggregate, operable);
            }
        }
    }

    if (postfilter_) {
        ensure_subset(ensure_operable(postfilter_), superset);
        ensure_notin(Trait::Window, ensure_predicate(postfilter_));
    }

    std::vector<FeaturePtr> ordered;
    ordered.reserve(ordering_.size());
    for (const auto& order : ordering_) {
        ordered.push_back(order.feature);
    }
    ensure_subset(ordered, superset);

    auto seed = combine(tag(SourceType::Query), source_->hash());
    seed = combine(hash_all(seed, selection_), prefilter_ ? prefilter_->hash() : 0);
    seed = combine(hash_all(seed, grouping_), postfilter_ ? postfilter_->hash() : 0);
    for (const auto& order : ordering_) {
        seed = combine(seed, order.hash());
    }
    if (rows_) {
        seed = combine(combine(seed, static_cast<std::size_t>(rows_->count)),
                       static_cast<std::size_t>(rows_->offset));
    }
    set_hash(seed);

    schema_ = derive_schema("Query", features());
}

auto Query::query() const -> QueryPtr {
    return std::static_pointer_cast<const Query>(self());
}

auto Query::features() const -> std::vector<FeaturePtr> {
    return selection_.empty() ? source_->features() : selection_;
}

auto Query::repr() const -> std::string {
    auto value = source_->repr();
    if (!selection_.empty()) {
        value += fmt::format("[{}]", fmt::join(reprs(selection_), ", "));
    }
    if (prefilter_) {
        value += fmt::format(".where({})", prefilter_->repr());
    }
    if (!grouping_.empty()) {
        value += fmt::format(".groupby({})", fmt::join(reprs(grouping_), ", "));
    }
    if (postfilter_) {
        value += fmt::format(".having({})", postfilter_->repr());
    }
    if (!ordering_.empty()) {
        std::vector<std::string> orders;
        for (const auto& order : ordering_) {
            orders.push_back(order.repr());
        }
        value += fmt::format(".orderby({})", fmt::join(orders, ", "));
    }
    if (rows_) {
        value += fmt::format("[{}]", rows_->repr());
    }
    return value;
}

void Query::accept(SourceVisitor& visitor) const {
    visitor.visit_query(*this);
}

auto Query::order_terms() const -> std::vector<OrderTerm> {
    return {ordering_.begin(), ordering_.end()};
}

auto Query::select(std::vector<FeaturePtr> features) const -> QueryPtr {
    return std::make_shared<const Query>(source_, std::move(features), prefilter_, grouping_,
                                         postfilter_, order_terms(), rows_);
}

auto Query::where(const FeaturePtr& condition) const -> QueryPtr {
    auto prefilter = prefilter_ ? and_(ensure_operable(condition), prefilter_) : condition;
    return std::make_shared<const Query>(source_, selection_, std::move(prefilter), grouping_,
                                         postfilter_, order_terms(), rows_);
}

auto Query::having(const FeaturePtr& condition) const -> QueryPtr {
    auto postfilter = postfilter_ ? and_(ensure_operable(condition), postfilter_) : condition;
    return std::make_shared<const Query>(source_, selection_, prefilter_, grouping_,
                                         std::move(postfilter), order_terms(), rows_);
}

auto Query::groupby(std::vector<FeaturePtr> features) const -> QueryPtr {
    return std::make_shared<const Query>(source_, selection_, prefilter_, std::move(features),
                                         postfilter_, order_terms(), rows_);
}

auto Query::orderby(const std::vector<OrderTerm>& terms) const -> QueryPtr {
    return std::make_shared<const Query>(source_, selection_, prefilter_, grouping_, postfilter_,
                                         terms, rows_);
}

auto Query::limit(std::int64_t count, std::int64_t offset) const -> QueryPtr {
    return std::make_shared<const Query>(source_, selection_, prefilter_, grouping_, postfilter_,
                                         order_terms(), Rows{count, offset});
}

auto Query::equals(const Source& other) const -> bool {
    const auto& that = static_cast<const Query&>(other);
    return *source_ == *that.source_ && same_features(selection_, that.selection_) &&
           same_feature(prefilter_, that.prefilter_) &&
           same_features(grouping_, that.grouping_) &&
           same_feature(postfilter_, that.postfilter_) && ordering_ == that.ordering_ &&
           rows_ == that.rows_;
}

// ─── Visitor ─────────────────────────────────────────────────────────────────

void SourceVisitor::visit_source(const Source& /*source*/) {}

void SourceVisitor::visit_table(const Table& source) {
    visit_source(source);
}

void SourceVisitor::visit_reference(const Reference& source) {
    source.instance()->accept(*this);
    visit_source(source);
}

void SourceVisitor::visit_join(const Join& source) {
    source.left()->accept(*this);
    source.right()->accept(*this);
    visit_source(source);
}

void SourceVisitor::visit_set(const Set& source) {
    source.left()->accept(*this);
    source.right()->accept(*this);
    visit_source(source);
}

void SourceVisitor::visit_query(const Query& source) {
    source.source()->accept(*this);
    visit_source(source);
}

}  // namespace oryx::dsl
