#include <oryx/parser/container.hpp>

#include <algorithm>

namespace oryx::parser {

namespace {

auto by_repr(const dsl::FeatureSet& features) -> std::vector<dsl::FeaturePtr> {
    std::vector<std::pair<std::string, dsl::FeaturePtr>> keyed;
    keyed.reserve(features.size());
    for (const auto& feature : features) {
        keyed.emplace_back(feature->repr(), feature);
    }
    std::sort(keyed.begin(), keyed.end(),
              [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
    std::vector<dsl::FeaturePtr> sorted;
    sorted.reserve(keyed.size());
    for (auto& [repr, feature] : keyed) {
        sorted.push_back(std::move(feature));
    }
    return sorted;
}

}  // namespace

auto Tables::Segment::sorted_fields() const -> std::vector<dsl::FeaturePtr> {
    return by_repr(fields);
}

auto Tables::Segment::predicate() const -> dsl::FeaturePtr {
    dsl::FeaturePtr predicate;
    for (const auto& factor : by_repr(factors)) {
        predicate = predicate ? dsl::or_(predicate, factor) : factor;
    }
    return predicate;
}

auto Tables::segment(const dsl::SourcePtr& table) -> Segment& {
    return segments_[table];
}

auto Tables::find(const dsl::SourcePtr& table) const -> const Segment* {
    auto it = segments_.find(table);
    return it == segments_.end() ? nullptr : &it->second;
}

void Tables::select(const std::vector<dsl::FeaturePtr>& features) {
    for (const auto& column : dsl::dissect(dsl::Trait::Column, features)) {
        segment(static_cast<const dsl::Element&>(*column).origin()).fields.insert(column);
    }
}

void Tables::filter(const dsl::FeaturePtr& predicate) {
    select({predicate});
    for (const auto& [table, factor] : dsl::factors(predicate)) {
        segment(table).factors.insert(factor);
    }
}

}  // namespace oryx::parser
