#include "fixtures.hpp"

#include <oryx/core/error.hpp>
#include <oryx/dsl/feature.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace oryx;
using namespace oryx::dsl;

TEST_CASE("Elements of a table", "[dsl][feature]") {
    auto student = testing::student();
    auto surname = student->at("surname");

    REQUIRE(surname->type() == FeatureType::Element);
    REQUIRE(surname->kind() == Kind::string());
    REQUIRE(surname->name() == "surname");
    REQUIRE(surname->repr() == "student.surname");
    REQUIRE(static_cast<const Element&>(*surname).is_column());

    SECTION("lookup by key yields the field name") {
        REQUIRE(student->at("level")->name() == "class");
        REQUIRE(*student->at("level") == *student->at("class"));
    }

    SECTION("elements of independently built tables are equal") {
        auto other = testing::student();
        REQUIRE(*other->at("score") == *student->at("score"));
        REQUIRE(FeatureHash{}(other->at("score")) == FeatureHash{}(student->at("score")));
    }

    SECTION("unknown fields are rejected") {
        REQUIRE_THROWS_AS(student->at("missing"), GrammarError);
    }
}

TEST_CASE("Expression kinds", "[dsl][feature]") {
    auto student = testing::student();
    auto score = student->at("score");
    auto level = student->at("class");

    REQUIRE((level + 1)->kind() == Kind::integer());
    REQUIRE((level * score)->kind() == Kind::floating());
    REQUIRE(lt(score, 2)->kind() == Kind::boolean());
    REQUIRE(year(student->at("birthday"))->kind() == Kind::integer());
    REQUIRE(floor(score)->kind() == Kind::integer());
    REQUIRE(abs(score)->kind() == Kind::floating());
    REQUIRE(cast(level, Kind::string())->kind() == Kind::string());
    REQUIRE(count()->kind() == Kind::integer());
    REQUIRE(sum(level)->kind() == Kind::integer());

    SECTION("operand kinds are validated") {
        REQUIRE_THROWS_AS(student->at("surname") + 1, GrammarError);
        REQUIRE_THROWS_AS(eq(student->at("surname"), 1), GrammarError);
        REQUIRE_THROWS_AS(and_(score, true), GrammarError);
        REQUIRE_THROWS_AS(year(score), GrammarError);
        REQUIRE_THROWS_AS(avg(student->at("surname")), GrammarError);
    }

    SECTION("comparisons of identical kinds are allowed") {
        REQUIRE_NOTHROW(eq(student->at("surname"), "smith"));
    }
}

TEST_CASE("Feature reprs", "[dsl][feature]") {
    auto student = testing::student();
    auto score = student->at("score");

    REQUIRE((score + 1)->repr() == "student.score + 1");
    REQUIRE(eq(score, 1)->repr() == "student.score == 1");
    REQUIRE(not_(is_null(score))->repr() == "NOT student.score IS NULL");
    REQUIRE(count()->repr() == "Count()");
    REQUIRE(sum(score)->repr() == "Sum(student.score)");
    REQUIRE(alias(score, "points")->repr() == "points=[student.score]");
}

TEST_CASE("Features are structurally equal", "[dsl][feature]") {
    auto student = testing::student();
    auto first = gt(student->at("score"), 2);
    auto second = gt(student->at("score"), 2);
    REQUIRE(first != second);
    REQUIRE(*first == *second);
    REQUIRE(first->hash() == second->hash());
    REQUIRE_FALSE(*first == *gt(student->at("score"), 3));

    FeatureSet set{first};
    REQUIRE(set.contains(second));
}

TEST_CASE("Aliases", "[dsl][feature]") {
    auto student = testing::student();
    auto aliased = alias(student->at("score"), "points");

    REQUIRE(aliased->name() == "points");
    REQUIRE(aliased->kind() == Kind::floating());
    REQUIRE(*aliased->operable() == *student->at("score"));

    SECTION("builder operands reduce aliases to their operable") {
        REQUIRE(*(aliased + 1) == *(student->at("score") + 1));
    }

    SECTION("aliases are not operable") {
        REQUIRE_THROWS_AS(ensure_operable(aliased), GrammarError);
    }
}

TEST_CASE("Ordering::make", "[dsl][feature]") {
    auto student = testing::student();
    auto score = student->at("score");
    auto level = student->at("class");

    SECTION("a bare feature is ascending") {
        auto orderings = Ordering::make({score});
        REQUIRE(orderings.size() == 1);
        REQUIRE(orderings[0].direction == Direction::Ascending);
    }

    SECTION("direction tokens are case insensitive") {
        auto orderings = Ordering::make({score, "DESC", level, "ascending"});
        REQUIRE(orderings.size() == 2);
        REQUIRE(orderings[0].direction == Direction::Descending);
        REQUIRE(orderings[1].direction == Direction::Ascending);
        REQUIRE(orderings[0].repr() == "student.score<descending>");
    }

    SECTION("a direction without a feature is rejected") {
        REQUIRE_THROWS_AS(Ordering::make({"asc", score}), GrammarError);
        REQUIRE_THROWS_AS(parse_direction("sideways"), GrammarError);
    }
}

TEST_CASE("Predicate factors", "[dsl][feature]") {
    auto student = testing::student();
    auto school = testing::school();
    auto low = lt(student->at("score"), 2);
    auto named = eq(school->at("name"), "north");
    auto young = gt(student->at("class"), 3);

    SECTION("single table predicates are their own factor") {
        auto result = factors(low);
        REQUIRE(result.size() == 1);
        REQUIRE(*result.find(*student) == *low);
    }

    SECTION("disjoint tables merge to the union") {
        auto both = factors(low) & factors(named);
        auto either = factors(low) | factors(named);
        REQUIRE(both.size() == 2);
        REQUIRE(either.size() == 2);
        REQUIRE(*both.find(*school) == *named);
    }

    SECTION("shared tables combine with the operator") {
        auto combined = factors(and_(low, young));
        REQUIRE(combined.size() == 1);
        REQUIRE(*combined.find(*student) == *and_(low, young));
    }

    SECTION("merging is idempotent") {
        auto base = factors(low) & factors(named);
        auto merged = (base & base) | base;
        REQUIRE(merged.size() == base.size());
        REQUIRE(*merged.find(*student) == *low);
        REQUIRE(*merged.find(*school) == *named);
    }

    SECTION("predicates over several tables have no factor") {
        REQUIRE(factors(eq(school->at("id"), student->at("school"))).empty());
    }
}

TEST_CASE("Dissect and trait checks", "[dsl][feature]") {
    auto student = testing::student();
    auto feature = count(student->at("score")) + sum(student->at("class"));

    REQUIRE(dissect(Trait::Aggregate, feature).size() == 2);
    REQUIRE(dissect(Trait::Element, feature).size() == 2);
    REQUIRE(dissect(Trait::Window, feature).empty());
    REQUIRE_NOTHROW(ensure_in(Trait::Aggregate, feature));
    REQUIRE_THROWS_AS(ensure_notin(Trait::Cumulative, feature), GrammarError);
    REQUIRE_THROWS_AS(ensure_in(Trait::Aggregate, student->at("score")), GrammarError);
}

TEST_CASE("Windows", "[dsl][feature]") {
    auto student = testing::student();
    auto window = over(sum(student->at("score")), {student->at("class")}, {student->at("surname")},
                       Window::Frame{Window::Frame::Mode::Rows, std::nullopt, 0});

    REQUIRE(window->type() == FeatureType::Window);
    REQUIRE(window->kind() == Kind::floating());
    REQUIRE(is(Trait::Cumulative, *window));
    REQUIRE_THROWS_AS(over(student->at("score"), {}), GrammarError);
}
