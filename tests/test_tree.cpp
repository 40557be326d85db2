#include "fixtures.hpp"

#include <oryx/codegen/tree.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

using namespace oryx;
using namespace oryx::dsl;
namespace tree = oryx::codegen::tree;

namespace {

auto build(const SourcePtr& statement) -> tree::SelectablePtr {
    auto result = tree::compile(statement);
    REQUIRE(result.has_value());
    return *result;
}

auto text(const SourcePtr& statement) -> std::string {
    return tree::render(*build(statement));
}

}  // namespace

TEST_CASE("Tree of the canonical query", "[codegen][tree]") {
    auto node = build(testing::canonical_query(testing::student(), testing::school()));
    REQUIRE(node->kind() == tree::NodeKind::Select);

    const auto& select = static_cast<const tree::Select&>(*node);
    REQUIRE(select.columns().size() == 2);
    REQUIRE(select.columns()[0]->kind() == tree::NodeKind::Label);
    REQUIRE(select.columns()[1]->type()->id() == KindId::Integer);
    REQUIRE(select.from()->kind() == tree::NodeKind::JoinRef);
    REQUIRE(static_cast<const tree::JoinRef&>(*select.from()).join() == JoinKind::Inner);
    REQUIRE(select.where() != nullptr);
    REQUIRE(select.group_by().size() == 1);
    REQUIRE(select.having() != nullptr);
    REQUIRE(select.order_by().size() == 2);
    REQUIRE(select.limit() == 10);
    REQUIRE(select.offset() == 0);

    REQUIRE(tree::render(select) ==
            "SELECT \"student\".\"surname\" AS \"student\", count(\"school\".\"name\") AS \"num\" "
            "FROM \"student\" JOIN \"school\" ON \"school\".\"id\" = \"student\".\"school\" "
            "WHERE \"student\".\"score\" < 2 GROUP BY \"student\".\"surname\" "
            "HAVING count(\"school\".\"name\") > 1 "
            "ORDER BY \"student\".\"class\" ASC, \"student\".\"score\" DESC LIMIT 10");
}

TEST_CASE("Tree tables", "[codegen][tree]") {
    auto table = tree::TableRef::of(*testing::student_schema());
    const auto& ref = static_cast<const tree::TableRef&>(*table);
    REQUIRE(ref.name() == "student");
    REQUIRE(ref.handle() == "student");
    REQUIRE(ref.columns().size() == 5);
    REQUIRE(ref.columns()[1].name == "birthday");
    REQUIRE(ref.columns()[2].type->id() == KindId::Integer);
}

TEST_CASE("Tree expressions keep operator precedence", "[codegen][tree]") {
    auto student = testing::student();
    auto score = student->at("score");
    auto level = student->at("class");

    SECTION("arithmetic") {
        auto query = student->select({sub(score, sub(level, 1)), mul(add(score, 1), level)});
        REQUIRE(text(query) ==
                "SELECT \"student\".\"score\" - (\"student\".\"class\" - 1), "
                "(\"student\".\"score\" + 1) * \"student\".\"class\" FROM \"student\"");
    }

    SECTION("logic") {
        auto query = student->select({score})->where(
            and_(or_(gt(score, 1), lt(level, 2)), not_(and_(is_null(score), not_null(level)))));
        REQUIRE(text(query) ==
                "SELECT \"student\".\"score\" FROM \"student\" WHERE (\"student\".\"score\" > 1 "
                "OR \"student\".\"class\" < 2) AND NOT (\"student\".\"score\" IS NULL AND "
                "\"student\".\"class\" IS NOT NULL)");
    }

    SECTION("casts and literals") {
        auto query = student->select({cast(score, Kind::integer()), alias(literal("x"), "tag")});
        REQUIRE(text(query) ==
                "SELECT CAST(\"student\".\"score\" AS BIGINT), 'x' AS \"tag\" FROM \"student\"");
    }
}

TEST_CASE("Tree sources", "[codegen][tree]") {
    auto student = testing::student();
    auto school = testing::school();
    auto surname = student->at("surname");

    SECTION("self join through an alias") {
        auto person = testing::person();
        auto boss = person->reference("boss");
        auto query = person->left_join(boss, eq(person->at("manager"), boss->at("id")))
                         ->select({person->at("name"), alias(boss->at("name"), "boss")});
        REQUIRE(text(query) ==
                "SELECT \"person\".\"name\", \"boss\".\"name\" AS \"boss\" FROM \"person\" "
                "LEFT OUTER JOIN \"person\" AS \"boss\" ON \"person\".\"manager\" = \"boss\".\"id\"");
    }

    SECTION("cross join") {
        auto node = build(student->cross_join(school)->select({surname, school->at("name")}));
        const auto& select = static_cast<const tree::Select&>(*node);
        const auto& join = static_cast<const tree::JoinRef&>(*select.from());
        REQUIRE(join.join() == JoinKind::Cross);
        REQUIRE(join.onclause() == nullptr);
        REQUIRE(tree::render(select) ==
                "SELECT \"student\".\"surname\", \"school\".\"name\" FROM \"student\" CROSS JOIN "
                "\"school\"");
    }

    SECTION("nested query") {
        auto inner = student->select({surname})->limit(5, 10)->reference("s");
        REQUIRE(text(inner->select({inner->at("surname")})) ==
                "SELECT \"s\".\"surname\" FROM (SELECT \"student\".\"surname\" FROM \"student\" "
                "LIMIT 5 OFFSET 10) AS \"s\"");
    }

    SECTION("compound select") {
        auto node = build(student->select({surname})->intersection(student->select({surname})));
        REQUIRE(node->kind() == tree::NodeKind::CompoundSelect);
        REQUIRE(static_cast<const tree::CompoundSelect&>(*node).set() == SetKind::Intersection);
        REQUIRE(tree::render(*node) ==
                "SELECT \"student\".\"surname\" FROM \"student\" INTERSECT "
                "SELECT \"student\".\"surname\" FROM \"student\"");
    }
}

TEST_CASE("Tree errors", "[codegen][tree]") {
    auto student = testing::student();

    SECTION("windows are not supported") {
        auto ranked = over(sum(student->at("score")), {student->at("school")});
        auto result = tree::compile(student->select({ranked}));
        REQUIRE_FALSE(result.has_value());
        REQUIRE_THAT(result.error().message,
                     Catch::Matchers::ContainsSubstring("Window functions not yet supported"));
    }

    SECTION("only table and alias references qualify columns") {
        tree::Select select(tree::Select::Clauses{});
        REQUIRE_THROWS_AS(select.handle(), UnsupportedError);
    }
}
