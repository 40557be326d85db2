#include "fixtures.hpp"

#include <oryx/core/error.hpp>
#include <oryx/parser/visitor.hpp>

#include <catch2/catch_test_macros.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace oryx;
using namespace oryx::dsl;

namespace {

/// Renders a prefix notation of the tree, recording what tables are asked for.
class Printer : public parser::Visitor<std::string, std::string> {
   public:
    struct Access {
        std::string table;
        std::vector<std::string> fields;
        std::optional<std::string> predicate;
    };

    explicit Printer(SourceMap sources, FeatureMap features = {}, bool fallback = true)
        : Visitor(std::move(sources), std::move(features)), fallback_(fallback) {}

    auto resolve_feature(const Feature& feature) -> std::optional<std::string> override {
        if (auto mapped = Visitor::resolve_feature(feature)) {
            return mapped;
        }
        if (fallback_ && feature.type() == FeatureType::Element) {
            return static_cast<const Element&>(feature).field();
        }
        return std::nullopt;
    }

    auto generate_element(const std::string& origin, const std::string& element)
        -> std::string override {
        return origin + "." + element;
    }
    auto generate_alias(const std::string& feature, const std::string& alias)
        -> std::string override {
        return fmt::format("{} AS {}", feature, alias);
    }
    auto generate_literal(const Value& value, const KindPtr& /*kind*/) -> std::string override {
        return value.repr();
    }
    auto generate_expression(const Expression& expression,
                             const std::vector<std::string>& arguments) -> std::string override {
        return fmt::format("{}({})", symbol(expression.function()), fmt::join(arguments, ", "));
    }
    auto generate_table(const std::string& table, const std::vector<std::string>& features,
                        const std::optional<std::string>& predicate) -> std::string override {
        accesses.push_back({table, features, predicate});
        return table;
    }
    auto generate_reference(const std::string& instance, const std::string& name)
        -> std::pair<std::string, std::string> override {
        return {fmt::format("{} AS {}", instance, name), name};
    }
    auto generate_join(const std::string& left, const std::string& right,
                       const std::optional<std::string>& condition, JoinKind kind)
        -> std::string override {
        return fmt::format("{} {} JOIN {} ON {}", left, to_string(kind), right,
                           condition.value_or("-"));
    }
    auto generate_set(const std::string& left, const std::string& right, SetKind kind)
        -> std::string override {
        return fmt::format("({}) {} ({})", left, to_string(kind), right);
    }
    auto generate_query(const std::string& source, const std::vector<std::string>& features,
                        const std::optional<std::string>& where,
                        const std::vector<std::string>& /*groupby*/,
                        const std::optional<std::string>& /*having*/,
                        const std::vector<OrderSymbol>& /*orderby*/,
                        const std::optional<Rows>& /*rows*/) -> std::string override {
        auto text = fmt::format("SELECT {} FROM {}", fmt::join(features, ", "), source);
        if (where) {
            text += " WHERE " + *where;
        }
        return text;
    }

    std::vector<Access> accesses;

   private:
    bool fallback_;
};

}  // namespace

TEST_CASE("Visitor walks queries", "[parser][visitor]") {
    auto student = testing::student();
    Printer printer({{student, "student"}});

    auto query = student->select({student->at("surname")})->where(lt(student->at("score"), 2));
    REQUIRE(printer.compile(query) ==
            "SELECT student.surname FROM student WHERE <(student.score, 2)");

    REQUIRE(printer.accesses.size() == 1);
    const auto& access = printer.accesses.front();
    REQUIRE(access.table == "student");
    std::vector<std::string> fields{"student.score", "student.surname"};
    REQUIRE(access.fields == fields);
    REQUIRE(access.predicate == "<(student.score, 2)");
}

TEST_CASE("Visitor pushes down only single table factors", "[parser][visitor]") {
    auto student = testing::student();
    auto school = testing::school();
    Printer printer({{student, "student"}, {school, "school"}});

    auto query = student->inner_join(school, eq(school->at("id"), student->at("school")))
                     ->select({student->at("surname"), school->at("name")});
    REQUIRE(printer.compile(query) ==
            "SELECT student.surname, school.name FROM student inner JOIN school ON "
            "==(school.id, student.school)");

    REQUIRE(printer.accesses.size() == 2);
    for (const auto& access : printer.accesses) {
        REQUIRE_FALSE(access.predicate);
        REQUIRE(access.fields.size() == 2);
    }
}

TEST_CASE("Visitor keeps self-join handles apart", "[parser][visitor]") {
    auto person = testing::person();
    auto boss = person->reference("boss");
    Printer printer({{person, "person"}});

    auto query = person->inner_join(boss, eq(person->at("manager"), boss->at("id")))
                     ->select({person->at("name"), alias(boss->at("name"), "boss")});
    REQUIRE(printer.compile(query) ==
            "SELECT person.name, boss.name AS boss FROM person inner JOIN person AS boss ON "
            "==(person.manager, boss.id)");
}

TEST_CASE("Visitor renders sets", "[parser][visitor]") {
    auto student = testing::student();
    Printer printer({{student, "student"}});

    auto left = student->select({student->at("surname")});
    auto right = student->select({student->at("surname")})->where(gt(student->at("class"), 3));
    REQUIRE(printer.compile(left->union_(right)) ==
            "(SELECT student.surname FROM student) union "
            "(SELECT student.surname FROM student WHERE >(student.class, 3))");
}

TEST_CASE("Visitor mappings override default results", "[parser][visitor]") {
    auto student = testing::student();

    SECTION("source mapping") {
        auto query = student->select({student->at("surname")});
        Printer printer({{student, "student"}, {query, "cached"}});
        REQUIRE(printer.compile(query) == "cached");
    }

    SECTION("feature mapping") {
        auto bonus = add(student->at("score"), 1);
        Printer printer({{student, "student"}}, {{bonus, "bonus"}});
        REQUIRE(printer.compile(student->select({alias(bonus, "total")})) ==
                "SELECT bonus AS total FROM student");
    }
}

TEST_CASE("Visitor reports missing provisions", "[parser][visitor]") {
    auto student = testing::student();
    auto school = testing::school();

    SECTION("unmapped table") {
        Printer printer({{student, "student"}});
        REQUIRE_THROWS_AS(printer.compile(school->select({school->at("name")})),
                          UnprovisionedError);
    }

    SECTION("unmapped element") {
        Printer printer({{student, "student"}}, {}, false);
        REQUIRE_THROWS_AS(printer.compile(student->select({student->at("surname")})),
                          UnprovisionedError);
    }

    SECTION("windows are unsupported by default") {
        Printer printer({{student, "student"}});
        auto ranked = over(sum(student->at("score")), {student->at("school")});
        REQUIRE_THROWS_AS(printer.compile(student->select({ranked})), UnsupportedError);
    }

    SECTION("the visitor is reusable after a failure") {
        Printer printer({{student, "student"}});
        REQUIRE_THROWS(printer.compile(school->select({school->at("name")})));
        REQUIRE(printer.compile(student->select({student->at("surname")})) ==
                "SELECT student.surname FROM student");
    }
}
