#include "fixtures.hpp"

#include <oryx/core/time.hpp>
#include <oryx/runtime/closure.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cstdint>
#include <limits>
#include <string>

using namespace oryx;
using namespace oryx::dsl;
using runtime::Catalog;
using runtime::Column;
using runtime::Datum;
using runtime::ScalarValue;

namespace {

auto date(std::string_view text) -> Date {
    return *parse_date(text);
}

auto catalog() -> Catalog {
    Catalog tables;

    runtime::Table student;
    student.add_column("surname", Column<std::string>{"smith", "smith", "jones", "jones", "brown"});
    student.add_column("birthday", Column<Date>{date("2001-01-01"), date("2001-02-02"),
                                                date("2002-03-03"), date("2002-04-04"),
                                                date("2003-05-05")});
    student.add_column("class", Column<std::int64_t>{1, 2, 1, 3, 2});
    student.add_column("score", Column<double>{1.5, 1.0, 1.8, 3.0, 0.5});
    student.add_column("school", Column<std::int64_t>{1, 2, 1, 2, 1});
    tables.emplace("student", std::move(student));

    runtime::Table school;
    school.add_column("id", Column<std::int64_t>{1, 2});
    school.add_column("name", Column<std::string>{"north", "south"});
    tables.emplace("school", std::move(school));

    runtime::Table person;
    person.add_column("id", Column<std::int64_t>{1, 2, 3});
    person.add_column("name", Column<std::string>{"ann", "bob", "cid"});
    person.add_column("manager", Column<std::int64_t>{0, 1, 1}, {false, true, true});
    tables.emplace("person", std::move(person));

    return tables;
}

auto run(const SourcePtr& statement) -> runtime::Table {
    auto result = runtime::execute(statement, catalog());
    if (!result) {
        FAIL(result.error().message);
    }
    return *result;
}

auto cell(const runtime::Table& table, const std::string& name, std::size_t row) -> Datum {
    for (std::size_t c = 0; c < table.columns.size(); ++c) {
        if (table.columns[c].name == name) {
            return table.at(c, row);
        }
    }
    FAIL("No column " << name);
    return std::nullopt;
}

auto text(const std::string& value) -> Datum {
    return ScalarValue{value};
}

auto integer(std::int64_t value) -> Datum {
    return ScalarValue{value};
}

auto as_expression(const FeaturePtr& feature) -> const Expression& {
    return static_cast<const Expression&>(*feature);
}

}  // namespace

TEST_CASE("Closure runs the canonical query", "[runtime][closure]") {
    auto table = run(testing::canonical_query(testing::student(), testing::school()));
    REQUIRE(table.rows() == 1);
    REQUIRE(table.columns.size() == 2);
    REQUIRE(cell(table, "student", 0) == text("smith"));
    REQUIRE(cell(table, "num", 0) == integer(2));
}

TEST_CASE("Closure projections and filters", "[runtime][closure]") {
    auto student = testing::student();
    auto score = student->at("score");

    SECTION("computed columns") {
        auto table = run(student->select({alias(add(student->at("class"), 1), "next"),
                                          alias(year(student->at("birthday")), "born"),
                                          mul(score, 2)})
                             ->where(gt(score, 1.6)));
        REQUIRE(table.rows() == 2);
        REQUIRE(cell(table, "next", 0) == integer(2));
        REQUIRE(cell(table, "born", 1) == integer(2002));
        REQUIRE(std::get<double>(*cell(table, "_2", 1)) == Catch::Approx(6.0));
    }

    SECTION("order, offset and limit") {
        auto table = run(student->select({student->at("surname"), score})
                             ->orderby({score, "descending"})
                             ->limit(2, 1));
        REQUIRE(table.rows() == 2);
        REQUIRE(cell(table, "surname", 0) == text("jones"));
        REQUIRE(cell(table, "surname", 1) == text("smith"));
    }

    SECTION("an offset past the end yields no rows") {
        REQUIRE(run(student->select({score})->limit(3, 10)).rows() == 0);
    }

    SECTION("casts") {
        auto table = run(student->select({alias(cast(score, Kind::integer()), "whole")})
                             ->orderby({score}));
        REQUIRE(cell(table, "whole", 4) == integer(3));
    }
}

TEST_CASE("Closure aggregates", "[runtime][closure]") {
    auto student = testing::student();
    auto surname = student->at("surname");

    SECTION("grouped") {
        auto table = run(student
                             ->select({surname, alias(sum(student->at("class")), "total"),
                                       alias(avg(student->at("score")), "mean"),
                                       alias(count(), "n")})
                             ->groupby({surname})
                             ->orderby({surname}));
        REQUIRE(table.rows() == 3);
        REQUIRE(cell(table, "surname", 0) == text("brown"));
        REQUIRE(cell(table, "total", 1) == integer(4));
        REQUIRE(std::get<double>(*cell(table, "mean", 1)) == Catch::Approx(2.4));
        REQUIRE(cell(table, "n", 2) == integer(2));
    }

    SECTION("whole table") {
        auto table = run(student->select(
            {alias(max(student->at("score")), "best"), alias(min(surname), "first")}));
        REQUIRE(table.rows() == 1);
        REQUIRE(std::get<double>(*cell(table, "best", 0)) == Catch::Approx(3.0));
        REQUIRE(cell(table, "first", 0) == text("brown"));
    }

    SECTION("having filters groups") {
        auto table = run(student->select({surname, alias(count(), "n")})
                             ->groupby({surname})
                             ->having(lt(count(), 2)));
        REQUIRE(table.rows() == 1);
        REQUIRE(cell(table, "surname", 0) == text("brown"));
    }
}

TEST_CASE("Closure joins", "[runtime][closure]") {
    auto person = testing::person();
    auto boss = person->reference("boss");
    auto condition = eq(person->at("manager"), boss->at("id"));
    auto select = [&](const SourcePtr& join) {
        return run(join->select({person->at("name"), alias(boss->at("name"), "boss")})
                       ->orderby({person->at("name"), boss->at("name")}));
    };

    SECTION("inner") {
        auto table = select(person->inner_join(boss, condition));
        REQUIRE(table.rows() == 2);
        REQUIRE(cell(table, "name", 0) == text("bob"));
        REQUIRE(cell(table, "boss", 1) == text("ann"));
    }

    SECTION("left keeps unmatched rows") {
        auto table = select(person->left_join(boss, condition));
        REQUIRE(table.rows() == 3);
        REQUIRE(cell(table, "name", 0) == text("ann"));
        REQUIRE(cell(table, "boss", 0) == std::nullopt);
    }

    SECTION("right keeps unmatched rows of the other side, nulls sort first") {
        auto table = select(person->right_join(boss, condition));
        REQUIRE(table.rows() == 4);
        REQUIRE(cell(table, "name", 0) == std::nullopt);
        REQUIRE(cell(table, "boss", 0) == text("bob"));
        REQUIRE(cell(table, "boss", 1) == text("cid"));
    }

    SECTION("full") {
        REQUIRE(select(person->full_join(boss, condition)).rows() == 5);
    }

    SECTION("cross") {
        auto student = testing::student();
        auto school = testing::school();
        auto table = run(student->cross_join(school)->select({student->at("surname"),
                                                              school->at("name")}));
        REQUIRE(table.rows() == 10);
    }
}

TEST_CASE("Closure sets", "[runtime][closure]") {
    auto student = testing::student();
    auto surname = student->at("surname");
    auto all = student->select({surname});
    auto weak = student->select({surname})->where(lt(student->at("score"), 1));

    SECTION("union removes duplicates") {
        auto table = run(all->union_(weak));
        REQUIRE(table.rows() == 3);
        REQUIRE(cell(table, "surname", 2) == text("brown"));
    }

    SECTION("intersection") {
        auto table = run(all->intersection(weak));
        REQUIRE(table.rows() == 1);
        REQUIRE(cell(table, "surname", 0) == text("brown"));
    }

    SECTION("difference") {
        auto table = run(all->difference(weak));
        REQUIRE(table.rows() == 2);
        REQUIRE(cell(table, "surname", 0) == text("smith"));
        REQUIRE(cell(table, "surname", 1) == text("jones"));
    }
}

TEST_CASE("Closure nested queries", "[runtime][closure]") {
    auto student = testing::student();
    auto good = student->select({student->at("surname"), alias(student->at("score"), "s")})
                    ->where(gt(student->at("score"), 1))
                    ->reference("good");
    auto table = run(good->select({alias(count(), "n"), alias(max(good->at("s")), "top")}));
    REQUIRE(cell(table, "n", 0) == integer(3));
    REQUIRE(std::get<double>(*cell(table, "top", 0)) == Catch::Approx(3.0));
}

TEST_CASE("Closure null semantics", "[runtime][closure]") {
    Datum null;
    Datum yes = ScalarValue{true};
    Datum no = ScalarValue{false};
    auto conjunction = and_(true, true);
    auto disjunction = or_(true, true);

    REQUIRE(runtime::apply(as_expression(conjunction), {null, no}) == no);
    REQUIRE(runtime::apply(as_expression(conjunction), {null, yes}) == null);
    REQUIRE(runtime::apply(as_expression(disjunction), {null, yes}) == yes);
    REQUIRE(runtime::apply(as_expression(disjunction), {null, no}) == null);
    REQUIRE(runtime::apply(as_expression(not_(true)), {null}) == null);
    REQUIRE(runtime::apply(as_expression(is_null(1)), {null}) == yes);

    auto division = dsl::div(7, 2);
    REQUIRE(runtime::apply(as_expression(division), {integer(7), integer(2)}) == integer(3));
    REQUIRE(runtime::apply(as_expression(division), {integer(7), integer(0)}) == null);
    REQUIRE(runtime::apply(as_expression(add(1, 1)), {integer(1), null}) == null);

    REQUIRE(runtime::reduce(Function::Count, nullptr, 4) == integer(4));
    REQUIRE_THROWS_AS(runtime::reduce(Function::Sum, nullptr, 4), StateError);

    SECTION("null cells fail filters") {
        auto person = testing::person();
        auto table = run(person->select({person->at("name")})->where(gt(person->at("manager"), 0)));
        REQUIRE(table.rows() == 2);
    }

    SECTION("count skips nulls") {
        auto person = testing::person();
        auto table = run(person->select({alias(count(person->at("manager")), "n")}));
        REQUIRE(cell(table, "n", 0) == integer(2));
    }
}

TEST_CASE("Closure integer overflow yields null", "[runtime][closure]") {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    Datum null;

    REQUIRE(runtime::apply(as_expression(add(1, 1)), {integer(kMax), integer(1)}) == null);
    REQUIRE(runtime::apply(as_expression(sub(1, 1)), {integer(kMin), integer(1)}) == null);
    REQUIRE(runtime::apply(as_expression(mul(1, 1)), {integer(kMax), integer(2)}) == null);
    REQUIRE(runtime::apply(as_expression(dsl::div(1, 1)), {integer(kMin), integer(-1)}) == null);
    REQUIRE(runtime::apply(as_expression(mod(1, 1)), {integer(kMin), integer(-1)}) ==
            integer(0));
    REQUIRE(runtime::apply(as_expression(dsl::abs(1)), {integer(kMin)}) == null);
    REQUIRE(runtime::apply(as_expression(dsl::abs(1)), {integer(-3)}) == integer(3));

    Datum huge = ScalarValue{1e300};
    REQUIRE(runtime::apply(as_expression(dsl::ceil(1.5)), {huge}) == null);
    REQUIRE(runtime::apply(as_expression(dsl::floor(1.5)), {Datum{ScalarValue{-1e300}}}) ==
            null);
    REQUIRE(runtime::apply(as_expression(dsl::ceil(1.5)), {Datum{ScalarValue{1.25}}}) ==
            integer(2));

    SECTION("in a query") {
        auto school = testing::school();
        Catalog tables;
        runtime::Table rows;
        rows.add_column("id", Column<std::int64_t>{kMax, 1});
        rows.add_column("name", Column<std::string>{"north", "south"});
        tables.emplace("school", std::move(rows));

        auto next = runtime::execute(school->select({alias(add(school->at("id"), 1), "next")}),
                                     tables);
        REQUIRE(next.has_value());
        REQUIRE(cell(*next, "next", 0) == null);
        REQUIRE(cell(*next, "next", 1) == integer(2));

        auto total = runtime::execute(school->select({alias(sum(school->at("id")), "total")}),
                                      tables);
        REQUIRE(total.has_value());
        REQUIRE(cell(*total, "total", 0) == null);
    }
}

TEST_CASE("Closure errors", "[runtime][closure]") {
    auto student = testing::student();

    SECTION("missing catalog table") {
        auto result = runtime::execute(testing::school()->select({testing::school()->at("id")}),
                                       Catalog{});
        REQUIRE_FALSE(result.has_value());
        REQUIRE_THAT(result.error().message, Catch::Matchers::ContainsSubstring("Unknown table"));
    }

    SECTION("window functions need a mapping") {
        auto ranked = over(sum(student->at("score")), {student->at("school")});
        auto result = runtime::compile(student->select({ranked}));
        REQUIRE_FALSE(result.has_value());
    }

    SECTION("mapped features replace evaluation") {
        auto bonus = add(student->at("score"), 1);
        runtime::Generator::FeatureMap features;
        features.emplace(bonus, runtime::Columnizer{"bonus", Kind::floating(), false,
                                                    [](const runtime::Table& table) {
                                                        return runtime::Series::of(
                                                            *Kind::floating(),
                                                            std::vector<Datum>(table.rows(),
                                                                               ScalarValue{9.0}));
                                                    }});
        auto closure = runtime::compile(student->select({alias(bonus, "b")}), {}, features);
        REQUIRE(closure.has_value());
        auto table = (*closure)(catalog());
        REQUIRE(table.rows() == 5);
        REQUIRE(cell(table, "b", 0) == Datum{ScalarValue{9.0}});
    }
}
