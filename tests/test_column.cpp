#include <oryx/core/error.hpp>
#include <oryx/core/time.hpp>
#include <oryx/dsl/kind.hpp>
#include <oryx/runtime/column.hpp>
#include <oryx/runtime/table.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace oryx;
using namespace oryx::runtime;

TEST_CASE("Column<int64_t> basic operations", "[runtime][column]") {
    Column<std::int64_t> col{1, 2, 3, 4, 5};

    SECTION("size and element access") {
        REQUIRE(col.size() == 5);
        REQUIRE(col.at(0) == 1);
        REQUIRE(col[4] == 5);
    }

    SECTION("at() throws on out-of-bounds") {
        REQUIRE_THROWS_AS(col.at(100), std::out_of_range);
    }

    SECTION("take picks rows in order, repeating as asked") {
        std::vector<std::size_t> rows{4, 0, 0};
        REQUIRE(col.take(rows) == Column<std::int64_t>{5, 1, 1});
    }
}

TEST_CASE("Column<bool> uses packed storage", "[runtime][column]") {
    Column<bool> col{true, false};
    col.push_back(true);
    REQUIRE(col.size() == 3);
    REQUIRE_FALSE(static_cast<bool>(col.at(1)));
    std::vector<std::size_t> rows{1, 2};
    REQUIRE(col.take(rows) == Column<bool>{false, true});
}

TEST_CASE("Datum conversions", "[runtime][column]") {
    REQUIRE(to_datum(Value(3)) == Datum{std::int64_t{3}});
    REQUIRE(to_datum(Value(Decimal::parse("1.25").value())) == Datum{1.25});
    REQUIRE_THROWS_AS(to_datum(Value(Array{{Value(1)}})), UnsupportedError);

    REQUIRE(format_datum(std::nullopt) == "null");
    REQUIRE(format_datum(ScalarValue{true}) == "true");
    REQUIRE(format_datum(ScalarValue{*parse_date("2020-02-29")}) == "2020-02-29");
    REQUIRE(to_value(ScalarValue{std::string("x")}) == Value("x"));
}

TEST_CASE("Series", "[runtime][column]") {
    SECTION("nulls become a validity bitmap") {
        auto series = Series::of(*dsl::Kind::integer(), {std::int64_t{1}, std::nullopt});
        REQUIRE(series.size() == 2);
        REQUIRE(series.validity.has_value());
        REQUIRE(series.is_null(1));
        REQUIRE(series.at(0) == Datum{std::int64_t{1}});
    }

    SECTION("integers widen into float columns") {
        auto series = Series::of(*dsl::Kind::floating(), {std::int64_t{2}});
        REQUIRE_FALSE(series.validity.has_value());
        REQUIRE(series.at(0) == Datum{2.0});
    }

    SECTION("a single value is broadcast") {
        auto series = Series::of(*dsl::Kind::string(), {ScalarValue{std::string("k")}});
        REQUIRE(series.at(7) == Datum{std::string("k")});
    }

    SECTION("incompatible cells are rejected") {
        REQUIRE_THROWS_AS(Series::of(*dsl::Kind::date(), {ScalarValue{std::string("x")}}),
                          CastError);
    }

    SECTION("compound kinds have no column") {
        REQUIRE_THROWS_AS(make_column(*dsl::Kind::array(dsl::Kind::integer())), UnsupportedError);
    }
}

TEST_CASE("Table", "[runtime][column]") {
    Table table;
    table.add_column("id", Column<std::int64_t>{1, 2, 3});
    table.add_column("name", Column<std::string>{"a", "b", "c"}, {true, false, true});

    REQUIRE(table.rows() == 3);
    REQUIRE(table.find("name") != nullptr);
    REQUIRE(table.find("missing") == nullptr);
    REQUIRE(table.at(1, 1) == std::nullopt);

    SECTION("columns are replaced by name") {
        table.add_column("id", Column<std::int64_t>{7, 8, 9});
        REQUIRE(table.columns.size() == 2);
        REQUIRE(table.at(0, 0) == Datum{std::int64_t{7}});
    }

    SECTION("qualification") {
        auto qualified = table.qualified("p");
        REQUIRE(qualified.find("p", "id") != nullptr);
        REQUIRE(qualified.find("", "id") == nullptr);
        REQUIRE(table.find("", "id") != nullptr);
    }

    SECTION("take by position") {
        auto taken = table.take(std::vector<std::size_t>{1, 2});
        REQUIRE(taken.rows() == 2);
        REQUIRE(taken.at(0, 0) == Datum{std::int64_t{2}});
        REQUIRE(taken.at(1, 0) == std::nullopt);
        REQUIRE(taken.at(1, 1) == Datum{std::string("c")});
    }

    SECTION("take with missing rows pads with nulls") {
        auto taken = table.take(std::vector<std::optional<std::size_t>>{0, std::nullopt});
        REQUIRE(taken.rows() == 2);
        REQUIRE(taken.at(0, 0) == Datum{std::int64_t{1}});
        REQUIRE(taken.at(0, 1) == std::nullopt);
        REQUIRE(taken.at(1, 1) == std::nullopt);
    }

    SECTION("printing") {
        auto text = to_string(table, 2);
        REQUIRE_THAT(text, Catch::Matchers::StartsWith("rows: 3\n"));
        REQUIRE_THAT(text, Catch::Matchers::ContainsSubstring("| id | name |"));
        REQUIRE_THAT(text, Catch::Matchers::ContainsSubstring("| 2  | null |"));
        REQUIRE_THAT(text, Catch::Matchers::EndsWith("... (1 more rows)\n"));
        REQUIRE(to_string(Table{}) == "<empty>\n");
    }
}
