#include <oryx/core/time.hpp>
#include <oryx/core/value.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace oryx;

TEST_CASE("Dates count days from the epoch", "[core][time]") {
    REQUIRE(make_date(1970, 1, 1).days == 0);
    REQUIRE(make_date(2000, 3, 1).days == 11017);
    REQUIRE(make_date(1969, 12, 31).days == -1);
    REQUIRE(year_of(make_date(2024, 2, 29)) == 2024);
    REQUIRE(format_date(make_date(1999, 12, 31)) == "1999-12-31");
}

TEST_CASE("Dates parse from ISO text", "[core][time]") {
    REQUIRE(parse_date("2000-03-01") == make_date(2000, 3, 1));
    REQUIRE_FALSE(parse_date("2000-02-30").has_value());
    REQUIRE_FALSE(parse_date("2000-2-01").has_value());
    REQUIRE_FALSE(parse_date("2000/03/01").has_value());
}

TEST_CASE("Timestamps parse and format", "[core][time]") {
    auto ts = make_timestamp(2021, 6, 1, 12, 30, 5, 250);
    REQUIRE(format_timestamp(ts) == "2021-06-01 12:30:05.000250");
    REQUIRE(parse_timestamp("2021-06-01 12:30:05.000250") == ts);
    REQUIRE(parse_timestamp("2021-06-01 12:30:05.25") ==
            make_timestamp(2021, 6, 1, 12, 30, 5, 250'000));

    auto minute = parse_timestamp("2021-06-01T12:30");
    REQUIRE(minute.has_value());
    REQUIRE(format_timestamp(*minute) == "2021-06-01 12:30:00");
    REQUIRE(format_timestamp(*minute, true) == "2021-06-01 12:30:00.000000");

    REQUIRE(parse_timestamp("2021-06-01") == timestamp_of(make_date(2021, 6, 1)));
    REQUIRE_FALSE(parse_timestamp("2021-06-01 24:00").has_value());
    REQUIRE_FALSE(parse_timestamp("2021-06-01 12:30:05.").has_value());
    REQUIRE_FALSE(parse_timestamp("2021-06-01X12:30").has_value());
}

TEST_CASE("Instants before the epoch floor to the previous day", "[core][time]") {
    REQUIRE(date_of(make_timestamp(1969, 12, 31, 23)) == make_date(1969, 12, 31));
    REQUIRE(date_of(make_timestamp(1970, 1, 1)) == make_date(1970, 1, 1));
}

TEST_CASE("Decimals keep their scale", "[core][value]") {
    auto price = Decimal::parse("-12.50");
    REQUIRE(price.has_value());
    REQUIRE(price->units == -1250);
    REQUIRE(price->scale == 2);
    REQUIRE(price->to_string() == "-12.50");
    REQUIRE(*price == Decimal::parse("-12.5").value());
    REQUIRE(price->normalized().scale == 1);
    REQUIRE(price->to_double() == -12.5);

    REQUIRE(Decimal{5, 3}.to_string() == "0.005");
    REQUIRE(Decimal{-5, 2}.to_string() == "-0.05");
    REQUIRE(Decimal::from_double(0.1).to_string() == "0.1");

    REQUIRE_FALSE(Decimal::parse("").has_value());
    REQUIRE_FALSE(Decimal::parse(".").has_value());
    REQUIRE_FALSE(Decimal::parse("1e3").has_value());
    REQUIRE_FALSE(Decimal::parse("1.2.3").has_value());
}

TEST_CASE("Value repr", "[core][value]") {
    REQUIRE(Value(true).repr() == "True");
    REQUIRE(Value(42).repr() == "42");
    REQUIRE(Value(1.0).repr() == "1.0");
    REQUIRE(Value(2.5).repr() == "2.5");
    REQUIRE(Value("o'neil").repr() == "'o\\'neil'");
    REQUIRE(Value(make_date(2020, 1, 2)).repr() == "2020-01-02");

    Array numbers;
    numbers.items.push_back(Value(1));
    numbers.items.push_back(Value(2));
    REQUIRE(Value(numbers).repr() == "[1, 2]");

    Map mapping;
    mapping.entries.emplace_back(Value("a"), Value(1));
    REQUIRE(Value(mapping).repr() == "{'a': 1}");

    Struct record;
    record.entries.emplace_back("x", Value(1.5));
    REQUIRE(Value(record).repr() == "{'x': 1.5}");
}

TEST_CASE("Value equality and hashing", "[core][value]") {
    Value wide(Decimal::parse("1.50").value());
    Value narrow(Decimal::parse("1.5").value());
    REQUIRE(wide == narrow);
    REQUIRE(wide.hash() == narrow.hash());

    REQUIRE_FALSE(Value(1) == Value(1.0));
    REQUIRE_FALSE(Value("1") == Value(1));

    Array first;
    first.items.push_back(Value("a"));
    Array second = first;
    REQUIRE(Value(first) == Value(second));
    REQUIRE(std::hash<Value>{}(Value(first)) == std::hash<Value>{}(Value(second)));
    second.items.push_back(Value("b"));
    REQUIRE_FALSE(Value(first) == Value(second));
}
