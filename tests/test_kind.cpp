#include <oryx/core/error.hpp>
#include <oryx/dsl/kind.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace oryx;
using oryx::dsl::Kind;
using oryx::dsl::KindClass;
using oryx::dsl::KindId;

TEST_CASE("Primitive kinds are interned", "[dsl][kind]") {
    REQUIRE(Kind::integer() == Kind::integer());
    REQUIRE(Kind::primitive(KindId::String) == Kind::string());
    REQUIRE(Kind::integer()->name() == "Integer");
    REQUIRE(Kind::timestamp()->is_primitive());
    REQUIRE_THROWS_AS(Kind::primitive(KindId::Array), GrammarError);
}

TEST_CASE("Compound kinds compare structurally", "[dsl][kind]") {
    auto first = Kind::array(Kind::integer());
    auto second = Kind::array(Kind::integer());
    REQUIRE(first != second);
    REQUIRE(*first == *second);
    REQUIRE(first->hash() == second->hash());
    REQUIRE_FALSE(*first == *Kind::array(Kind::floating()));

    auto mapping = Kind::map(Kind::string(), Kind::floating());
    REQUIRE(mapping->name() == "Map(String, Float)");
    REQUIRE(mapping->key() == Kind::string());
    REQUIRE(mapping->value() == Kind::floating());
    REQUIRE_THROWS_AS(mapping->element(), GrammarError);

    auto record = Kind::structure({{"a", Kind::integer()}, {"b", Kind::string()}});
    REQUIRE(record->name() == "Struct(a=Integer, b=String)");
    REQUIRE(record->elements().size() == 2);
}

TEST_CASE("Kind categories", "[dsl][kind]") {
    REQUIRE(dsl::match(KindClass::Numeric, *Kind::decimal()));
    REQUIRE_FALSE(dsl::match(KindClass::Numeric, *Kind::string()));
    REQUIRE(dsl::match(KindClass::Date, *Kind::timestamp()));
    REQUIRE_FALSE(dsl::match(KindClass::Timestamp, *Kind::date()));
    REQUIRE(dsl::match(KindClass::Compound, *Kind::array(Kind::boolean())));
    REQUIRE(Kind::date()->match(*Kind::timestamp()));
    REQUIRE_FALSE(Kind::timestamp()->match(*Kind::date()));

    REQUIRE(dsl::ensure(KindClass::Integer, Kind::integer()) == Kind::integer());
    REQUIRE_THROWS_AS(dsl::ensure(KindClass::Boolean, Kind::integer()), GrammarError);
}

TEST_CASE("Rank picks the widest arithmetic kind", "[dsl][kind]") {
    REQUIRE(Kind::boolean()->rank() < Kind::integer()->rank());
    REQUIRE(Kind::integer()->rank() < Kind::floating()->rank());
}

TEST_CASE("reflect infers kinds of native values", "[dsl][kind]") {
    REQUIRE(dsl::reflect(Value(true)) == Kind::boolean());
    REQUIRE(dsl::reflect(Value(1)) == Kind::integer());
    REQUIRE(dsl::reflect(Value(1.5)) == Kind::floating());
    REQUIRE(dsl::reflect(Value("x")) == Kind::string());
    REQUIRE(dsl::reflect(Value(make_date(2024, 1, 31))) == Kind::date());
    REQUIRE(dsl::reflect(Value(make_timestamp(2024, 1, 31, 12))) == Kind::timestamp());

    SECTION("arrays take the kind of their first item") {
        auto kind = dsl::reflect(Value(Array{{Value(1), Value(2)}}));
        REQUIRE(*kind == *Kind::array(Kind::integer()));
    }

    SECTION("homogeneous mappings are maps") {
        auto kind = dsl::reflect(Value(Map{{{Value("a"), Value(1)}, {Value("b"), Value(2)}}}));
        REQUIRE(*kind == *Kind::map(Kind::string(), Kind::integer()));
    }

    SECTION("heterogeneous string-keyed mappings are structs") {
        auto kind = dsl::reflect(Value(Map{{{Value("a"), Value(1)}, {Value("b"), Value("x")}}}));
        REQUIRE(kind->id() == KindId::Struct);
        REQUIRE(kind->elements()[1].kind == Kind::string());
    }

    SECTION("empty containers are rejected") {
        REQUIRE_THROWS_AS(dsl::reflect(Value(Array{})), GrammarError);
        REQUIRE_THROWS_AS(dsl::reflect(Value(Map{})), GrammarError);
    }
}

TEST_CASE("cast converts native values", "[dsl][kind]") {
    REQUIRE(Kind::integer()->cast(Value("42")).get<std::int64_t>() == 42);
    REQUIRE(Kind::integer()->cast(Value(3.9)).get<std::int64_t>() == 3);
    REQUIRE(Kind::floating()->cast(Value(2)).get<double>() == 2.0);
    REQUIRE(Kind::boolean()->cast(Value("TRUE")).get<bool>());
    REQUIRE(Kind::string()->cast(Value(make_date(2020, 2, 29))).get<std::string>() == "2020-02-29");
    REQUIRE(Kind::date()->cast(Value("2020-02-29")).get<Date>() == make_date(2020, 2, 29));
    REQUIRE(Kind::timestamp()->cast(Value(make_date(2020, 2, 29))).get<Timestamp>() ==
            make_timestamp(2020, 2, 29));

    SECTION("failures raise CastError") {
        REQUIRE_THROWS_AS(Kind::integer()->cast(Value("abc")), CastError);
        REQUIRE_THROWS_AS(Kind::date()->cast(Value(1.5)), CastError);
        REQUIRE_THROWS_AS(Kind::boolean()->cast(Value("maybe")), CastError);
    }

    SECTION("compound targets are unsupported") {
        REQUIRE_THROWS_AS(Kind::array(Kind::integer())->cast(Value(1)), UnsupportedError);
    }
}
