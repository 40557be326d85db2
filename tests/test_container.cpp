#include "fixtures.hpp"

#include <oryx/core/error.hpp>
#include <oryx/parser/container.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace oryx;
using namespace oryx::dsl;

namespace {

/// Container with its symbol stack opened up.
class Probe : public parser::Container<std::string, int> {
   public:
    using Container::pop_feature;
    using Container::pop_source;
    using Container::push_feature;
    using Container::push_source;
};

}  // namespace

TEST_CASE("Symbols stack", "[parser][container]") {
    parser::Symbols<int> symbols;
    REQUIRE_FALSE(symbols.dirty());
    symbols.push(1);
    symbols.push(2);
    REQUIRE(symbols.size() == 2);
    REQUIRE(symbols.pop() == 2);
    REQUIRE(symbols.pop() == 1);
    REQUIRE_THROWS_AS(symbols.pop(), StateError);
}

TEST_CASE("Container contexts", "[parser][container]") {
    Probe probe;

    SECTION("no context outside of a scope") {
        REQUIRE_THROWS_AS(probe.context(), StateError);
    }

    SECTION("fetch returns the single pending symbol") {
        probe.enter();
        probe.push_source("student");
        auto symbol = probe.fetch();
        REQUIRE(std::get<std::string>(symbol) == "student");
        REQUIRE_THROWS_AS(probe.context(), StateError);
    }

    SECTION("fetch with several pending symbols is premature") {
        probe.enter();
        probe.push_source("student");
        probe.push_feature(1);
        REQUIRE_THROWS_WITH(probe.fetch(), "Premature fetch");
    }

    SECTION("fetch without symbols fails") {
        probe.enter();
        REQUIRE_THROWS_WITH(probe.fetch(), "Empty context");
    }

    SECTION("leaving a dirty context fails") {
        parser::Container<std::string, int>::Scope scope(probe);
        probe.push_feature(1);
        REQUIRE_THROWS_WITH(scope.close(), "Context not fetched");
    }

    SECTION("symbols are typed") {
        probe.enter();
        probe.push_feature(1);
        REQUIRE_THROWS_AS(probe.pop_source(), StateError);
    }

    SECTION("scopes restore the outer context") {
        probe.enter();
        probe.push_source("outer");
        {
            parser::Container<std::string, int>::Scope scope(probe);
            probe.push_feature(7);
            REQUIRE(probe.pop_feature() == 7);
            scope.close();
        }
        REQUIRE(probe.pop_source() == "outer");
    }

    SECTION("a scope that failed to close still restores the outer context") {
        probe.enter();
        probe.push_source("outer");
        {
            parser::Container<std::string, int>::Scope scope(probe);
            probe.push_feature(7);
            REQUIRE_THROWS_WITH(scope.close(), "Context not fetched");
        }
        REQUIRE(probe.pop_source() == "outer");
    }

    SECTION("an abandoned scope restores the outer context") {
        probe.enter();
        probe.push_source("outer");
        try {
            parser::Container<std::string, int>::Scope scope(probe);
            probe.push_feature(7);
            throw GrammarError("boom");
        } catch (const GrammarError&) {
        }
        REQUIRE(probe.pop_source() == "outer");
    }
}

TEST_CASE("Origins are visible from nested contexts", "[parser][container]") {
    Probe probe;
    auto student = testing::student();
    probe.enter();
    probe.context().origins.insert_or_assign(student, "s");
    probe.enter();
    const auto* origin = probe.find_origin(student);
    REQUIRE(origin != nullptr);
    REQUIRE(*origin == "s");
    REQUIRE(probe.find_origin(testing::school()) == nullptr);
}

TEST_CASE("Tables collect fields and factors", "[parser][container]") {
    auto student = testing::student();
    auto school = testing::school();
    parser::Tables tables;

    tables.select({alias(student->at("surname"), "name"), sum(student->at("score"))});
    tables.filter(and_(lt(student->at("score"), 2), eq(school->at("name"), "north")));
    tables.filter(eq(school->at("id"), student->at("school")));
    tables.filter(gt(student->at("class"), 1));

    REQUIRE(tables.size() == 2);

    const auto* segment = tables.find(student);
    REQUIRE(segment != nullptr);
    auto fields = segment->sorted_fields();
    REQUIRE(fields.size() == 4);
    REQUIRE(fields.front()->repr() == "student.class");
    REQUIRE(fields.back()->repr() == "student.surname");

    auto predicate = segment->predicate();
    REQUIRE(predicate != nullptr);
    REQUIRE(predicate->repr() == "student.class > 1 OR student.score < 2");

    const auto* other = tables.find(school);
    REQUIRE(other != nullptr);
    REQUIRE(other->fields.size() == 2);
    REQUIRE(other->predicate()->repr() == "school.name == 'north'");

    REQUIRE(tables.find(testing::person()) == nullptr);
}
