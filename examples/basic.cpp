#include <oryx/oryx.hpp>

#include <fmt/core.h>

auto main() -> int {
    using namespace oryx::dsl;

    auto person = Table::make(SchemaBuilder("person")
                                  .field("id", Kind::integer())
                                  .field("name", Kind::string())
                                  .field("manager", Kind::integer())
                                  .build());

    // Self-join: each reference is a distinct origin over the same table.
    auto employee = person->reference("employee");
    auto boss = person->reference("boss");
    auto statement = employee->left_join(boss, eq(employee->at("manager"), boss->at("id")))
                         ->select({alias(employee->at("name"), "employee"),
                                   alias(boss->at("name"), "boss")})
                         ->orderby({employee->at("name")});

    fmt::print("=== SQL text ===\n");
    if (auto sql = oryx::codegen::sql::compile(statement, {.pretty = true})) {
        fmt::print("{}\n", *sql);
    } else {
        fmt::print("error: {}\n", sql.error().message);
        return 1;
    }

    fmt::print("\n=== SQL tree ===\n");
    if (auto tree = oryx::codegen::tree::compile(statement)) {
        fmt::print("{}\n", oryx::codegen::tree::render(**tree));
    } else {
        fmt::print("error: {}\n", tree.error().message);
        return 1;
    }

    fmt::print("\n=== Closure ===\n");
    oryx::runtime::Table people;
    people.add_column("id", oryx::runtime::Column<std::int64_t>{1, 2, 3});
    people.add_column("name", oryx::runtime::Column<std::string>{"ada", "bob", "cy"});
    people.add_column("manager", oryx::runtime::Column<std::int64_t>{0, 1, 1}, {false, true, true});
    auto result = oryx::runtime::execute(statement, {{"person", people}});
    if (!result) {
        fmt::print("error: {}\n", result.error().message);
        return 1;
    }
    fmt::print("{}", oryx::runtime::to_string(*result));
    return 0;
}
