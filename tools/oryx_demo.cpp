#include <oryx/oryx.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace {

using namespace oryx::dsl;

struct Sample {
    TablePtr student;
    TablePtr school;
    SourcePtr statement;
};

/// Surnames of students with a low score enrolled in more than one school.
auto sample() -> Sample {
    auto student = Table::make(SchemaBuilder("student")
                                   .field("surname", Kind::string())
                                   .field("birthday", Kind::date())
                                   .field("class", Kind::integer())
                                   .field("score", Kind::floating())
                                   .field("school", Kind::integer())
                                   .build());
    auto school = Table::make(SchemaBuilder("school")
                                  .field("id", Kind::integer())
                                  .field("name", Kind::string())
                                  .build());
    auto statement = student->inner_join(school, eq(school->at("id"), student->at("school")))
                         ->select({alias(student->at("surname"), "student"),
                                   alias(count(school->at("name")), "num")})
                         ->where(lt(student->at("score"), 2))
                         ->groupby({student->at("surname")})
                         ->having(gt(count(school->at("name")), 1))
                         ->orderby({student->at("class"), student->at("score"), "desc"})
                         ->limit(10);
    return {student, school, statement};
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"oryx demo: compile a sample student/school query"};
    app.set_version_flag("--version", "oryx_demo 0.1.0");

    bool verbose = false;
    bool sql = false;
    bool tree = false;
    bool pretty = false;
    std::string student_path;
    std::string school_path;
    std::string nulls;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    auto* sql_flag = app.add_flag("--sql", sql, "Print the query as SQL text");
    auto* tree_flag = app.add_flag("--tree", tree, "Print the rendering of the SQL tree");
    app.add_flag("--pretty", pretty, "One SQL clause per line")->needs(sql_flag);
    auto* student_opt =
        app.add_option("--student", student_path, "CSV file of students")->check(CLI::ExistingFile);
    auto* school_opt =
        app.add_option("--school", school_path, "CSV file of schools")->check(CLI::ExistingFile);
    app.add_option("--nulls", nulls, "Null spec of the CSV files, e.g. \"<empty>,NA\"");
    student_opt->needs(school_opt);
    school_opt->needs(student_opt);
    sql_flag->excludes(tree_flag)->excludes(student_opt);
    tree_flag->excludes(student_opt);

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    auto [student, school, statement] = sample();
    spdlog::info("Compiling {}", statement->repr());

    if (tree) {
        auto compiled = oryx::codegen::tree::compile(statement);
        if (!compiled) {
            fmt::print(stderr, "oryx_demo: {}\n", compiled.error().message);
            return 1;
        }
        fmt::print("{}\n", oryx::codegen::tree::render(**compiled));
        return 0;
    }

    if (student_path.empty()) {
        auto compiled = oryx::codegen::sql::compile(statement, {.pretty = pretty});
        if (!compiled) {
            fmt::print(stderr, "oryx_demo: {}\n", compiled.error().message);
            return 1;
        }
        fmt::print("{}\n", *compiled);
        return 0;
    }

    auto options = oryx::runtime::parse_null_spec(nulls);
    oryx::runtime::Catalog catalog;
    for (const auto& [table, path] : {std::pair{student, student_path}, std::pair{school, school_path}}) {
        auto loaded = oryx::runtime::read_csv(path, *table->schema(), options);
        if (!loaded) {
            fmt::print(stderr, "oryx_demo: {}\n", loaded.error());
            return 1;
        }
        spdlog::info("Loaded {} rows into {}", loaded->rows(), table->name());
        catalog.insert_or_assign(table->name(), std::move(*loaded));
    }

    auto result = oryx::runtime::execute(statement, catalog);
    if (!result) {
        fmt::print(stderr, "oryx_demo: {}\n", result.error().message);
        return 1;
    }
    fmt::print("{}", oryx::runtime::to_string(*result));
    return 0;
}
