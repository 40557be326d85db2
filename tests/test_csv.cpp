#include "fixtures.hpp"

#include <oryx/runtime/closure.hpp>
#include <oryx/runtime/csv.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using namespace oryx;
using namespace oryx::runtime;

namespace {

void write_csv(const std::filesystem::path& path, const char* content) {
    std::ofstream out(path);
    out << content;
}

auto tmp(const char* name) -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / name;
}

auto is_null_at(const Table& table, const char* name, std::size_t row) -> bool {
    const auto* entry = table.find(name);
    REQUIRE(entry != nullptr);
    return is_null(*entry, row);
}

}  // namespace

TEST_CASE("Null specs", "[runtime][csv]") {
    auto options = parse_null_spec("<empty>, NA,null");
    REQUIRE(options.null_if_empty);
    REQUIRE(options.null_tokens.size() == 2);
    REQUIRE(options.null_tokens.contains("NA"));
    REQUIRE(options.null_tokens.contains("null"));

    REQUIRE_FALSE(parse_null_spec("").null_if_empty);
    REQUIRE(parse_null_spec(",,").null_tokens.empty());
}

TEST_CASE("Read CSV with inferred columns", "[runtime][csv]") {
    auto path = tmp("oryx_test_inferred.csv");
    write_csv(path, "price,qty,symbol\n1.5,10,A\n2.25,20,B\n0.5,5,A\n");

    auto table = read_csv(path.string());
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 3);

    const auto* price = std::get_if<Column<double>>(table->find("price")->column.get());
    REQUIRE(price != nullptr);
    REQUIRE((*price)[1] == Catch::Approx(2.25));

    const auto* qty = std::get_if<Column<std::int64_t>>(table->find("qty")->column.get());
    REQUIRE(qty != nullptr);
    REQUIRE((*qty)[2] == 5);

    const auto* symbol = std::get_if<Column<std::string>>(table->find("symbol")->column.get());
    REQUIRE(symbol != nullptr);
    REQUIRE((*symbol)[0] == "A");
    REQUIRE(table->find("symbol")->qualifier.empty());
}

TEST_CASE("Read CSV with null cells", "[runtime][csv]") {
    auto path = tmp("oryx_test_nulls.csv");
    write_csv(path, "id,label\n1,x\nNA,\n3,z\n");

    SECTION("without a null spec cells stay text") {
        auto table = read_csv(path.string());
        REQUIRE(table.has_value());
        REQUIRE(std::holds_alternative<Column<std::string>>(*table->find("id")->column));
        REQUIRE_FALSE(is_null_at(*table, "label", 1));
    }

    SECTION("null tokens are excluded from inference") {
        auto table = read_csv(path.string(), parse_null_spec("<empty>,NA"));
        REQUIRE(table.has_value());
        REQUIRE(std::holds_alternative<Column<std::int64_t>>(*table->find("id")->column));
        REQUIRE(is_null_at(*table, "id", 1));
        REQUIRE(is_null_at(*table, "label", 1));
        REQUIRE_FALSE(is_null_at(*table, "label", 2));
    }
}

TEST_CASE("Read CSV against a schema", "[runtime][csv]") {
    auto path = tmp("oryx_test_school.csv");

    SECTION("cells are cast to the field kinds and extra columns ignored") {
        write_csv(path, "name,id,extra\nnorth,1,x\nsouth,2,y\n");
        auto table = read_csv(path.string(), *testing::school_schema());
        REQUIRE(table.has_value());
        REQUIRE(table->columns.size() == 2);
        REQUIRE(table->columns[0].name == "id");
        REQUIRE(table->at(0, 1) == Datum{ScalarValue{std::int64_t{2}}});
        REQUIRE(table->find("extra") == nullptr);
    }

    SECTION("fields are read by their field name") {
        auto student = tmp("oryx_test_student.csv");
        write_csv(student,
                  "surname,birthday,class,score,school\n"
                  "smith,2001-01-01,1,1.5,1\n");
        auto table = read_csv(student.string(), *testing::student_schema());
        REQUIRE(table.has_value());
        REQUIRE(std::holds_alternative<Column<Date>>(*table->find("birthday")->column));
        REQUIRE(table->find("class") != nullptr);
    }

    SECTION("missing columns are reported") {
        write_csv(path, "id\n1\n");
        auto table = read_csv(path.string(), *testing::school_schema());
        REQUIRE_FALSE(table.has_value());
        REQUIRE_THAT(table.error(), Catch::Matchers::EndsWith("missing column name"));
    }

    SECTION("uncastable cells are reported") {
        write_csv(path, "id,name\none,north\n");
        auto table = read_csv(path.string(), *testing::school_schema());
        REQUIRE_FALSE(table.has_value());
        REQUIRE_THAT(table.error(), Catch::Matchers::StartsWith(path.string()));
    }

    SECTION("unreadable files are reported") {
        auto table = read_csv(tmp("oryx_test_does_not_exist.csv").string());
        REQUIRE_FALSE(table.has_value());
    }
}

TEST_CASE("CSV tables feed the closure backend", "[runtime][csv]") {
    auto student_path = tmp("oryx_test_join_student.csv");
    auto school_path = tmp("oryx_test_join_school.csv");
    write_csv(student_path,
              "surname,birthday,class,score,school\n"
              "smith,2001-01-01,1,1.5,1\n"
              "smith,2001-02-02,2,1.0,2\n"
              "jones,2002-03-03,1,2.5,1\n");
    write_csv(school_path, "id,name\n1,north\n2,south\n");

    auto student = read_csv(student_path.string(), *testing::student_schema());
    auto school = read_csv(school_path.string(), *testing::school_schema());
    REQUIRE(student.has_value());
    REQUIRE(school.has_value());

    Catalog catalog{{"student", *student}, {"school", *school}};
    auto result =
        execute(testing::canonical_query(testing::student(), testing::school()), catalog);
    REQUIRE(result.has_value());
    REQUIRE(result->rows() == 1);
    REQUIRE(result->at(0, 0) == Datum{ScalarValue{std::string("smith")}});
    REQUIRE(result->at(1, 0) == Datum{ScalarValue{std::int64_t{2}}});
}
