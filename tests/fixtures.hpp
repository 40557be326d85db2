#pragma once

#include <oryx/dsl/feature.hpp>
#include <oryx/dsl/kind.hpp>
#include <oryx/dsl/schema.hpp>
#include <oryx/dsl/source.hpp>

namespace oryx::testing {

inline auto student_schema() -> dsl::SchemaPtr {
    using dsl::Kind;
    return dsl::SchemaBuilder("student")
        .field("surname", Kind::string())
        .field("dob", Kind::date(), "birthday")
        .field("level", Kind::integer(), "class")
        .field("score", Kind::floating())
        .field("school", Kind::integer())
        .build();
}

inline auto school_schema() -> dsl::SchemaPtr {
    using dsl::Kind;
    return dsl::SchemaBuilder("school")
        .field("id", Kind::integer())
        .field("name", Kind::string())
        .build();
}

inline auto person_schema() -> dsl::SchemaPtr {
    using dsl::Kind;
    return dsl::SchemaBuilder("person")
        .field("id", Kind::integer())
        .field("name", Kind::string())
        .field("manager", Kind::integer())
        .build();
}

inline auto student() -> dsl::TablePtr { return dsl::Table::make(student_schema()); }
inline auto school() -> dsl::TablePtr { return dsl::Table::make(school_schema()); }
inline auto person() -> dsl::TablePtr { return dsl::Table::make(person_schema()); }

/// Surnames of students scoring below 2 seen at more than one school.
inline auto canonical_query(const dsl::TablePtr& student, const dsl::TablePtr& school)
    -> dsl::SourcePtr {
    using namespace dsl;
    return student->inner_join(school, eq(school->at("id"), student->at("school")))
        ->select({alias(student->at("surname"), "student"), alias(count(school->at("name")), "num")})
        ->where(lt(student->at("score"), 2))
        ->groupby({student->at("surname")})
        ->having(gt(count(school->at("name")), 1))
        ->orderby({student->at("class"), student->at("score"), "descending"})
        ->limit(10);
}

}  // namespace oryx::testing
