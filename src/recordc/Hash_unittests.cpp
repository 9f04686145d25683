#include "recordc/Hash.hpp"

#include "recordc/Schema.hpp"

#include "doctest/doctest.h"

#include <string_view>
#include <utility>

namespace recordc {

TEST_CASE("Hash fingerprint") {
    RecordSchema person;
    person.name = "Person";
    person.fields.emplace_back(FieldSpec("name", "string"));
    person.fields.emplace_back(FieldSpec("age", "integer"));

    auto same = person;
    CHECK_EQ(fingerprint(person), fingerprint(same));

    SUBCASE("type change") {
        auto changed = person;
        changed.fields[1].type = "int";
        CHECK_NE(fingerprint(person), fingerprint(changed));
    }

    SUBCASE("order change") {
        auto reordered = person;
        std::swap(reordered.fields[0], reordered.fields[1]);
        CHECK_NE(fingerprint(person), fingerprint(reordered));
    }

    SUBCASE("name change") {
        auto renamed = person;
        renamed.name = "Student";
        CHECK_NE(fingerprint(person), fingerprint(renamed));
    }
}

TEST_CASE("Hash seeds") {
    std::string_view person("Person");
    CHECK_EQ(hash(person), hash(person, 0));
    CHECK_NE(hash(person, 0), hash(person, 1));
    CHECK_EQ(hash(person), hash(person.data(), person.size()));
}

} // namespace recordc
