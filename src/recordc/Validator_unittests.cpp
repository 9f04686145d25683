#include "recordc/Validator.hpp"

#include "recordc/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <string>
#include <utility>
#include <vector>

namespace {

recordc::RecordSchema makeSchema(std::string name, std::vector<recordc::FieldSpec> fields) {
    recordc::RecordSchema schema;
    schema.name = std::move(name);
    schema.fields = std::move(fields);
    return schema;
}

} // namespace

namespace recordc {

TEST_CASE("Validator accepts valid schemas") {
    ErrorReporter errorReporter(true);

    SUBCASE("mixed types") {
        auto schema = makeSchema("Person", {{"name", "string"}, {"age", "integer"}, {"is_student", "boolean"}});
        CHECK(Validator::validate(schema, &errorReporter));
        CHECK(errorReporter.ok());
    }

    SUBCASE("type aliases and underscores") {
        auto schema = makeSchema("_student2", {{"_first_name", "char*"}, {"age", "int"}, {"id", "int64_t"},
                {"enrolled", "bool"}});
        CHECK(Validator::validate(schema, &errorReporter));
        CHECK(errorReporter.ok());
    }

    SUBCASE("record names that match names inside generated functions") {
        for (auto name : {"out", "ptr", "input", "key", "result", "document", "number", "serialized"}) {
            CHECK(Validator::validate(makeSchema(name, {{"a", "string"}}), &errorReporter));
        }
        CHECK(errorReporter.ok());
    }

    SUBCASE("field names that are C keywords or macros") {
        auto schema = makeSchema("Rec", {{"int", "integer"}, {"int_", "integer"}, {"EXIT_FAILURE", "boolean"}});
        CHECK(Validator::validate(schema, &errorReporter));
        CHECK(errorReporter.ok());
    }
}

TEST_CASE("Validator rejects invalid schemas") {
    ErrorReporter errorReporter(true);

    SUBCASE("empty name") {
        CHECK_FALSE(Validator::validate(makeSchema("", {{"a", "string"}}), &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kEmptyName);
        CHECK_EQ(errorReporter.lastError().message, "empty record name");
    }

    SUBCASE("invalid name") {
        CHECK_FALSE(Validator::validate(makeSchema("1Person", {{"a", "string"}}), &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kInvalidName);
        CHECK_EQ(errorReporter.lastError().message, "invalid record name: 1Person (must be a valid C identifier)");

        CHECK_FALSE(Validator::validate(makeSchema("Per-son", {{"a", "string"}}), &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kInvalidName);
    }

    SUBCASE("reserved name") {
        CHECK_FALSE(Validator::validate(makeSchema("int", {{"a", "string"}}), &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kInvalidName);
        CHECK_EQ(errorReporter.lastError().message, "invalid record name: int (reserved in generated C code)");

        for (auto name : {"struct", "bool", "true", "NULL", "EXIT_FAILURE", "INT64_MAX", "PRId64", "stdin", "free",
                "malloc", "strlen", "FILE", "size_t", "main", "parse_and_serialize", "free_serialized",
                "and_serialize", "rc_buffer", "rc_parse_string", "_Bool", "__record"}) {
            CAPTURE(name);
            CHECK_FALSE(Validator::validate(makeSchema(name, {{"a", "string"}}), &errorReporter));
            CHECK_EQ(errorReporter.lastError().code, Error::kInvalidName);
        }
    }

    SUBCASE("no fields") {
        CHECK_FALSE(Validator::validate(makeSchema("Empty", {}), &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kNoFields);
        CHECK_EQ(errorReporter.lastError().message, "record Empty has no fields");
    }

    SUBCASE("empty field name") {
        CHECK_FALSE(Validator::validate(makeSchema("Person", {{"", "string"}}), &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kEmptyFieldName);
    }

    SUBCASE("invalid field name") {
        CHECK_FALSE(Validator::validate(makeSchema("Person", {{"first name", "string"}}), &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kInvalidFieldName);
        CHECK_EQ(errorReporter.lastError().message, "invalid field name: first name (must be a valid C identifier)");
    }

    SUBCASE("duplicate field name") {
        CHECK_FALSE(Validator::validate(makeSchema("Person", {{"a", "string"}, {"a", "integer"}}), &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kDuplicateFieldName);
        CHECK_EQ(errorReporter.lastError().message, "duplicate field name: a");
    }

    SUBCASE("empty type") {
        CHECK_FALSE(Validator::validate(makeSchema("Person", {{"a", ""}}), &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kEmptyType);
        CHECK_EQ(errorReporter.lastError().message, "empty type for field: a");
    }

    SUBCASE("unsupported type") {
        CHECK_FALSE(Validator::validate(makeSchema("Person", {{"height", "float"}}), &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kUnsupportedType);
        CHECK_EQ(errorReporter.lastError().message, "unsupported type: float for field: height");
    }

    CHECK_FALSE(errorReporter.ok());
}

TEST_CASE("Validator reports only the first violation") {
    ErrorReporter errorReporter(true);

    SUBCASE("record rules before field rules") {
        CHECK_FALSE(Validator::validate(makeSchema("", {}), &errorReporter));
        CHECK_EQ(errorReporter.errorCount(), 1);
        CHECK_EQ(errorReporter.lastError().code, Error::kEmptyName);
    }

    SUBCASE("field name before field type") {
        CHECK_FALSE(Validator::validate(makeSchema("Person", {{"", "float"}}), &errorReporter));
        CHECK_EQ(errorReporter.errorCount(), 1);
        CHECK_EQ(errorReporter.lastError().code, Error::kEmptyFieldName);
    }

    SUBCASE("duplicate before type of the duplicate") {
        CHECK_FALSE(Validator::validate(makeSchema("Person", {{"a", "string"}, {"a", "float"}}), &errorReporter));
        CHECK_EQ(errorReporter.errorCount(), 1);
        CHECK_EQ(errorReporter.lastError().code, Error::kDuplicateFieldName);
    }

    SUBCASE("fields in declaration order") {
        CHECK_FALSE(Validator::validate(makeSchema("Person", {{"a", "float"}, {"a", "string"}}), &errorReporter));
        CHECK_EQ(errorReporter.errorCount(), 1);
        CHECK_EQ(errorReporter.lastError().code, Error::kUnsupportedType);
    }
}

TEST_CASE("Validator resolve") {
    ErrorReporter errorReporter(true);

    SUBCASE("resolves kinds in order") {
        auto resolved = Validator::resolve(makeSchema("Person", {{"name", "char*"}, {"age", "int"},
                {"is_student", "bool"}}), &errorReporter);
        REQUIRE(resolved);
        CHECK_EQ(resolved->name, "Person");
        REQUIRE_EQ(resolved->fields.size(), 3);
        CHECK_EQ(resolved->fields[0].name, "name");
        CHECK(resolved->fields[0].kind == FieldKind::kString);
        CHECK_EQ(resolved->fields[1].name, "age");
        CHECK(resolved->fields[1].kind == FieldKind::kInteger);
        CHECK_EQ(resolved->fields[2].name, "is_student");
        CHECK(resolved->fields[2].kind == FieldKind::kBoolean);
    }

    SUBCASE("invalid schema") {
        CHECK_FALSE(Validator::resolve(makeSchema("Person", {{"a", "object"}}), &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kUnsupportedType);
    }
}

TEST_CASE("Validator isIdentifier") {
    CHECK(Validator::isIdentifier("a"));
    CHECK(Validator::isIdentifier("_"));
    CHECK(Validator::isIdentifier("first_name2"));
    CHECK_FALSE(Validator::isIdentifier(""));
    CHECK_FALSE(Validator::isIdentifier("2a"));
    CHECK_FALSE(Validator::isIdentifier("a-b"));
    CHECK_FALSE(Validator::isIdentifier("a b"));
    CHECK_FALSE(Validator::isIdentifier("a\n"));
}

} // namespace recordc
