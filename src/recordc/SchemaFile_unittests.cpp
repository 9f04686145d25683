#include "recordc/SchemaFile.hpp"

#include "recordc/ErrorReporter.hpp"
#include "recordc/Validator.hpp"

#include "doctest/doctest.h"

#include <string>
#include <system_error>

namespace recordc {

TEST_CASE("SchemaFile parse") {
    ErrorReporter errorReporter(true);

    SUBCASE("valid declaration") {
        auto schema = SchemaFile::parse(R"({"name": "Student", "fields": [{"name": "first_name", "type": "string"},
                {"name": "age", "type": "integer"}, {"name": "is_enrolled", "type": "bool"}]})", &errorReporter);
        REQUIRE(schema);
        CHECK(errorReporter.ok());
        CHECK_EQ(schema->name, "Student");
        REQUIRE_EQ(schema->fields.size(), 3);
        CHECK_EQ(schema->fields[0].name, "first_name");
        CHECK_EQ(schema->fields[0].type, "string");
        CHECK_EQ(schema->fields[2].name, "is_enrolled");
        CHECK_EQ(schema->fields[2].type, "bool");
        CHECK(Validator::validate(*schema, &errorReporter));
    }

    SUBCASE("missing type is left empty for validation") {
        auto schema = SchemaFile::parse(R"({"name": "Student", "fields": [{"name": "first_name"}]})", &errorReporter);
        REQUIRE(schema);
        CHECK_EQ(schema->fields[0].type, "");
        CHECK_FALSE(Validator::validate(*schema, &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kEmptyType);
    }

    SUBCASE("non-string type is left empty for validation") {
        auto schema = SchemaFile::parse(R"({"name": "Student", "fields": [{"name": "age", "type": 5}]})",
                &errorReporter);
        REQUIRE(schema);
        CHECK_EQ(schema->fields[0].type, "");
    }

    SUBCASE("unsupported type passes through") {
        auto schema = SchemaFile::parse(R"({"name": "Student", "fields": [{"name": "gpa", "type": "float"}]})",
                &errorReporter);
        REQUIRE(schema);
        CHECK_FALSE(Validator::validate(*schema, &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kUnsupportedType);
    }

    SUBCASE("missing fields") {
        auto schema = SchemaFile::parse(R"({"name": "Student"})", &errorReporter);
        REQUIRE(schema);
        CHECK(schema->fields.empty());
        CHECK_FALSE(Validator::validate(*schema, &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kNoFields);
    }

    SUBCASE("structural errors") {
        CHECK_FALSE(SchemaFile::parse("{\"name\": ", &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kSchemaFileInvalid);
        CHECK_FALSE(SchemaFile::parse("[]", &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kSchemaFileInvalid);
        CHECK_FALSE(SchemaFile::parse(R"({"name": 3, "fields": []})", &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kSchemaFileInvalid);
        CHECK_FALSE(SchemaFile::parse(R"({"name": "A", "fields": {}})", &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kSchemaFileInvalid);
        CHECK_FALSE(SchemaFile::parse(R"({"name": "A", "fields": ["a"]})", &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kSchemaFileInvalid);
        CHECK_FALSE(SchemaFile::parse(R"({"name": "A", "fields": [{"name": 1}]})", &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kSchemaFileInvalid);
        CHECK_EQ(errorReporter.lastError().family(), Error::kSchema);
    }
}

TEST_CASE("SchemaFile load") {
    ErrorReporter errorReporter(true);
    std::string reason;
    auto base = makeUniqueDirectory(defaultWorkspaceBase(), "recordc-schemafile-test-", reason);
    REQUIRE(!base.empty());

    SUBCASE("from file") {
        auto path = base / "person.json";
        REQUIRE(writeFile(path, R"({"name": "Person", "fields": [{"name": "name", "type": "char*"}]})"));
        auto schema = SchemaFile::load(path, &errorReporter);
        REQUIRE(schema);
        CHECK_EQ(schema->name, "Person");
        REQUIRE_EQ(schema->fields.size(), 1);
        CHECK_EQ(schema->fields[0].type, "char*");
    }

    SUBCASE("missing file") {
        CHECK_FALSE(SchemaFile::load(base / "missing.json", &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kSchemaFileInvalid);
    }

    std::error_code ec;
    fs::remove_all(base, ec);
}

} // namespace recordc
