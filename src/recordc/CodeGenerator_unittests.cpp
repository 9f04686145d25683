#include "recordc/CodeGenerator.hpp"

#include "recordc/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

recordc::ResolvedSchema personSchema() {
    recordc::ResolvedSchema schema;
    schema.name = "Person";
    schema.fields.emplace_back(recordc::Field{"name", recordc::FieldKind::kString});
    schema.fields.emplace_back(recordc::Field{"age", recordc::FieldKind::kInteger});
    schema.fields.emplace_back(recordc::Field{"is_student", recordc::FieldKind::kBoolean});
    return schema;
}

} // namespace

namespace recordc {

TEST_CASE("CodeGenerator generate") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    CodeGenerator generator(errorReporter);

    SUBCASE("header content") {
        auto code = generator.generate(personSchema());
        REQUIRE(code);
        CHECK(errorReporter->ok());

        auto marker = CodeGenerator::headerEndMarker("Person");
        CHECK_EQ(marker, "#endif // Person_H\n");
        auto split = code->find(marker);
        REQUIRE(split != std::string::npos);
        auto header = code->substr(0, split + marker.size());

        CHECK(header.find("#ifndef Person_H") != std::string::npos);
        CHECK(header.find("#define Person_H") != std::string::npos);
        CHECK(header.find("typedef struct {") != std::string::npos);
        CHECK(header.find("char* name;") != std::string::npos);
        CHECK(header.find("int64_t age;") != std::string::npos);
        CHECK(header.find("bool is_student;") != std::string::npos);
        CHECK(header.find("} Person;") != std::string::npos);
        CHECK(header.find("int parse_Person(const char* rc_input, Person* rc_out);") != std::string::npos);

        // Members appear in declaration order.
        CHECK_LT(header.find("char* name;"), header.find("int64_t age;"));
        CHECK_LT(header.find("int64_t age;"), header.find("bool is_student;"));
    }

    SUBCASE("implementation content") {
        auto code = generator.generate(personSchema());
        REQUIRE(code);
        auto implementation = code->substr(code->find(CodeGenerator::headerEndMarker("Person")));

        CHECK(implementation.find("#include \"Person.h\"") != std::string::npos);
        CHECK(implementation.find("int parse_Person(const char* rc_input, Person* rc_out)") != std::string::npos);
        CHECK(implementation.find("void release_Person(Person* rc_out)") != std::string::npos);
        CHECK(implementation.find("char* parse_and_serialize(const char* rc_input)") != std::string::npos);
        CHECK(implementation.find("void free_serialized(char* rc_str)") != std::string::npos);
        CHECK(implementation.find("strcmp(rc_key, \"name\")") != std::string::npos);
        CHECK(implementation.find("strcmp(rc_key, \"age\")") != std::string::npos);
        CHECK(implementation.find("strcmp(rc_key, \"is_student\")") != std::string::npos);
        CHECK(implementation.find("\"SUCCESS\"") != std::string::npos);
        CHECK(implementation.find("memset(rc_out, 0, sizeof(*rc_out));") != std::string::npos);

        // Serializers follow declaration order.
        auto nameSerializer = implementation.find("rc_record.name != NULL");
        auto ageSerializer = implementation.find("rc_record.age);");
        auto boolSerializer = implementation.find("rc_record.is_student ?");
        REQUIRE(nameSerializer != std::string::npos);
        REQUIRE(ageSerializer != std::string::npos);
        REQUIRE(boolSerializer != std::string::npos);
        CHECK_LT(nameSerializer, ageSerializer);
        CHECK_LT(ageSerializer, boolSerializer);
    }

    SUBCASE("keyword field names") {
        ResolvedSchema schema;
        schema.name = "Keywords";
        schema.fields.emplace_back(Field{"int", FieldKind::kInteger});
        schema.fields.emplace_back(Field{"default", FieldKind::kString});
        auto code = generator.generate(schema);
        REQUIRE(code);
        CHECK(code->find("int64_t int_;") != std::string::npos);
        CHECK(code->find("char* default_;") != std::string::npos);
        // The JSON key is unchanged.
        CHECK(code->find("strcmp(rc_key, \"int\")") != std::string::npos);
        CHECK(code->find("strcmp(rc_key, \"default\")") != std::string::npos);
    }

    SUBCASE("record named after a local of the generated functions") {
        ResolvedSchema schema;
        schema.name = "out";
        schema.fields.emplace_back(Field{"a", FieldKind::kString});
        auto code = generator.generate(schema);
        REQUIRE(code);
        CHECK(code->find("int parse_out(const char* rc_input, out* rc_out)") != std::string::npos);
        CHECK(code->find("memset(rc_out, 0, sizeof(*rc_out));") != std::string::npos);
        CHECK(code->find("    out rc_record;") != std::string::npos);
        CHECK(code->find("sizeof(out)") == std::string::npos);
    }

    SUBCASE("renamed members do not collide") {
        ResolvedSchema schema;
        schema.name = "Rec";
        schema.fields.emplace_back(Field{"int", FieldKind::kInteger});
        schema.fields.emplace_back(Field{"int_", FieldKind::kInteger});
        schema.fields.emplace_back(Field{"EXIT_FAILURE", FieldKind::kBoolean});
        auto code = generator.generate(schema);
        REQUIRE(code);
        CHECK(code->find("int64_t int__;") != std::string::npos);
        CHECK(code->find("int64_t int_;") != std::string::npos);
        CHECK(code->find("bool EXIT_FAILURE_;") != std::string::npos);
        CHECK(code->find("rc_ptr = rc_parse_integer(rc_ptr, &rc_out->int__);") != std::string::npos);
        CHECK(code->find("rc_ptr = rc_parse_integer(rc_ptr, &rc_out->int_);") != std::string::npos);
    }

    SUBCASE("refuses reserved record names") {
        ResolvedSchema schema;
        schema.name = "int";
        schema.fields.emplace_back(Field{"a", FieldKind::kString});
        CHECK_FALSE(generator.generate(schema));
        CHECK_EQ(errorReporter->lastError().code, Error::kInvalidName);
    }

    SUBCASE("refuses invalid schemas") {
        ResolvedSchema schema;
        schema.name = "Bad Name";
        schema.fields.emplace_back(Field{"a", FieldKind::kString});
        CHECK_FALSE(generator.generate(schema));
        CHECK_EQ(errorReporter->lastError().code, Error::kInvalidName);
    }
}

TEST_CASE("CodeGenerator generateDriver") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    CodeGenerator generator(errorReporter);

    SUBCASE("process driver") {
        auto driver = generator.generateDriver(personSchema(), CodeGenerator::kProcessDriver);
        REQUIRE(driver);
        CHECK(driver->find("#include \"Person.h\"") != std::string::npos);
        CHECK(driver->find("rc_argc != 2") != std::string::npos);
        CHECK(driver->find("ERROR|Failed to parse JSON") != std::string::npos);
    }

    SUBCASE("worker driver") {
        auto driver = generator.generateDriver(personSchema(), CodeGenerator::kWorkerDriver);
        REQUIRE(driver);
        CHECK(driver->find("#include \"Person.h\"") != std::string::npos);
        CHECK(driver->find("rc_write_frame") != std::string::npos);
        CHECK(driver->find("ERROR|Failed to parse JSON") != std::string::npos);
    }
}

TEST_CASE("CodeGenerator names") {
    CHECK_EQ(CodeGenerator::headerFileName("Person"), "Person.h");
    CHECK_EQ(CodeGenerator::implementationFileName("Person"), "Person.c");
}

TEST_CASE("CodeGenerator memberNames") {
    auto membersFor = [](std::vector<std::string> fieldNames) {
        ResolvedSchema schema;
        schema.name = "Rec";
        for (auto& name : fieldNames) {
            schema.fields.emplace_back(Field{std::move(name), FieldKind::kString});
        }
        return CodeGenerator::memberNames(schema);
    };

    SUBCASE("plain names are kept") {
        auto members = membersFor({"name", "age"});
        REQUIRE_EQ(members.size(), 2);
        CHECK_EQ(members[0], "name");
        CHECK_EQ(members[1], "age");
    }

    SUBCASE("keywords and macros get a trailing underscore") {
        auto members = membersFor({"struct", "NULL", "EXIT_FAILURE", "stdout", "bool"});
        REQUIRE_EQ(members.size(), 5);
        CHECK_EQ(members[0], "struct_");
        CHECK_EQ(members[1], "NULL_");
        CHECK_EQ(members[2], "EXIT_FAILURE_");
        CHECK_EQ(members[3], "stdout_");
        CHECK_EQ(members[4], "bool_");
    }

    SUBCASE("renamed field skips names taken by other fields") {
        auto members = membersFor({"int", "int_", "int__"});
        REQUIRE_EQ(members.size(), 3);
        CHECK_EQ(members[0], "int___");
        CHECK_EQ(members[1], "int_");
        CHECK_EQ(members[2], "int__");
    }

    SUBCASE("renamed field declared after the field it would collide with") {
        auto members = membersFor({"default_", "default"});
        REQUIRE_EQ(members.size(), 2);
        CHECK_EQ(members[0], "default_");
        CHECK_EQ(members[1], "default__");
    }

    SUBCASE("names a trailing underscore cannot fix") {
        auto members = membersFor({"INT64_MAX", "__count", "_Value"});
        REQUIRE_EQ(members.size(), 3);
        CHECK_EQ(members[0], "f_INT64_MAX");
        CHECK_EQ(members[1], "f___count");
        CHECK_EQ(members[2], "f__Value");
    }

    SUBCASE("header guard") {
        auto members = membersFor({"Rec_H"});
        REQUIRE_EQ(members.size(), 1);
        CHECK_EQ(members[0], "Rec_H_");
    }
}

} // namespace recordc
