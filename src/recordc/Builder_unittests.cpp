#include "recordc/Builder.hpp"

#include "recordc/CodeGenerator.hpp"
#include "recordc/CompiledParser.hpp"
#include "recordc/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>
#include <system_error>

namespace {

recordc::RecordSchema personSchema() {
    recordc::RecordSchema schema;
    schema.name = "Person";
    schema.fields.emplace_back(recordc::FieldSpec("name", "char*"));
    schema.fields.emplace_back(recordc::FieldSpec("age", "int"));
    schema.fields.emplace_back(recordc::FieldSpec("is_student", "bool"));
    return schema;
}

bool isEmptyDirectory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec) && fs::directory_iterator(path, ec) == fs::directory_iterator();
}

} // namespace

namespace recordc {

TEST_CASE("Builder defaults") {
    Builder builder(std::make_shared<ErrorReporter>(true));
    CHECK_FALSE(builder.compiler().empty());
    REQUIRE_EQ(builder.compilerFlags().size(), 2);
    CHECK_EQ(builder.compilerFlags()[0], "-std=c99");
    CHECK(builder.strategy() == Builder::Strategy::kProcessPerCall);
    CHECK_EQ(builder.timeout().count(), 0);
    CHECK_FALSE(builder.keepWorkspace());
    CHECK_FALSE(builder.workspaceBase().empty());

    SUBCASE("compiler command is split into words") {
        builder.setCompiler("ccache  cc -m64");
        REQUIRE_EQ(builder.compiler().size(), 3);
        CHECK_EQ(builder.compiler()[0], "ccache");
        CHECK_EQ(builder.compiler()[1], "cc");
        CHECK_EQ(builder.compiler()[2], "-m64");
    }

    SUBCASE("empty compiler command falls back to cc") {
        builder.setCompiler(" ");
        REQUIRE_EQ(builder.compiler().size(), 1);
        CHECK_EQ(builder.compiler()[0], "cc");
    }

    CHECK_EQ(Builder::artifactFileName("Person"), "parser_Person");
    CHECK_EQ(Builder::driverFileName("Person", Builder::Strategy::kProcessPerCall), "main_Person.c");
    CHECK_EQ(Builder::driverFileName("Person", Builder::Strategy::kWorker), "worker_Person.c");
}

TEST_CASE("Builder writeSources") {
    std::string reason;
    auto base = makeUniqueDirectory(defaultWorkspaceBase(), "recordc-builder-test-", reason);
    REQUIRE(!base.empty());
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Builder builder(errorReporter);

    SUBCASE("writes header and implementation") {
        auto outputDir = base / "nested" / "out";
        REQUIRE(builder.writeSources(personSchema(), outputDir));
        CHECK(errorReporter->ok());

        std::string header;
        REQUIRE(readFile(outputDir / "Person.h", header));
        CHECK(header.find("#ifndef Person_H") != std::string::npos);
        CHECK(header.find("char* name;") != std::string::npos);
        CHECK(header.find("int64_t age;") != std::string::npos);
        CHECK(header.find("bool is_student;") != std::string::npos);
        CHECK_EQ(header.substr(header.size() - CodeGenerator::headerEndMarker("Person").size()),
                CodeGenerator::headerEndMarker("Person"));

        std::string implementation;
        REQUIRE(readFile(outputDir / "Person.c", implementation));
        CHECK(implementation.find("#include \"Person.h\"") != std::string::npos);
        CHECK(implementation.find("parse_and_serialize") != std::string::npos);
        CHECK(implementation.find("#ifndef Person_H") == std::string::npos);
    }

    SUBCASE("invalid schema writes nothing") {
        auto schema = personSchema();
        schema.fields.emplace_back(FieldSpec("gpa", "float"));
        auto outputDir = base / "out";
        CHECK_FALSE(builder.writeSources(schema, outputDir));
        CHECK_EQ(errorReporter->lastError().code, Error::kUnsupportedType);
        CHECK_FALSE(fs::exists(outputDir));
    }

    SUBCASE("uncreatable output directory") {
        auto blocker = base / "blocker";
        REQUIRE(writeFile(blocker, "x"));
        CHECK_FALSE(builder.writeSources(personSchema(), blocker / "out"));
        CHECK_EQ(errorReporter->lastError().code, Error::kWorkspaceCreateFailed);
    }

    std::error_code ec;
    fs::remove_all(base, ec);
}

TEST_CASE("Builder build failures") {
    std::string reason;
    auto base = makeUniqueDirectory(defaultWorkspaceBase(), "recordc-builder-test-", reason);
    REQUIRE(!base.empty());
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Builder builder(errorReporter);
    builder.setWorkspaceBase(base);

    SUBCASE("invalid schema") {
        auto schema = personSchema();
        schema.name = "";
        CHECK_FALSE(builder.build(schema));
        CHECK_EQ(errorReporter->errorCount(), 1);
        CHECK_EQ(errorReporter->lastError().code, Error::kEmptyName);
        CHECK(isEmptyDirectory(base));
    }

    SUBCASE("reserved record name") {
        auto schema = personSchema();
        schema.name = "bool";
        CHECK_FALSE(builder.build(schema));
        CHECK_EQ(errorReporter->errorCount(), 1);
        CHECK_EQ(errorReporter->lastError().code, Error::kInvalidName);
        CHECK(isEmptyDirectory(base));
    }

    SUBCASE("missing compiler") {
        builder.setCompiler("/nonexistent/recordc-cc");
        CHECK_FALSE(builder.build(personSchema()));
        CHECK_EQ(errorReporter->lastError().code, Error::kExternalBuildFailed);
        CHECK(isEmptyDirectory(base));
    }

    SUBCASE("compiler reports failure") {
        std::vector<std::string> compiler{"/bin/sh", "-c", "echo 'Person.c:1: error: boom'; exit 1", "cc"};
        builder.setCompiler(compiler);
        CHECK_FALSE(builder.build(personSchema()));
        auto error = errorReporter->lastError();
        CHECK_EQ(error.code, Error::kExternalBuildFailed);
        CHECK_EQ(error.message, "compilation failed with exit status 1");
        CHECK(error.output.find("error: boom") != std::string::npos);
        CHECK(isEmptyDirectory(base));
    }

    SUBCASE("kept workspace remains after failure") {
        builder.setCompiler("/nonexistent/recordc-cc");
        builder.setKeepWorkspace(true);
        CHECK_FALSE(builder.build(personSchema()));
        CHECK_FALSE(isEmptyDirectory(base));
    }

    SUBCASE("uncreatable workspace") {
        auto blocker = base / "blocker";
        REQUIRE(writeFile(blocker, "x"));
        builder.setWorkspaceBase(blocker);
        CHECK_FALSE(builder.build(personSchema()));
        CHECK_EQ(errorReporter->lastError().code, Error::kWorkspaceCreateFailed);
    }

    std::error_code ec;
    fs::remove_all(base, ec);
}

} // namespace recordc
