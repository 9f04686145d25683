#include "recordc/CompiledParser.hpp"

#include "recordc/Builder.hpp"
#include "recordc/ErrorReporter.hpp"
#include "recordc/ProcessParser.hpp"
#include "recordc/WorkerParser.hpp"
#include "recordc/Workspace.hpp"

#include "doctest/doctest.h"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace {

recordc::RecordSchema personSchema() {
    recordc::RecordSchema schema;
    schema.name = "Person";
    schema.fields.emplace_back(recordc::FieldSpec("name", "char*"));
    schema.fields.emplace_back(recordc::FieldSpec("age", "int"));
    schema.fields.emplace_back(recordc::FieldSpec("is_student", "bool"));
    return schema;
}

std::unique_ptr<recordc::CompiledParser> buildPerson(recordc::Builder::Strategy strategy,
        std::shared_ptr<recordc::ErrorReporter> errorReporter) {
    recordc::Builder builder(errorReporter);
    builder.setStrategy(strategy);
    builder.setTimeout(std::chrono::seconds(10));
    return builder.build(personSchema());
}

void checkPerson(recordc::CompiledParser* parser, const std::string& document, const std::string& name,
        const std::string& age, bool isStudent) {
    recordc::ErrorReporter errorReporter(true);
    auto record = parser->parse(document, errorReporter);
    REQUIRE(record);
    CHECK(errorReporter.ok());
    REQUIRE_EQ(record->size(), 3);
    CHECK_EQ(record->at("name").text(), name);
    CHECK_EQ(record->at("age").text(), age);
    CHECK(record->at("age").isInteger());
    CHECK_EQ(record->at("is_student").getBool(), isStudent);
}

void checkRejected(recordc::CompiledParser* parser, const std::string& document) {
    recordc::ErrorReporter errorReporter(true);
    CHECK_FALSE(parser->parse(document, errorReporter));
    REQUIRE_EQ(errorReporter.errorCount(), 1);
    CHECK_EQ(errorReporter.lastError().code, recordc::Error::kParseFailureSentinel);
    CHECK_EQ(errorReporter.lastError().message, "Failed to parse JSON");
}

void checkPersonParsing(recordc::Builder::Strategy strategy) {
    auto errorReporter = std::make_shared<recordc::ErrorReporter>(true);
    auto parser = buildPerson(strategy, errorReporter);
    REQUIRE(parser);
    CHECK(errorReporter->ok());
    CHECK(fs::exists(parser->artifactPath()));
    CHECK_EQ(parser->schema().name, "Person");

    SUBCASE("all fields") {
        checkPerson(parser.get(), R"({"name": "John Doe", "age": 25, "is_student": true})", "John Doe", "25", true);
    }

    SUBCASE("missing fields take defaults") {
        checkPerson(parser.get(), R"({"name": "John Doe"})", "John Doe", "0", false);
        checkPerson(parser.get(), "{}", "", "0", false);
    }

    SUBCASE("extra fields ignored") {
        checkPerson(parser.get(), R"({"name": "John Doe", "age": 25, "is_student": true, "extra": "field"})",
                "John Doe", "25", true);
        checkPerson(parser.get(), R"({"extra": {"a": [1, 2, {"b": "},"}]}, "name": "Jo", "x": -1.5e3, "age": 3})",
                "Jo", "3", false);
    }

    SUBCASE("escaped quotes") {
        checkPerson(parser.get(), R"({"name": "John \"Johnny\" Doe", "age": 25, "is_student": true})",
                "John \"Johnny\" Doe", "25", true);
        checkPerson(parser.get(), R"({"name": "back\\slash"})", "back\\slash", "0", false);
    }

    SUBCASE("other escapes kept verbatim") {
        checkPerson(parser.get(), R"({"name": "a\nb"})", "a\\nb", "0", false);
    }

    SUBCASE("whitespace between members") {
        checkPerson(parser.get(), "{\n\t\"name\": \"John Doe\",\r\n  \"age\" : 25 ,\n  \"is_student\":true\n}",
                "John Doe", "25", true);
    }

    SUBCASE("integer range") {
        checkPerson(parser.get(), R"({"age": -42})", "", "-42", false);
        checkPerson(parser.get(), R"({"age": 9223372036854775807})", "", "9223372036854775807", false);
        checkPerson(parser.get(), R"({"age": -9223372036854775808})", "", "-9223372036854775808", false);
        checkRejected(parser.get(), R"({"age": 9223372036854775808})");
    }

    SUBCASE("repeated key keeps the last value") {
        checkPerson(parser.get(), R"({"name": "first", "name": "second"})", "second", "0", false);
    }

    SUBCASE("utf-8 passes through") {
        checkPerson(parser.get(), "{\"name\": \"Zo\xc3\xab\"}", "Zo\xc3\xab", "0", false);
    }

    SUBCASE("malformed documents") {
        checkRejected(parser.get(), R"("name": "John Doe", "age": 25})");
        checkRejected(parser.get(), R"({"name": "John Doe", "age": 25)");
        checkRejected(parser.get(), R"({name: "John Doe"})");
        checkRejected(parser.get(), R"({"name": John Doe})");
        checkRejected(parser.get(), R"({"is_student": maybe})");
        checkRejected(parser.get(), R"({"age": twenty})");
        checkRejected(parser.get(), R"({"name" "John"})");
        checkRejected(parser.get(), R"( {"name": "John"})");
        checkRejected(parser.get(), "");
        checkRejected(parser.get(), "not json");

        // A failed parse leaves the handle usable.
        checkPerson(parser.get(), R"({"name": "Still", "age": 1, "is_student": true})", "Still", "1", true);
    }

    SUBCASE("document with a NUL byte") {
        const char document[] = "{\"name\": \"x\"}\0junk";
        recordc::ErrorReporter nulReporter(true);
        CHECK_FALSE(parser->parse(std::string_view(document, sizeof(document) - 1), nulReporter));
        REQUIRE_EQ(nulReporter.errorCount(), 1);
        CHECK_EQ(nulReporter.lastError().code, recordc::Error::kInvalidDocument);
        CHECK_EQ(nulReporter.lastError().message, "document for Person contains a NUL byte at offset 13");

        checkPerson(parser.get(), R"({"name": "x"})", "x", "0", false);
    }

    SUBCASE("errors go to the builder reporter by default") {
        CHECK_FALSE(parser->parse("[]"));
        CHECK_EQ(errorReporter->lastError().code, recordc::Error::kParseFailureSentinel);
        auto record = parser->parse(R"({"age": 7})");
        REQUIRE(record);
        CHECK_EQ(record->at("age").toInt64(), 7);
    }

    SUBCASE("concurrent parses") {
        std::vector<std::thread> threads;
        std::vector<int> successes(4, 0);
        for (int i = 0; i < 4; ++i) {
            threads.emplace_back([&parser, &successes, i]() {
                recordc::ErrorReporter threadReporter(true);
                for (int j = 0; j < 10; ++j) {
                    auto document = "{\"name\": \"t" + std::to_string(i) + "\", \"age\": " + std::to_string(j) + "}";
                    auto record = parser->parse(document, threadReporter);
                    if (record && record->at("name").text() == "t" + std::to_string(i)
                            && record->at("age").text() == std::to_string(j)) {
                        ++successes[i];
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        for (int count : successes) {
            CHECK_EQ(count, 10);
        }
    }

    SUBCASE("close") {
        auto workspace = parser->workspacePath();
        REQUIRE(fs::is_directory(workspace));
        parser->close();
        CHECK(parser->isClosed());
        CHECK_FALSE(fs::exists(workspace));

        recordc::ErrorReporter closedReporter(true);
        CHECK_FALSE(parser->parse(R"({"name": "x"})", closedReporter));
        CHECK_EQ(closedReporter.lastError().code, recordc::Error::kParserClosed);

        parser->close();
        CHECK(parser->isClosed());
    }

    SUBCASE("destruction removes the workspace") {
        auto workspace = parser->workspacePath();
        parser.reset();
        CHECK_FALSE(fs::exists(workspace));
    }

    SUBCASE("handles are independent") {
        auto other = buildPerson(strategy, errorReporter);
        REQUIRE(other);
        CHECK_NE(other->workspacePath(), parser->workspacePath());
        other->close();
        checkPerson(parser.get(), R"({"name": "A", "age": 1, "is_student": false})", "A", "1", false);
    }
}

std::unique_ptr<recordc::CompiledParser> buildRecord(recordc::Builder::Strategy strategy,
        const recordc::RecordSchema& schema) {
    auto errorReporter = std::make_shared<recordc::ErrorReporter>(true);
    recordc::Builder builder(errorReporter);
    builder.setStrategy(strategy);
    builder.setTimeout(std::chrono::seconds(10));
    auto parser = builder.build(schema);
    CHECK(errorReporter->ok());
    return parser;
}

// Record names that match identifiers used inside the generated functions. Documents leave fields out, so every
// string member that is not in the document must have been zeroed before it is released.
void checkRecordsNamedLikeLocals(recordc::Builder::Strategy strategy) {
    for (auto recordName : {"out", "ptr", "input", "key", "result", "document"}) {
        CAPTURE(recordName);
        recordc::RecordSchema schema;
        schema.name = recordName;
        for (auto fieldName : {"a", "b", "c", "d"}) {
            schema.fields.emplace_back(recordc::FieldSpec(fieldName, "string"));
        }
        auto parser = buildRecord(strategy, schema);
        REQUIRE(parser);

        for (int i = 0; i < 3; ++i) {
            recordc::ErrorReporter errorReporter(true);
            auto record = parser->parse(R"({"a": "x", "c": "z"})", errorReporter);
            REQUIRE(record);
            CHECK(errorReporter.ok());
            CHECK_EQ(record->at("a").text(), "x");
            CHECK_EQ(record->at("b").text(), "");
            CHECK_EQ(record->at("c").text(), "z");
            CHECK_EQ(record->at("d").text(), "");

            record = parser->parse(R"({"d": "w", "d": "v"})", errorReporter);
            REQUIRE(record);
            CHECK_EQ(record->at("a").text(), "");
            CHECK_EQ(record->at("d").text(), "v");

            CHECK_FALSE(parser->parse(R"({"b": "y", "c": oops})", errorReporter));
            CHECK_EQ(errorReporter.lastError().code, recordc::Error::kParseFailureSentinel);
        }
    }
}

void checkRenamedMembers(recordc::Builder::Strategy strategy) {
    recordc::RecordSchema schema;
    schema.name = "Rec";
    schema.fields.emplace_back(recordc::FieldSpec("int", "integer"));
    schema.fields.emplace_back(recordc::FieldSpec("int_", "integer"));
    schema.fields.emplace_back(recordc::FieldSpec("EXIT_FAILURE", "boolean"));
    schema.fields.emplace_back(recordc::FieldSpec("default", "string"));
    schema.fields.emplace_back(recordc::FieldSpec("INT64_MAX", "string"));
    schema.fields.emplace_back(recordc::FieldSpec("Rec_H", "string"));
    auto parser = buildRecord(strategy, schema);
    REQUIRE(parser);

    recordc::ErrorReporter errorReporter(true);
    auto record = parser->parse(R"({"int": 1, "int_": 2, "EXIT_FAILURE": true, "default": "d", "INT64_MAX": "m",)"
            R"( "Rec_H": "h"})", errorReporter);
    REQUIRE(record);
    CHECK(errorReporter.ok());
    CHECK_EQ(record->at("int").toInt64(), 1);
    CHECK_EQ(record->at("int_").toInt64(), 2);
    CHECK(record->at("EXIT_FAILURE").getBool());
    CHECK_EQ(record->at("default").text(), "d");
    CHECK_EQ(record->at("INT64_MAX").text(), "m");
    CHECK_EQ(record->at("Rec_H").text(), "h");
}

// Writes an executable shell script into a fresh workspace, for standing in for an artifact that misbehaves.
std::unique_ptr<recordc::Workspace> scriptWorkspace(const std::string& script, fs::path& scriptPath) {
    recordc::ErrorReporter errorReporter(true);
    auto workspace = recordc::Workspace::create(recordc::defaultWorkspaceBase(), "recordc-script-test-",
            &errorReporter);
    if (!workspace) { return nullptr; }
    if (!workspace->writeFile("script.sh", "#!/bin/sh\n" + script + "\n", &errorReporter)) { return nullptr; }
    scriptPath = workspace->filePath("script.sh");
    std::error_code ec;
    fs::permissions(scriptPath, fs::perms::owner_all, ec);
    if (ec) { return nullptr; }
    return workspace;
}

recordc::ResolvedSchema resolvedPerson() {
    recordc::ResolvedSchema schema;
    schema.name = "Person";
    schema.fields.emplace_back(recordc::Field{"name", recordc::FieldKind::kString});
    return schema;
}

} // namespace

namespace recordc {

TEST_CASE("CompiledParser process per call") {
    checkPersonParsing(Builder::Strategy::kProcessPerCall);
}

TEST_CASE("CompiledParser worker") {
    checkPersonParsing(Builder::Strategy::kWorker);

    SUBCASE("one worker serves many calls") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        auto parser = buildPerson(Builder::Strategy::kWorker, errorReporter);
        REQUIRE(parser);
        auto worker = dynamic_cast<WorkerParser*>(parser.get());
        REQUIRE(worker);
        auto pid = worker->workerPid();
        CHECK_GT(pid, 0);
        checkPerson(parser.get(), R"({"name": "a"})", "a", "0", false);
        checkRejected(parser.get(), "{");
        checkPerson(parser.get(), R"({"name": "b"})", "b", "0", false);
        CHECK_EQ(worker->workerPid(), pid);
        parser->close();
        CHECK_LE(worker->workerPid(), 0);
    }
}

TEST_CASE("CompiledParser record names matching generated identifiers") {
    SUBCASE("process per call") { checkRecordsNamedLikeLocals(Builder::Strategy::kProcessPerCall); }
    SUBCASE("worker") { checkRecordsNamedLikeLocals(Builder::Strategy::kWorker); }
}

TEST_CASE("CompiledParser field names that are C keywords or macros") {
    SUBCASE("process per call") { checkRenamedMembers(Builder::Strategy::kProcessPerCall); }
    SUBCASE("worker") { checkRenamedMembers(Builder::Strategy::kWorker); }
}

TEST_CASE("ProcessParser failures") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);

    SUBCASE("timeout") {
        fs::path scriptPath;
        auto workspace = scriptWorkspace("exec sleep 10", scriptPath);
        REQUIRE(workspace);
        ProcessParser parser(std::move(workspace), scriptPath, resolvedPerson(), std::chrono::milliseconds(100),
                errorReporter);
        CHECK_FALSE(parser.parse("{}"));
        CHECK_EQ(errorReporter->lastError().code, Error::kTimedOut);
    }

    SUBCASE("crash without sentinel") {
        fs::path scriptPath;
        auto workspace = scriptWorkspace("echo oops; exit 2", scriptPath);
        REQUIRE(workspace);
        ProcessParser parser(std::move(workspace), scriptPath, resolvedPerson(), std::chrono::seconds(10),
                errorReporter);
        CHECK_FALSE(parser.parse("{}"));
        CHECK_EQ(errorReporter->lastError().code, Error::kMalformedOutput);
        CHECK(errorReporter->lastError().output.find("oops") != std::string::npos);
    }

    SUBCASE("output without sentinel") {
        fs::path scriptPath;
        auto workspace = scriptWorkspace("printf 'hello|world'", scriptPath);
        REQUIRE(workspace);
        ProcessParser parser(std::move(workspace), scriptPath, resolvedPerson(), std::chrono::seconds(10),
                errorReporter);
        CHECK_FALSE(parser.parse("{}"));
        CHECK_EQ(errorReporter->lastError().code, Error::kMalformedOutput);
    }

    SUBCASE("missing artifact") {
        ProcessParser parser(nullptr, "/nonexistent/parser_Person", resolvedPerson(), std::chrono::seconds(10),
                errorReporter);
        CHECK_FALSE(parser.parse("{}"));
        auto code = errorReporter->lastError().code;
        CHECK((code == Error::kProcessSpawnFailed || code == Error::kMalformedOutput));
    }
}

TEST_CASE("WorkerParser failures") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);

    SUBCASE("timeout restarts the worker") {
        fs::path scriptPath;
        auto workspace = scriptWorkspace("exec sleep 10", scriptPath);
        REQUIRE(workspace);
        WorkerParser parser(std::move(workspace), scriptPath, resolvedPerson(), std::chrono::milliseconds(100),
                errorReporter);
        REQUIRE(parser.start(*errorReporter));
        CHECK_GT(parser.workerPid(), 0);
        CHECK_FALSE(parser.parse("{}"));
        CHECK_EQ(errorReporter->lastError().code, Error::kTimedOut);
        CHECK_LE(parser.workerPid(), 0);

        // The next call starts a fresh worker, which times out the same way.
        CHECK_FALSE(parser.parse("{}"));
        CHECK_EQ(errorReporter->errorCount(), 2);
        CHECK_EQ(errorReporter->lastError().code, Error::kTimedOut);
    }

    SUBCASE("worker exits") {
        fs::path scriptPath;
        auto workspace = scriptWorkspace("exit 0", scriptPath);
        REQUIRE(workspace);
        WorkerParser parser(std::move(workspace), scriptPath, resolvedPerson(), std::chrono::seconds(10),
                errorReporter);
        CHECK_FALSE(parser.parse("{}"));
        CHECK_EQ(errorReporter->lastError().code, Error::kMalformedOutput);
    }

    SUBCASE("invalid frame header") {
        fs::path scriptPath;
        auto workspace = scriptWorkspace("read line; echo 'SUCCESS|x'; exec sleep 10", scriptPath);
        REQUIRE(workspace);
        WorkerParser parser(std::move(workspace), scriptPath, resolvedPerson(), std::chrono::seconds(10),
                errorReporter);
        CHECK_FALSE(parser.parse("{}"));
        CHECK_EQ(errorReporter->lastError().code, Error::kMalformedOutput);
    }

    SUBCASE("framed response") {
        fs::path scriptPath;
        auto workspace = scriptWorkspace("while read line; do printf '9\\nSUCCESS|x'; done", scriptPath);
        REQUIRE(workspace);
        WorkerParser parser(std::move(workspace), scriptPath, resolvedPerson(), std::chrono::seconds(10),
                errorReporter);
        auto record = parser.parse("{}\n");
        REQUIRE(record);
        CHECK_EQ(record->at("name").text(), "x");
    }
}

} // namespace recordc
