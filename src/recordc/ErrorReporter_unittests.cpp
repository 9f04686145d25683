#include "recordc/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <string>
#include <thread>
#include <vector>

namespace recordc {

TEST_CASE("ErrorReporter collects errors") {
    SUBCASE("starts empty") {
        ErrorReporter errorReporter(true);
        CHECK(errorReporter.ok());
        CHECK_EQ(errorReporter.errorCount(), 0);
        CHECK(errorReporter.errors().empty());
    }

    SUBCASE("keeps order and output") {
        ErrorReporter errorReporter(true);
        errorReporter.addError(Error::kEmptyName, "empty record name");
        errorReporter.addExternalBuildError(1, "Person.c:3: error: expected ';'");
        REQUIRE_EQ(errorReporter.errorCount(), 2);
        CHECK_FALSE(errorReporter.ok());

        auto errors = errorReporter.errors();
        CHECK_EQ(errors[0].code, Error::kEmptyName);
        CHECK_EQ(errors[0].message, "empty record name");
        CHECK(errors[0].output.empty());

        auto last = errorReporter.lastError();
        CHECK_EQ(last.code, Error::kExternalBuildFailed);
        CHECK_EQ(last.message, "compilation failed with exit status 1");
        CHECK_EQ(last.output, "Person.c:3: error: expected ';'");

        errorReporter.clear();
        CHECK(errorReporter.ok());
    }

    SUBCASE("specific errors") {
        ErrorReporter errorReporter(true);
        errorReporter.addWorkspaceCreateError("/tmp/out", "Permission denied");
        CHECK_EQ(errorReporter.lastError().code, Error::kWorkspaceCreateFailed);
        CHECK_EQ(errorReporter.lastError().message, "failed to create output directory '/tmp/out': Permission denied");
        errorReporter.addSourceWriteError("/tmp/out/Person.h");
        CHECK_EQ(errorReporter.lastError().code, Error::kSourceWriteFailed);
        CHECK_EQ(errorReporter.lastError().message, "failed to write source file '/tmp/out/Person.h'");
    }

    SUBCASE("concurrent reporting") {
        ErrorReporter errorReporter(true);
        std::vector<std::thread> threads;
        for (int i = 0; i < 4; ++i) {
            threads.emplace_back([&errorReporter]() {
                for (int j = 0; j < 100; ++j) {
                    errorReporter.addError(Error::kMalformedOutput, "bad output");
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        CHECK_EQ(errorReporter.errorCount(), 400);
    }
}

TEST_CASE("Error families and names") {
    auto familyOf = [](Error::Code code) { return Error{code, std::string(), std::string()}.family(); };
    CHECK_EQ(familyOf(Error::kEmptyName), Error::kSchema);
    CHECK_EQ(familyOf(Error::kUnsupportedType), Error::kSchema);
    CHECK_EQ(familyOf(Error::kSchemaFileInvalid), Error::kSchema);
    CHECK_EQ(familyOf(Error::kWorkspaceCreateFailed), Error::kBuild);
    CHECK_EQ(familyOf(Error::kExternalBuildFailed), Error::kBuild);
    CHECK_EQ(familyOf(Error::kInvalidDocument), Error::kParse);
    CHECK_EQ(familyOf(Error::kProcessSpawnFailed), Error::kParse);
    CHECK_EQ(familyOf(Error::kParserClosed), Error::kParse);

    CHECK_EQ(Error::codeName(Error::kDuplicateFieldName), "DuplicateFieldName");
    CHECK_EQ(Error::codeName(Error::kParseFailureSentinel), "ParseFailureSentinel");
    CHECK_EQ(Error::codeName(Error::kTimedOut), "TimedOut");
    CHECK_EQ(Error::codeName(Error::kInvalidDocument), "InvalidDocument");
}

} // namespace recordc
