#include "recordc/CIdentifiers.hpp"

#include "doctest/doctest.h"

namespace recordc {

TEST_CASE("isCKeywordOrMacro") {
    SUBCASE("keywords") {
        CHECK(isCKeywordOrMacro("int"));
        CHECK(isCKeywordOrMacro("struct"));
        CHECK(isCKeywordOrMacro("restrict"));
        CHECK(isCKeywordOrMacro("bool"));
        CHECK(isCKeywordOrMacro("_Bool"));
    }

    SUBCASE("library macros") {
        CHECK(isCKeywordOrMacro("NULL"));
        CHECK(isCKeywordOrMacro("EXIT_FAILURE"));
        CHECK(isCKeywordOrMacro("RAND_MAX"));
        CHECK(isCKeywordOrMacro("stderr"));
        CHECK(isCKeywordOrMacro("SIZE_MAX"));
        CHECK(isCKeywordOrMacro("INT64_MAX"));
        CHECK(isCKeywordOrMacro("UINT32_MAX"));
        CHECK(isCKeywordOrMacro("INT8_C"));
        CHECK(isCKeywordOrMacro("INTMAX_MIN"));
        CHECK(isCKeywordOrMacro("INT_LEAST16_MAX"));
        CHECK(isCKeywordOrMacro("PRId64"));
        CHECK(isCKeywordOrMacro("SCNuPTR"));
    }

    SUBCASE("reserved prefixes") {
        CHECK(isCKeywordOrMacro("__anything"));
        CHECK(isCKeywordOrMacro("_Upper"));
        CHECK_FALSE(isCKeywordOrMacro("_lower"));
        CHECK_FALSE(isCKeywordOrMacro("_"));
    }

    SUBCASE("ordinary names") {
        CHECK_FALSE(isCKeywordOrMacro("name"));
        CHECK_FALSE(isCKeywordOrMacro("int_"));
        CHECK_FALSE(isCKeywordOrMacro("INTERVAL"));
        CHECK_FALSE(isCKeywordOrMacro("Integer"));
        CHECK_FALSE(isCKeywordOrMacro("PRIority"));
        CHECK_FALSE(isCKeywordOrMacro("free"));
        CHECK_FALSE(isCKeywordOrMacro("rc_value"));
    }
}

TEST_CASE("isReservedRecordName") {
    CHECK(isReservedRecordName("int"));
    CHECK(isReservedRecordName("EXIT_SUCCESS"));
    CHECK(isReservedRecordName("free"));
    CHECK(isReservedRecordName("snprintf"));
    CHECK(isReservedRecordName("FILE"));
    CHECK(isReservedRecordName("int64_t"));
    CHECK(isReservedRecordName("record_t"));
    CHECK(isReservedRecordName("main"));
    CHECK(isReservedRecordName("parse_and_serialize"));
    CHECK(isReservedRecordName("and_serialize"));
    CHECK(isReservedRecordName("rc_buffer"));

    CHECK_FALSE(isReservedRecordName("Person"));
    CHECK_FALSE(isReservedRecordName("out"));
    CHECK_FALSE(isReservedRecordName("input"));
    CHECK_FALSE(isReservedRecordName("rc"));
    CHECK_FALSE(isReservedRecordName("_student"));
}

} // namespace recordc
