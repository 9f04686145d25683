#include "recordc/ResultDecoder.hpp"

#include "recordc/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <vector>

namespace {

std::vector<recordc::Field> personFields() {
    return std::vector<recordc::Field>{{"name", recordc::FieldKind::kString}, {"age", recordc::FieldKind::kInteger},
            {"is_student", recordc::FieldKind::kBoolean}};
}

} // namespace

namespace recordc {

TEST_CASE("ResultDecoder decode success") {
    ErrorReporter errorReporter(true);

    SUBCASE("all fields") {
        auto record = ResultDecoder::decode("SUCCESS|John Doe|25|true", personFields(), &errorReporter);
        REQUIRE(record);
        CHECK(errorReporter.ok());
        REQUIRE_EQ(record->size(), 3);
        CHECK_EQ(record->at("name"), Value::makeString("John Doe"));
        CHECK_EQ(record->at("age"), Value::makeInteger("25"));
        CHECK_EQ(record->at("is_student"), Value::makeBoolean(true));
    }

    SUBCASE("defaults for absent fields") {
        auto record = ResultDecoder::decode("SUCCESS||0|false", personFields(), &errorReporter);
        REQUIRE(record);
        CHECK_EQ(record->at("name").text(), "");
        CHECK_EQ(record->at("age").text(), "0");
        CHECK_FALSE(record->at("is_student").getBool());
    }

    SUBCASE("surrounding whitespace trimmed") {
        auto record = ResultDecoder::decode("  SUCCESS|Jane|-7|false\n", personFields(), &errorReporter);
        REQUIRE(record);
        CHECK_EQ(record->at("name").text(), "Jane");
        CHECK_EQ(record->at("age").toInt64(), -7);
    }

    SUBCASE("values are not trimmed") {
        auto record = ResultDecoder::decode("SUCCESS| padded |1|true", personFields(), &errorReporter);
        REQUIRE(record);
        CHECK_EQ(record->at("name").text(), " padded ");
    }

    SUBCASE("anything but true is false") {
        auto record = ResultDecoder::decode("SUCCESS|a|1|TRUE", personFields(), &errorReporter);
        REQUIRE(record);
        CHECK_FALSE(record->at("is_student").getBool());
    }

    SUBCASE("fewer values truncate") {
        auto record = ResultDecoder::decode("SUCCESS|John", personFields(), &errorReporter);
        REQUIRE(record);
        CHECK_EQ(record->size(), 1);
        CHECK_EQ(record->count("name"), 1);
        CHECK(errorReporter.ok());
    }

    SUBCASE("extra values ignored") {
        auto record = ResultDecoder::decode("SUCCESS|John|25|true|extra|more", personFields(), &errorReporter);
        REQUIRE(record);
        CHECK_EQ(record->size(), 3);
    }

    SUBCASE("delimiter in a string shifts later values") {
        auto record = ResultDecoder::decode("SUCCESS|a|b|25|true", personFields(), &errorReporter);
        REQUIRE(record);
        CHECK_EQ(record->at("name").text(), "a");
        CHECK_EQ(record->at("age").text(), "b");
        CHECK_FALSE(record->at("age").toInt64());
    }
}

TEST_CASE("ResultDecoder decode failures") {
    ErrorReporter errorReporter(true);

    SUBCASE("failure sentinel") {
        CHECK_FALSE(ResultDecoder::decode("ERROR|Failed to parse JSON\n", personFields(), &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kParseFailureSentinel);
        CHECK_EQ(errorReporter.lastError().message, "Failed to parse JSON");
        CHECK_EQ(errorReporter.lastError().output, "ERROR|Failed to parse JSON\n");
    }

    SUBCASE("no sentinel") {
        CHECK_FALSE(ResultDecoder::decode("Segmentation fault", personFields(), &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kMalformedOutput);
        CHECK_EQ(errorReporter.lastError().output, "Segmentation fault");
    }

    SUBCASE("empty output") {
        CHECK_FALSE(ResultDecoder::decode("", personFields(), &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kMalformedOutput);
    }

    SUBCASE("sentinel must be the whole first token") {
        CHECK_FALSE(ResultDecoder::decode("SUCCESSFUL|a|1|true", personFields(), &errorReporter));
        CHECK_EQ(errorReporter.lastError().code, Error::kMalformedOutput);
    }
}

TEST_CASE("ResultDecoder helpers") {
    SUBCASE("split") {
        auto tokens = ResultDecoder::split("a||b|");
        REQUIRE_EQ(tokens.size(), 4);
        CHECK_EQ(tokens[0], "a");
        CHECK_EQ(tokens[1], "");
        CHECK_EQ(tokens[2], "b");
        CHECK_EQ(tokens[3], "");
    }

    SUBCASE("trim") {
        CHECK_EQ(ResultDecoder::trim(" \t abc \r\n"), "abc");
        CHECK_EQ(ResultDecoder::trim("   "), "");
        CHECK_EQ(ResultDecoder::trim("a b"), "a b");
    }
}

TEST_CASE("Value") {
    SUBCASE("kinds") {
        CHECK(Value::makeString("x").isString());
        CHECK(Value::makeInteger("1").isInteger());
        CHECK(Value::makeBoolean(false).isBoolean());
        CHECK(Value().isString());
    }

    SUBCASE("equality") {
        CHECK_EQ(Value::makeString("1"), Value::makeString("1"));
        CHECK_NE(Value::makeString("1"), Value::makeInteger("1"));
        CHECK_NE(Value::makeBoolean(true), Value::makeBoolean(false));
        CHECK_EQ(Value::makeBoolean(true), Value::makeBoolean(true));
    }

    SUBCASE("integer conversion") {
        CHECK_EQ(Value::makeInteger("9223372036854775807").toInt64(), INT64_MAX);
        CHECK_EQ(Value::makeInteger("-9223372036854775808").toInt64(), INT64_MIN);
        CHECK_FALSE(Value::makeInteger("9223372036854775808").toInt64());
        CHECK_FALSE(Value::makeInteger("").toInt64());
        CHECK_FALSE(Value::makeInteger("12a").toInt64());
        CHECK_FALSE(Value::makeString("12").toInt64());
    }
}

} // namespace recordc
