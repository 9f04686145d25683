#include "recordc/RecordDumpJSON.hpp"

#include "doctest/doctest.h"

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

TEST_CASE("RecordDumpJSON dump") {
    RecordDumpJSON dumper;

    SUBCASE("schema field order and value kinds") {
        ParsedRecord record;
        record.emplace("is_student", Value::makeBoolean(true));
        record.emplace("age", Value::makeInteger("25"));
        record.emplace("name", Value::makeString("John Doe"));
        dumper.dump(personSchema(), record, false);
        CHECK_EQ(dumper.json(), R"({"name":"John Doe","age":"25","is_student":true})");
    }

    SUBCASE("escaping") {
        ParsedRecord record;
        record.emplace("name", Value::makeString("John \"Johnny\" Doe"));
        dumper.dump(personSchema(), record, false);
        CHECK_EQ(dumper.json(), R"({"name":"John \"Johnny\" Doe"})");
    }

    SUBCASE("absent fields omitted") {
        ParsedRecord record;
        dumper.dump(personSchema(), record, false);
        CHECK_EQ(dumper.json(), "{}");
    }

    SUBCASE("dump replaces previous output") {
        ParsedRecord record;
        record.emplace("is_student", Value::makeBoolean(false));
        dumper.dump(personSchema(), record, false);
        dumper.dump(personSchema(), record, false);
        CHECK_EQ(dumper.json(), R"({"is_student":false})");
    }
}

} // namespace recordc
