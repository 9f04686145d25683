#include "recordc/TypeMapper.hpp"

#include "doctest/doctest.h"

namespace recordc {

TEST_CASE("TypeMapper kindForTypeName") {
    SUBCASE("accepted names") {
        CHECK_EQ(TypeMapper::kindForTypeName("string"), FieldKind::kString);
        CHECK_EQ(TypeMapper::kindForTypeName("char*"), FieldKind::kString);
        CHECK_EQ(TypeMapper::kindForTypeName("integer"), FieldKind::kInteger);
        CHECK_EQ(TypeMapper::kindForTypeName("int"), FieldKind::kInteger);
        CHECK_EQ(TypeMapper::kindForTypeName("int64_t"), FieldKind::kInteger);
        CHECK_EQ(TypeMapper::kindForTypeName("boolean"), FieldKind::kBoolean);
        CHECK_EQ(TypeMapper::kindForTypeName("bool"), FieldKind::kBoolean);
    }

    SUBCASE("unsupported names") {
        CHECK_FALSE(TypeMapper::kindForTypeName("").has_value());
        CHECK_FALSE(TypeMapper::kindForTypeName("float").has_value());
        CHECK_FALSE(TypeMapper::kindForTypeName("double").has_value());
        CHECK_FALSE(TypeMapper::kindForTypeName("object").has_value());
        CHECK_FALSE(TypeMapper::kindForTypeName("String").has_value());
    }
}

TEST_CASE("TypeMapper names for kinds") {
    CHECK_EQ(TypeMapper::cTypeName(FieldKind::kString), "char*");
    CHECK_EQ(TypeMapper::cTypeName(FieldKind::kInteger), "int64_t");
    CHECK_EQ(TypeMapper::cTypeName(FieldKind::kBoolean), "bool");

    for (auto kind : {FieldKind::kString, FieldKind::kInteger, FieldKind::kBoolean}) {
        CHECK_EQ(TypeMapper::kindForTypeName(TypeMapper::canonicalTypeName(kind)), kind);
    }

    FieldSpec spec("age", FieldKind::kInteger);
    CHECK_EQ(spec.type, "integer");
}

} // namespace recordc
