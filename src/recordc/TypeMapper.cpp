#include "recordc/TypeMapper.hpp"

#include <array>
#include <utility>

namespace recordc {

namespace {

const std::array<std::pair<std::string_view, FieldKind>, 7> kTypeNames{{
    { "string", FieldKind::kString },
    { "char*", FieldKind::kString },
    { "integer", FieldKind::kInteger },
    { "int", FieldKind::kInteger },
    { "int64_t", FieldKind::kInteger },
    { "boolean", FieldKind::kBoolean },
    { "bool", FieldKind::kBoolean }
}};

} // namespace

// static
std::optional<FieldKind> TypeMapper::kindForTypeName(std::string_view typeName) {
    for (const auto& pair : kTypeNames) {
        if (pair.first == typeName) { return pair.second; }
    }
    return std::nullopt;
}

// static
std::string_view TypeMapper::canonicalTypeName(FieldKind kind) {
    switch (kind) {
    case FieldKind::kString: return "string";
    case FieldKind::kInteger: return "integer";
    case FieldKind::kBoolean: return "boolean";
    }
    return "";
}

// static
std::string_view TypeMapper::cTypeName(FieldKind kind) {
    switch (kind) {
    case FieldKind::kString: return "char*";
    case FieldKind::kInteger: return "int64_t";
    case FieldKind::kBoolean: return "bool";
    }
    return "";
}

} // namespace recordc
