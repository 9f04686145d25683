#ifndef SRC_RECORDC_TYPE_MAPPER_HPP_
#define SRC_RECORDC_TYPE_MAPPER_HPP_

#include "recordc/Schema.hpp"

#include <optional>
#include <string_view>

namespace recordc {

// Maps between declared type names, FieldKinds, and the C types used in generated code.
class TypeMapper {
public:
    // Resolves a declared type name, accepting both the canonical names and the C type spellings. Returns an empty
    // optional for anything outside the supported set, including the empty string.
    static std::optional<FieldKind> kindForTypeName(std::string_view typeName);

    static std::string_view canonicalTypeName(FieldKind kind);
    static std::string_view cTypeName(FieldKind kind);
};

} // namespace recordc

#endif // SRC_RECORDC_TYPE_MAPPER_HPP_
