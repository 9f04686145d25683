#include "recordc/Schema.hpp"

#include "recordc/TypeMapper.hpp"

namespace recordc {

FieldSpec::FieldSpec(std::string fieldName, FieldKind kind):
    name(std::move(fieldName)), type(TypeMapper::canonicalTypeName(kind)) {}

} // namespace recordc
