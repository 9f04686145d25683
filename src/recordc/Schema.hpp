#ifndef SRC_RECORDC_SCHEMA_HPP_
#define SRC_RECORDC_SCHEMA_HPP_

#include <string>
#include <utility>
#include <vector>

namespace recordc {

// The closed set of primitive kinds a record field may hold.
enum class FieldKind { kString, kInteger, kBoolean };

// A field as declared by the external source of truth. The type is kept as the declared name so that an absent
// or unsupported type survives until validation can report it.
struct FieldSpec {
    FieldSpec() = default;
    FieldSpec(std::string fieldName, std::string typeName): name(std::move(fieldName)), type(std::move(typeName)) {}
    FieldSpec(std::string fieldName, FieldKind kind);

    std::string name;
    std::string type;
};

// A flat record shape: a name and an ordered list of typed fields. Immutable once built.
struct RecordSchema {
    std::string name;
    std::vector<FieldSpec> fields;
};

struct Field {
    std::string name;
    FieldKind kind;
};

// A RecordSchema that has passed validation, with every declared type resolved to a FieldKind. Field order matches
// declaration order.
struct ResolvedSchema {
    std::string name;
    std::vector<Field> fields;
};

} // namespace recordc

#endif // SRC_RECORDC_SCHEMA_HPP_
