#ifndef SRC_RECORDC_VALUE_HPP_
#define SRC_RECORDC_VALUE_HPP_

#include "recordc/Schema.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace recordc {

// A decoded field value. Integers are carried as their decimal text, exactly as the artifact printed them.
class Value {
public:
    Value(): m_kind(FieldKind::kString), m_boolean(false) {}
    ~Value() = default;

    static Value makeString(std::string text);
    static Value makeInteger(std::string text);
    static Value makeBoolean(bool boolean);

    FieldKind kind() const { return m_kind; }
    bool isString() const { return m_kind == FieldKind::kString; }
    bool isInteger() const { return m_kind == FieldKind::kInteger; }
    bool isBoolean() const { return m_kind == FieldKind::kBoolean; }

    // Valid for strings and integers.
    const std::string& text() const { return m_text; }
    bool getBool() const { return m_boolean; }
    // Convenience conversion of integer text, empty if the text is not a valid int64.
    std::optional<int64_t> toInt64() const;

    bool operator==(const Value& v) const;
    bool operator!=(const Value& v) const { return !(*this == v); }

private:
    Value(FieldKind kind, std::string text, bool boolean): m_kind(kind), m_text(std::move(text)), m_boolean(boolean) {}

    FieldKind m_kind;
    std::string m_text;
    bool m_boolean;
};

// Field name to value, covering the schema fields present in the artifact output.
using ParsedRecord = std::unordered_map<std::string, Value>;

} // namespace recordc

#endif // SRC_RECORDC_VALUE_HPP_
