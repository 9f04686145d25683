#include "recordc/Value.hpp"

#include <charconv>

namespace recordc {

// static
Value Value::makeString(std::string text) { return Value(FieldKind::kString, std::move(text), false); }

// static
Value Value::makeInteger(std::string text) { return Value(FieldKind::kInteger, std::move(text), false); }

// static
Value Value::makeBoolean(bool boolean) { return Value(FieldKind::kBoolean, std::string(), boolean); }

std::optional<int64_t> Value::toInt64() const {
    if (m_kind != FieldKind::kInteger || m_text.empty()) { return std::nullopt; }
    int64_t value = 0;
    const char* end = m_text.data() + m_text.size();
    auto result = std::from_chars(m_text.data(), end, value);
    if (result.ec != std::errc() || result.ptr != end) { return std::nullopt; }
    return value;
}

bool Value::operator==(const Value& v) const {
    if (m_kind != v.m_kind) { return false; }
    if (m_kind == FieldKind::kBoolean) { return m_boolean == v.m_boolean; }
    return m_text == v.m_text;
}

} // namespace recordc
