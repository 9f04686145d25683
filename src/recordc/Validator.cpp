#include "recordc/Validator.hpp"

#include "recordc/CIdentifiers.hpp"
#include "recordc/ErrorReporter.hpp"
#include "recordc/TypeMapper.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <regex>
#include <unordered_set>

namespace recordc {

// static
bool Validator::validate(const RecordSchema& schema, ErrorReporter* errorReporter) {
    if (schema.name.empty()) {
        errorReporter->addError(Error::kEmptyName, "empty record name");
        return false;
    }
    if (!isIdentifier(schema.name)) {
        errorReporter->addError(Error::kInvalidName, fmt::format("invalid record name: {} (must be a valid C "
                "identifier)", schema.name));
        return false;
    }
    if (isReservedRecordName(schema.name)) {
        errorReporter->addError(Error::kInvalidName, fmt::format("invalid record name: {} (reserved in generated C "
                "code)", schema.name));
        return false;
    }
    if (schema.fields.empty()) {
        errorReporter->addError(Error::kNoFields, fmt::format("record {} has no fields", schema.name));
        return false;
    }

    std::unordered_set<std::string> fieldNames;
    for (const auto& field : schema.fields) {
        if (field.name.empty()) {
            errorReporter->addError(Error::kEmptyFieldName, "empty field name");
            return false;
        }
        if (!isIdentifier(field.name)) {
            errorReporter->addError(Error::kInvalidFieldName, fmt::format("invalid field name: {} (must be a valid C "
                    "identifier)", field.name));
            return false;
        }
        if (!fieldNames.emplace(field.name).second) {
            errorReporter->addError(Error::kDuplicateFieldName, fmt::format("duplicate field name: {}",
                    field.name));
            return false;
        }

        if (field.type.empty()) {
            errorReporter->addError(Error::kEmptyType, fmt::format("empty type for field: {}", field.name));
            return false;
        }
        if (!TypeMapper::kindForTypeName(field.type)) {
            errorReporter->addError(Error::kUnsupportedType, fmt::format("unsupported type: {} for field: {}",
                    field.type, field.name));
            return false;
        }
    }

    SPDLOG_DEBUG("Record {} with {} fields passed validation", schema.name, schema.fields.size());
    return true;
}

// static
bool Validator::validate(const ResolvedSchema& schema, ErrorReporter* errorReporter) {
    RecordSchema declared;
    declared.name = schema.name;
    for (const auto& field : schema.fields) {
        declared.fields.emplace_back(FieldSpec(field.name, field.kind));
    }
    return validate(declared, errorReporter);
}

// static
std::optional<ResolvedSchema> Validator::resolve(const RecordSchema& schema, ErrorReporter* errorReporter) {
    if (!validate(schema, errorReporter)) { return std::nullopt; }

    ResolvedSchema resolved;
    resolved.name = schema.name;
    resolved.fields.reserve(schema.fields.size());
    for (const auto& field : schema.fields) {
        resolved.fields.emplace_back(Field{field.name, TypeMapper::kindForTypeName(field.type).value()});
    }
    return resolved;
}

// static
bool Validator::isIdentifier(std::string_view name) {
    static const std::regex identifierRegex("^[A-Za-z_][A-Za-z0-9_]*$");
    return std::regex_match(name.begin(), name.end(), identifierRegex);
}

} // namespace recordc
