#include "recordc/SchemaFile.hpp"

#include "recordc/ErrorReporter.hpp"

#include "fmt/format.h"
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "spdlog/spdlog.h"

#include <string>
#include <utility>

namespace recordc {

// static
std::optional<RecordSchema> SchemaFile::load(const fs::path& filePath, ErrorReporter* errorReporter) {
    std::string json;
    if (!readFile(filePath, json)) {
        errorReporter->addError(Error::kSchemaFileInvalid, fmt::format("unable to read schema file '{}'",
                filePath.string()));
        return std::nullopt;
    }
    SPDLOG_DEBUG("Loading schema from '{}'", filePath.string());
    return parse(json, errorReporter);
}

// static
std::optional<RecordSchema> SchemaFile::parse(std::string_view json, ErrorReporter* errorReporter) {
    rapidjson::Document document;
    document.Parse(json.data(), json.size());
    if (document.HasParseError()) {
        errorReporter->addError(Error::kSchemaFileInvalid, fmt::format("schema JSON parse error at offset {}: {}",
                document.GetErrorOffset(), rapidjson::GetParseError_En(document.GetParseError())));
        return std::nullopt;
    }
    if (!document.IsObject()) {
        errorReporter->addError(Error::kSchemaFileInvalid, "schema JSON must be an object");
        return std::nullopt;
    }

    RecordSchema schema;
    auto name = document.FindMember("name");
    if (name != document.MemberEnd()) {
        if (!name->value.IsString()) {
            errorReporter->addError(Error::kSchemaFileInvalid, "schema \"name\" must be a string");
            return std::nullopt;
        }
        schema.name.assign(name->value.GetString(), name->value.GetStringLength());
    }

    // A missing fields array is an empty record, which validation reports as having no fields.
    auto fields = document.FindMember("fields");
    if (fields == document.MemberEnd()) { return schema; }
    if (!fields->value.IsArray()) {
        errorReporter->addError(Error::kSchemaFileInvalid, fmt::format("schema \"fields\" of record '{}' must be an "
                "array", schema.name));
        return std::nullopt;
    }

    for (const auto& field : fields->value.GetArray()) {
        if (!field.IsObject()) {
            errorReporter->addError(Error::kSchemaFileInvalid, fmt::format("field {} of record '{}' must be an "
                    "object", schema.fields.size(), schema.name));
            return std::nullopt;
        }

        FieldSpec fieldSpec;
        auto fieldName = field.FindMember("name");
        if (fieldName != field.MemberEnd()) {
            if (!fieldName->value.IsString()) {
                errorReporter->addError(Error::kSchemaFileInvalid, fmt::format("name of field {} of record '{}' "
                        "must be a string", schema.fields.size(), schema.name));
                return std::nullopt;
            }
            fieldSpec.name.assign(fieldName->value.GetString(), fieldName->value.GetStringLength());
        }

        auto fieldType = field.FindMember("type");
        if (fieldType != field.MemberEnd() && fieldType->value.IsString()) {
            fieldSpec.type.assign(fieldType->value.GetString(), fieldType->value.GetStringLength());
        }

        schema.fields.emplace_back(std::move(fieldSpec));
    }

    return schema;
}

} // namespace recordc
