#ifndef SRC_RECORDC_SCHEMA_FILE_HPP_
#define SRC_RECORDC_SCHEMA_FILE_HPP_

#include "recordc/Schema.hpp"
#include "recordc/internal/FileSystem.hpp"

#include <optional>
#include <string_view>

namespace recordc {

class ErrorReporter;

// Reads a record schema declaration from JSON:
//   {"name": "Student", "fields": [{"name": "first_name", "type": "string"}, ...]}
// Field names and types are taken as given, so an absent type comes back empty for the Validator to reject. Anything
// structurally wrong with the document is reported as kSchemaFileInvalid.
class SchemaFile {
public:
    static std::optional<RecordSchema> load(const fs::path& filePath, ErrorReporter* errorReporter);
    static std::optional<RecordSchema> parse(std::string_view json, ErrorReporter* errorReporter);
};

} // namespace recordc

#endif // SRC_RECORDC_SCHEMA_FILE_HPP_
