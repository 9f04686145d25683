#ifndef SRC_RECORDC_VALIDATOR_HPP_
#define SRC_RECORDC_VALIDATOR_HPP_

#include "recordc/Schema.hpp"

#include <optional>
#include <string_view>

namespace recordc {

class ErrorReporter;

// Checks a RecordSchema before any code is generated for it. Rules are checked in a fixed order and the first
// violation is the one reported.
class Validator {
public:
    static bool validate(const RecordSchema& schema, ErrorReporter* errorReporter);
    // Re-checks an already resolved schema, for consumers that must not trust their input.
    static bool validate(const ResolvedSchema& schema, ErrorReporter* errorReporter);

    // Validates and then resolves every declared field type to a FieldKind.
    static std::optional<ResolvedSchema> resolve(const RecordSchema& schema, ErrorReporter* errorReporter);

    // True if name matches [A-Za-z_][A-Za-z0-9_]*
    static bool isIdentifier(std::string_view name);
};

} // namespace recordc

#endif // SRC_RECORDC_VALIDATOR_HPP_
