#ifndef SRC_RECORDC_CODE_GENERATOR_HPP_
#define SRC_RECORDC_CODE_GENERATOR_HPP_

#include "recordc/Schema.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace recordc {

class ErrorReporter;

// Renders a ResolvedSchema into C source: a header with the record struct, followed by an implementation of a flat
// single-pass JSON object parser and a serializer that prints the SUCCESS|v1|...|vN line.
class CodeGenerator {
public:
    CodeGenerator() = delete;
    explicit CodeGenerator(std::shared_ptr<ErrorReporter> errorReporter);
    ~CodeGenerator() = default;

    // Returns the header text immediately followed by the implementation text, split-able at headerEndMarker().
    // Refuses schemas that would not pass validation.
    std::optional<std::string> generate(const ResolvedSchema& schema);

    enum DriverKind { kProcessDriver, kWorkerDriver };
    std::optional<std::string> generateDriver(const ResolvedSchema& schema, DriverKind driverKind);

    static std::string headerFileName(std::string_view recordName);
    static std::string implementationFileName(std::string_view recordName);
    static std::string headerEndMarker(std::string_view recordName);

    // Struct member name for each field, in field order. A field named after a C keyword or a macro the generated code
    // sees gets a trailing underscore, or more than one if that name is taken. The JSON key is unchanged.
    static std::vector<std::string> memberNames(const ResolvedSchema& schema);

private:
    std::string renderHeader(const ResolvedSchema& schema);
    std::string renderImplementation(const ResolvedSchema& schema);

    std::shared_ptr<ErrorReporter> m_errorReporter;
};

} // namespace recordc

#endif // SRC_RECORDC_CODE_GENERATOR_HPP_
