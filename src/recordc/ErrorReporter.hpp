#ifndef SRC_RECORDC_ERROR_REPORTER_HPP_
#define SRC_RECORDC_ERROR_REPORTER_HPP_

#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace recordc {

struct Error {
    enum Family { kSchema, kBuild, kParse };

    enum Code : int {
        // Schema errors, detected before any code generation.
        kEmptyName,
        kInvalidName,
        kNoFields,
        kEmptyFieldName,
        kInvalidFieldName,
        kDuplicateFieldName,
        kEmptyType,
        kUnsupportedType,
        kSchemaFileInvalid,

        // Build errors, fatal to one build attempt.
        kWorkspaceCreateFailed,
        kSourceWriteFailed,
        kTemplateFailed,
        kExternalBuildFailed,

        // Parse errors, fatal to one parse call only.
        kInvalidDocument,
        kProcessSpawnFailed,
        kMalformedOutput,
        kParseFailureSentinel,
        kTimedOut,
        kParserClosed
    };

    Code code;
    std::string message;
    // Captured tool or artifact output, if any.
    std::string output;

    Family family() const;
    static std::string_view codeName(Code code);
};

// Collects errors from every stage of schema compilation and parsing. Thread-safe, so one reporter can be shared
// between concurrent parse calls on the same parser.
class ErrorReporter {
public:
    // If suppress is true, will not print reported errors to log (useful for testing failures without
    // polluting the log)
    ErrorReporter(bool suppress = false);
    ~ErrorReporter();

    void addError(Error::Code code, std::string message, std::string output = std::string());

    // Specific errors.

    // Fatal build error, unable to create the workspace or output directory at dirPath.
    void addWorkspaceCreateError(std::string dirPath, std::string reason);
    // Fatal build error, unable to write generated source to filePath.
    void addSourceWriteError(std::string filePath);
    // Fatal build error, compiler returned a non-zero status. Tool output attached.
    void addExternalBuildError(int exitStatus, std::string toolOutput);

    size_t errorCount() const;
    bool ok() const { return errorCount() == 0; }
    std::vector<Error> errors() const;
    // Returns a copy of the most recently reported error. Must not be called when ok() is true.
    Error lastError() const;
    void clear();

private:
    bool m_suppress;
    mutable std::mutex m_mutex;
    std::vector<Error> m_errors;
};

} // namespace recordc

#endif // SRC_RECORDC_ERROR_REPORTER_HPP_
