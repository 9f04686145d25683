#include "recordc/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <cassert>

namespace recordc {

Error::Family Error::family() const {
    if (code <= kSchemaFileInvalid) { return kSchema; }
    if (code <= kExternalBuildFailed) { return kBuild; }
    return kParse;
}

// static
std::string_view Error::codeName(Code code) {
    switch (code) {
    case kEmptyName: return "EmptyName";
    case kInvalidName: return "InvalidName";
    case kNoFields: return "NoFields";
    case kEmptyFieldName: return "EmptyFieldName";
    case kInvalidFieldName: return "InvalidFieldName";
    case kDuplicateFieldName: return "DuplicateFieldName";
    case kEmptyType: return "EmptyType";
    case kUnsupportedType: return "UnsupportedType";
    case kSchemaFileInvalid: return "SchemaFileInvalid";
    case kWorkspaceCreateFailed: return "WorkspaceCreateFailed";
    case kSourceWriteFailed: return "SourceWriteFailed";
    case kTemplateFailed: return "TemplateFailed";
    case kExternalBuildFailed: return "ExternalBuildFailed";
    case kInvalidDocument: return "InvalidDocument";
    case kProcessSpawnFailed: return "ProcessSpawnFailed";
    case kMalformedOutput: return "MalformedOutput";
    case kParseFailureSentinel: return "ParseFailureSentinel";
    case kTimedOut: return "TimedOut";
    case kParserClosed: return "ParserClosed";
    }
    return "Unknown";
}

ErrorReporter::ErrorReporter(bool suppress): m_suppress(suppress) {}

ErrorReporter::~ErrorReporter() {}

void ErrorReporter::addError(Error::Code code, std::string message, std::string output) {
    if (!m_suppress) {
        if (output.empty()) {
            spdlog::error("{}: {}", Error::codeName(code), message);
        } else {
            spdlog::error("{}: {}\nOutput: {}", Error::codeName(code), message, output);
        }
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_errors.emplace_back(Error{code, std::move(message), std::move(output)});
}

void ErrorReporter::addWorkspaceCreateError(std::string dirPath, std::string reason) {
    addError(Error::kWorkspaceCreateFailed, fmt::format("failed to create output directory '{}': {}", dirPath,
            reason));
}

void ErrorReporter::addSourceWriteError(std::string filePath) {
    addError(Error::kSourceWriteFailed, fmt::format("failed to write source file '{}'", filePath));
}

void ErrorReporter::addExternalBuildError(int exitStatus, std::string toolOutput) {
    addError(Error::kExternalBuildFailed, fmt::format("compilation failed with exit status {}", exitStatus),
            std::move(toolOutput));
}

size_t ErrorReporter::errorCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_errors.size();
}

std::vector<Error> ErrorReporter::errors() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_errors;
}

Error ErrorReporter::lastError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    assert(m_errors.size());
    return m_errors.back();
}

void ErrorReporter::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_errors.clear();
}

} // namespace recordc
