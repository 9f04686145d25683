#ifndef SRC_RECORDC_COMPILED_PARSER_HPP_
#define SRC_RECORDC_COMPILED_PARSER_HPP_

#include "recordc/Schema.hpp"
#include "recordc/Value.hpp"
#include "recordc/internal/FileSystem.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace recordc {

class ErrorReporter;
class Workspace;

// A handle to a built artifact that parses JSON documents of one record schema. Owns the artifact's workspace, which
// is deleted on close() or destruction. parse() may be called concurrently from many threads. close() waits for
// parses in flight to finish, after which every parse() fails with kParserClosed.
class CompiledParser {
public:
    CompiledParser() = delete;
    virtual ~CompiledParser();

    // Reports errors to the reporter given to the Builder.
    std::optional<ParsedRecord> parse(std::string_view document);
    // Reports errors to errorReporter, for callers that want errors of their own parse calls only. A document holding a
    // NUL byte fails with kInvalidDocument before anything is run.
    std::optional<ParsedRecord> parse(std::string_view document, ErrorReporter& errorReporter);

    // Stops any backing process and deletes the workspace, unless it was kept. Idempotent. Derived destructors call
    // this, as shutdown() can no longer be reached from the base destructor.
    void close();
    bool isClosed() const;

    const ResolvedSchema& schema() const { return m_schema; }
    const fs::path& artifactPath() const { return m_artifactPath; }
    fs::path workspacePath() const;
    std::chrono::milliseconds timeout() const { return m_timeout; }

protected:
    CompiledParser(std::unique_ptr<Workspace> workspace, fs::path artifactPath, ResolvedSchema schema,
            std::chrono::milliseconds timeout, std::shared_ptr<ErrorReporter> errorReporter);

    // Runs the artifact on document and returns its raw output, or reports an error and returns nullopt. Called with
    // the shared lock held, so may run concurrently with itself.
    virtual std::optional<std::string> run(std::string_view document, ErrorReporter& errorReporter) = 0;
    // Called once from close() with the exclusive lock held.
    virtual void shutdown() = 0;

    std::unique_ptr<Workspace> m_workspace;
    fs::path m_artifactPath;
    ResolvedSchema m_schema;
    std::chrono::milliseconds m_timeout;
    std::shared_ptr<ErrorReporter> m_errorReporter;

private:
    mutable std::shared_mutex m_mutex;
    bool m_closed;
};

} // namespace recordc

#endif // SRC_RECORDC_COMPILED_PARSER_HPP_
