#ifndef SRC_RECORDC_BUILDER_HPP_
#define SRC_RECORDC_BUILDER_HPP_

#include "recordc/Schema.hpp"
#include "recordc/internal/FileSystem.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace recordc {

class CompiledParser;
class ErrorReporter;
class Workspace;

// Turns a RecordSchema into a ready-to-use CompiledParser: validates it, generates C source into a fresh workspace,
// runs the external C compiler on it and wraps the artifact in a parser handle of the configured strategy. Each
// build gets its own workspace, so builds may run concurrently from separate Builder objects.
class Builder {
public:
    enum class Strategy {
        kProcessPerCall, // One artifact process per parse() call.
        kWorker          // One long-lived artifact process per parser handle.
    };

    Builder();
    explicit Builder(std::shared_ptr<ErrorReporter> errorReporter);
    ~Builder();

    // Parameters to override before building, or leave at defaults.
    const std::vector<std::string>& compiler() const { return m_compiler; }
    void setCompiler(std::vector<std::string> compiler) { m_compiler = std::move(compiler); }
    // Splits command on whitespace, so it may carry its own arguments as in CC="ccache cc".
    void setCompiler(std::string_view command);

    const std::vector<std::string>& compilerFlags() const { return m_compilerFlags; }
    void setCompilerFlags(std::vector<std::string> flags) { m_compilerFlags = std::move(flags); }

    const fs::path& workspaceBase() const { return m_workspaceBase; }
    void setWorkspaceBase(fs::path base) { m_workspaceBase = std::move(base); }

    Strategy strategy() const { return m_strategy; }
    void setStrategy(Strategy strategy) { m_strategy = strategy; }

    // Per parse() call. Zero means no limit.
    std::chrono::milliseconds timeout() const { return m_timeout; }
    void setTimeout(std::chrono::milliseconds timeout) { m_timeout = timeout; }

    bool keepWorkspace() const { return m_keepWorkspace; }
    void setKeepWorkspace(bool keep) { m_keepWorkspace = keep; }

    std::shared_ptr<ErrorReporter> errorReporter() const { return m_errorReporter; }

    // Validates and generates code for schema, then writes <Name>.h and <Name>.c into outputDir, creating it if needed.
    bool writeSources(const RecordSchema& schema, const fs::path& outputDir);

    // Returns nullptr on failure, with the reason in the error reporter. Leaves no workspace behind on failure unless
    // keepWorkspace() is set.
    std::unique_ptr<CompiledParser> build(const RecordSchema& schema);

    static std::string artifactFileName(std::string_view recordName);
    static std::string driverFileName(std::string_view recordName, Strategy strategy);

protected:
    void setDefaults();
    // Splits generated code at the header end marker into header and implementation.
    bool splitGenerated(const ResolvedSchema& schema, const std::string& code, std::string& header,
            std::string& implementation);
    bool compile(Workspace* workspace, const ResolvedSchema& schema);

    std::shared_ptr<ErrorReporter> m_errorReporter;
    std::vector<std::string> m_compiler;
    std::vector<std::string> m_compilerFlags;
    fs::path m_workspaceBase;
    Strategy m_strategy;
    std::chrono::milliseconds m_timeout;
    bool m_keepWorkspace;
};

} // namespace recordc

#endif // SRC_RECORDC_BUILDER_HPP_
