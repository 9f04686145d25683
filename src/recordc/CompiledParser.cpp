#include "recordc/CompiledParser.hpp"

#include "recordc/ErrorReporter.hpp"
#include "recordc/ResultDecoder.hpp"
#include "recordc/Workspace.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <mutex>
#include <utility>

namespace recordc {

CompiledParser::CompiledParser(std::unique_ptr<Workspace> workspace, fs::path artifactPath, ResolvedSchema schema,
        std::chrono::milliseconds timeout, std::shared_ptr<ErrorReporter> errorReporter):
        m_workspace(std::move(workspace)),
        m_artifactPath(std::move(artifactPath)),
        m_schema(std::move(schema)),
        m_timeout(timeout),
        m_errorReporter(std::move(errorReporter)),
        m_closed(false) {}

CompiledParser::~CompiledParser() {
    // By now the derived part is gone, so only the workspace is left to clean up.
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_closed = true;
    m_workspace.reset();
}

std::optional<ParsedRecord> CompiledParser::parse(std::string_view document) {
    return parse(document, *m_errorReporter);
}

std::optional<ParsedRecord> CompiledParser::parse(std::string_view document, ErrorReporter& errorReporter) {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (m_closed) {
        errorReporter.addError(Error::kParserClosed, fmt::format("parser for {} is closed", m_schema.name));
        return std::nullopt;
    }
    // argv and the generated parser both stop at the first NUL.
    auto nulOffset = document.find('\0');
    if (nulOffset != std::string_view::npos) {
        errorReporter.addError(Error::kInvalidDocument, fmt::format("document for {} contains a NUL byte at "
                "offset {}", m_schema.name, nulOffset));
        return std::nullopt;
    }

    auto output = run(document, errorReporter);
    if (!output) { return std::nullopt; }

    SPDLOG_DEBUG("Parser {} output: '{}'", m_schema.name, *output);
    return ResultDecoder::decode(*output, m_schema.fields, &errorReporter);
}

void CompiledParser::close() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (m_closed) { return; }

    SPDLOG_DEBUG("Closing parser {}", m_schema.name);
    shutdown();
    m_workspace.reset();
    m_closed = true;
}

bool CompiledParser::isClosed() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_closed;
}

fs::path CompiledParser::workspacePath() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (!m_workspace) { return fs::path(); }
    return m_workspace->path();
}

} // namespace recordc
