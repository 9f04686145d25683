#include "recordc/ProcessParser.hpp"

#include "recordc/ErrorReporter.hpp"
#include "recordc/ResultDecoder.hpp"
#include "recordc/Workspace.hpp"
#include "recordc/internal/Process.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <utility>

namespace recordc {

ProcessParser::ProcessParser(std::unique_ptr<Workspace> workspace, fs::path artifactPath, ResolvedSchema schema,
        std::chrono::milliseconds timeout, std::shared_ptr<ErrorReporter> errorReporter):
        CompiledParser(std::move(workspace), std::move(artifactPath), std::move(schema), timeout,
                std::move(errorReporter)) {}

ProcessParser::~ProcessParser() { close(); }

std::optional<std::string> ProcessParser::run(std::string_view document, ErrorReporter& errorReporter) {
    auto result = runProcess({m_artifactPath.string(), std::string(document)}, m_timeout);
    if (!result.spawned) {
        errorReporter.addError(Error::kProcessSpawnFailed, fmt::format("failed to run parser for {}: {}",
                m_schema.name, result.spawnError));
        return std::nullopt;
    }
    if (result.timedOut) {
        errorReporter.addError(Error::kTimedOut, fmt::format("parser for {} timed out after {} ms", m_schema.name,
                m_timeout.count()), std::move(result.output));
        return std::nullopt;
    }

    // The artifact exits non-zero after printing the failure sentinel, which the decoder reports. Any other non-zero
    // exit means it crashed or printed something unexpected.
    if (result.exitStatus != 0 && result.output.find(ResultDecoder::kFailureSentinel) == std::string::npos) {
        errorReporter.addError(Error::kMalformedOutput, fmt::format("parser for {} exited with status {}",
                m_schema.name, result.exitStatus), std::move(result.output));
        return std::nullopt;
    }

    return std::move(result.output);
}

} // namespace recordc
