#include "recordc/WorkerParser.hpp"

#include "recordc/ErrorReporter.hpp"
#include "recordc/Workspace.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <charconv>
#include <utility>

namespace {
const std::chrono::milliseconds kShutdownGrace(500);
} // namespace

namespace recordc {

WorkerParser::WorkerParser(std::unique_ptr<Workspace> workspace, fs::path artifactPath, ResolvedSchema schema,
        std::chrono::milliseconds timeout, std::shared_ptr<ErrorReporter> errorReporter):
        CompiledParser(std::move(workspace), std::move(artifactPath), std::move(schema), timeout,
                std::move(errorReporter)) {}

WorkerParser::~WorkerParser() { close(); }

bool WorkerParser::start(ErrorReporter& errorReporter) {
    std::lock_guard<std::mutex> lock(m_workerMutex);
    if (m_worker.isRunning()) { return true; }

    std::string error;
    if (!m_worker.spawn({m_artifactPath.string()}, error)) {
        errorReporter.addError(Error::kProcessSpawnFailed, fmt::format("failed to start worker for {}: {}",
                m_schema.name, error));
        return false;
    }
    SPDLOG_INFO("Started worker for {} as pid {}", m_schema.name, m_worker.pid());
    return true;
}

pid_t WorkerParser::workerPid() const {
    std::lock_guard<std::mutex> lock(m_workerMutex);
    return m_worker.pid();
}

std::optional<std::string> WorkerParser::run(std::string_view document, ErrorReporter& errorReporter) {
    if (!start(errorReporter)) { return std::nullopt; }

    std::lock_guard<std::mutex> lock(m_workerMutex);
    auto deadline = m_timeout.count() > 0 ? std::chrono::steady_clock::now() + m_timeout
                                          : std::chrono::steady_clock::time_point::max();

    auto request = fmt::format("{}\n", document.size());
    request.append(document.data(), document.size());
    if (!m_worker.write(request)) {
        m_worker.terminate(std::chrono::milliseconds(0));
        errorReporter.addError(Error::kMalformedOutput, fmt::format("worker for {} exited before accepting input",
                m_schema.name));
        return std::nullopt;
    }

    return readFrame(deadline, errorReporter);
}

std::optional<std::string> WorkerParser::readFrame(std::chrono::steady_clock::time_point deadline,
        ErrorReporter& errorReporter) {
    std::string buffer;
    size_t newline = std::string::npos;
    while ((newline = buffer.find('\n')) == std::string::npos) {
        if (!readAtLeast(buffer, buffer.size() + 1, deadline, errorReporter)) { return std::nullopt; }
    }

    size_t length = 0;
    auto result = std::from_chars(buffer.data(), buffer.data() + newline, length);
    if (newline == 0 || result.ec != std::errc() || result.ptr != buffer.data() + newline) {
        m_worker.terminate(std::chrono::milliseconds(0));
        errorReporter.addError(Error::kMalformedOutput, fmt::format("worker for {} sent an invalid frame header",
                m_schema.name), std::move(buffer));
        return std::nullopt;
    }

    size_t frameSize = newline + 1 + length;
    if (!readAtLeast(buffer, frameSize, deadline, errorReporter)) { return std::nullopt; }
    if (buffer.size() > frameSize) {
        SPDLOG_WARN("Worker for {} sent {} unexpected bytes after its response", m_schema.name,
                buffer.size() - frameSize);
    }
    return buffer.substr(newline + 1, length);
}

bool WorkerParser::readAtLeast(std::string& buffer, size_t size, std::chrono::steady_clock::time_point deadline,
        ErrorReporter& errorReporter) {
    while (buffer.size() < size) {
        bool timedOut = false;
        if (m_worker.read(buffer, deadline, timedOut)) { continue; }

        m_worker.terminate(std::chrono::milliseconds(0));
        if (timedOut) {
            errorReporter.addError(Error::kTimedOut, fmt::format("worker for {} timed out after {} ms",
                    m_schema.name, m_timeout.count()), buffer);
        } else {
            errorReporter.addError(Error::kMalformedOutput, fmt::format("worker for {} exited mid-response",
                    m_schema.name), buffer);
        }
        return false;
    }
    return true;
}

void WorkerParser::shutdown() {
    std::lock_guard<std::mutex> lock(m_workerMutex);
    if (m_worker.isRunning()) {
        SPDLOG_INFO("Stopping worker for {}", m_schema.name);
    }
    m_worker.terminate(kShutdownGrace);
}

} // namespace recordc
