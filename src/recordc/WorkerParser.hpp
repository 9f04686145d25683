#ifndef SRC_RECORDC_WORKER_PARSER_HPP_
#define SRC_RECORDC_WORKER_PARSER_HPP_

#include "recordc/CompiledParser.hpp"
#include "recordc/internal/Process.hpp"

#include <mutex>

namespace recordc {

// Keeps one artifact process alive and sends it length-framed documents over its stdin. Requests to the worker are
// serialized. A worker that dies or times out is restarted on the next call.
class WorkerParser : public CompiledParser {
public:
    WorkerParser(std::unique_ptr<Workspace> workspace, fs::path artifactPath, ResolvedSchema schema,
            std::chrono::milliseconds timeout, std::shared_ptr<ErrorReporter> errorReporter);
    ~WorkerParser() override;

    // Spawns the worker. Reports kProcessSpawnFailed on failure.
    bool start(ErrorReporter& errorReporter);
    pid_t workerPid() const;

protected:
    std::optional<std::string> run(std::string_view document, ErrorReporter& errorReporter) override;
    void shutdown() override;

private:
    // Reads from the worker until buffer holds at least size bytes.
    bool readAtLeast(std::string& buffer, size_t size, std::chrono::steady_clock::time_point deadline,
            ErrorReporter& errorReporter);
    std::optional<std::string> readFrame(std::chrono::steady_clock::time_point deadline,
            ErrorReporter& errorReporter);

    mutable std::mutex m_workerMutex;
    ChildProcess m_worker;
};

} // namespace recordc

#endif // SRC_RECORDC_WORKER_PARSER_HPP_
