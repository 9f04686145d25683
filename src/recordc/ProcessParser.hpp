#ifndef SRC_RECORDC_PROCESS_PARSER_HPP_
#define SRC_RECORDC_PROCESS_PARSER_HPP_

#include "recordc/CompiledParser.hpp"

namespace recordc {

// Runs the artifact once per parse() call, passing the document as its only argument.
class ProcessParser : public CompiledParser {
public:
    ProcessParser(std::unique_ptr<Workspace> workspace, fs::path artifactPath, ResolvedSchema schema,
            std::chrono::milliseconds timeout, std::shared_ptr<ErrorReporter> errorReporter);
    ~ProcessParser() override;

protected:
    std::optional<std::string> run(std::string_view document, ErrorReporter& errorReporter) override;
    void shutdown() override {}
};

} // namespace recordc

#endif // SRC_RECORDC_PROCESS_PARSER_HPP_
