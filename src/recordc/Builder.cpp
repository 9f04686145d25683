#include "recordc/Builder.hpp"

#include "recordc/CodeGenerator.hpp"
#include "recordc/CompiledParser.hpp"
#include "recordc/ErrorReporter.hpp"
#include "recordc/Hash.hpp"
#include "recordc/ProcessParser.hpp"
#include "recordc/Validator.hpp"
#include "recordc/WorkerParser.hpp"
#include "recordc/Workspace.hpp"
#include "recordc/internal/Process.hpp"

#include "fmt/format.h"
#include "fmt/ranges.h"
#include "spdlog/spdlog.h"

#include <cstdlib>
#include <system_error>

namespace {

const char* kDefaultCompiler = "cc";

std::vector<std::string> splitCommand(std::string_view command) {
    std::vector<std::string> words;
    size_t start = 0;
    while (start < command.size()) {
        auto begin = command.find_first_not_of(" \t\n", start);
        if (begin == std::string_view::npos) { break; }
        auto end = command.find_first_of(" \t\n", begin);
        if (end == std::string_view::npos) { end = command.size(); }
        words.emplace_back(command.substr(begin, end - begin));
        start = end;
    }
    return words;
}

} // namespace

namespace recordc {

Builder::Builder(): m_errorReporter(std::make_shared<ErrorReporter>()) { setDefaults(); }

Builder::Builder(std::shared_ptr<ErrorReporter> errorReporter): m_errorReporter(std::move(errorReporter)) {
    setDefaults();
}

Builder::~Builder() {}

void Builder::setDefaults() {
    const char* cc = std::getenv("CC");
    setCompiler(cc ? std::string_view(cc) : std::string_view());
    m_compilerFlags = {"-std=c99", "-O2"};
    m_workspaceBase = defaultWorkspaceBase();
    m_strategy = Strategy::kProcessPerCall;
    m_timeout = std::chrono::milliseconds(0);
    m_keepWorkspace = false;
}

void Builder::setCompiler(std::string_view command) {
    m_compiler = splitCommand(command);
    if (m_compiler.empty()) {
        m_compiler.emplace_back(kDefaultCompiler);
    }
}

bool Builder::writeSources(const RecordSchema& schema, const fs::path& outputDir) {
    auto resolved = Validator::resolve(schema, m_errorReporter.get());
    if (!resolved) { return false; }

    CodeGenerator generator(m_errorReporter);
    auto code = generator.generate(*resolved);
    if (!code) { return false; }

    std::string header;
    std::string implementation;
    if (!splitGenerated(*resolved, *code, header, implementation)) { return false; }

    std::error_code ec;
    fs::create_directories(outputDir, ec);
    if (ec) {
        m_errorReporter->addWorkspaceCreateError(outputDir.string(), ec.message());
        return false;
    }

    auto headerPath = outputDir / CodeGenerator::headerFileName(resolved->name);
    if (!writeFile(headerPath, header)) {
        m_errorReporter->addSourceWriteError(headerPath.string());
        return false;
    }
    auto implementationPath = outputDir / CodeGenerator::implementationFileName(resolved->name);
    if (!writeFile(implementationPath, implementation)) {
        m_errorReporter->addSourceWriteError(implementationPath.string());
        return false;
    }

    SPDLOG_INFO("Wrote sources for {} to '{}'", resolved->name, outputDir.string());
    return true;
}

std::unique_ptr<CompiledParser> Builder::build(const RecordSchema& schema) {
    SPDLOG_INFO("Building parser for record {}", schema.name);
    auto resolved = Validator::resolve(schema, m_errorReporter.get());
    if (!resolved) { return nullptr; }

    CodeGenerator generator(m_errorReporter);
    auto code = generator.generate(*resolved);
    if (!code) { return nullptr; }
    std::string header;
    std::string implementation;
    if (!splitGenerated(*resolved, *code, header, implementation)) { return nullptr; }

    auto driverKind = m_strategy == Strategy::kWorker ? CodeGenerator::kWorkerDriver : CodeGenerator::kProcessDriver;
    auto driver = generator.generateDriver(*resolved, driverKind);
    if (!driver) { return nullptr; }

    auto prefix = fmt::format("recordc-{}-{:08x}-", resolved->name, fingerprint(schema));
    auto workspace = Workspace::create(m_workspaceBase, prefix, m_errorReporter.get());
    if (!workspace) { return nullptr; }
    workspace->setKeep(m_keepWorkspace);

    if (!workspace->writeFile(CodeGenerator::headerFileName(resolved->name), header, m_errorReporter.get())
            || !workspace->writeFile(CodeGenerator::implementationFileName(resolved->name), implementation,
                    m_errorReporter.get())
            || !workspace->writeFile(driverFileName(resolved->name, m_strategy), *driver, m_errorReporter.get())) {
        return nullptr;
    }
    SPDLOG_DEBUG("Wrote sources for {} to workspace '{}'", resolved->name, workspace->path().string());

    if (!compile(workspace.get(), *resolved)) { return nullptr; }

    auto artifactPath = workspace->filePath(artifactFileName(resolved->name));
    if (m_strategy == Strategy::kProcessPerCall) {
        return std::make_unique<ProcessParser>(std::move(workspace), std::move(artifactPath), std::move(*resolved),
                m_timeout, m_errorReporter);
    }

    auto parser = std::make_unique<WorkerParser>(std::move(workspace), std::move(artifactPath),
            std::move(*resolved), m_timeout, m_errorReporter);
    if (!parser->start(*m_errorReporter)) { return nullptr; }
    return parser;
}

// static
std::string Builder::artifactFileName(std::string_view recordName) {
    return fmt::format("parser_{}", recordName);
}

// static
std::string Builder::driverFileName(std::string_view recordName, Strategy strategy) {
    if (strategy == Strategy::kWorker) {
        return fmt::format("worker_{}.c", recordName);
    }
    return fmt::format("main_{}.c", recordName);
}

bool Builder::splitGenerated(const ResolvedSchema& schema, const std::string& code, std::string& header,
        std::string& implementation) {
    auto marker = CodeGenerator::headerEndMarker(schema.name);
    auto position = code.find(marker);
    if (position == std::string::npos) {
        m_errorReporter->addError(Error::kTemplateFailed, fmt::format("generated code for {} is missing the "
                "header end marker", schema.name));
        return false;
    }
    header = code.substr(0, position + marker.size());
    implementation = code.substr(position + marker.size());
    return true;
}

bool Builder::compile(Workspace* workspace, const ResolvedSchema& schema) {
    auto artifact = artifactFileName(schema.name);
    std::vector<std::string> arguments(m_compiler);
    arguments.insert(arguments.end(), m_compilerFlags.begin(), m_compilerFlags.end());
    arguments.emplace_back("-o");
    arguments.emplace_back(workspace->filePath(artifact).string());
    arguments.emplace_back(workspace->filePath(CodeGenerator::implementationFileName(schema.name)).string());
    arguments.emplace_back(workspace->filePath(driverFileName(schema.name, m_strategy)).string());

    SPDLOG_INFO("Compiling parser for {}: {}", schema.name, fmt::join(arguments, " "));
    auto result = runProcess(arguments, std::chrono::milliseconds(0));
    if (!result.spawned) {
        m_errorReporter->addError(Error::kExternalBuildFailed, fmt::format("failed to run compiler: {}",
                result.spawnError));
        return false;
    }
    if (result.exitStatus != 0) {
        m_errorReporter->addExternalBuildError(result.exitStatus, std::move(result.output));
        return false;
    }
    if (!result.output.empty()) {
        SPDLOG_DEBUG("Compiler output for {}: {}", schema.name, result.output);
    }

    workspace->trackFile(artifact);
    return true;
}

} // namespace recordc
