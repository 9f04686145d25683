// recordc, compiles a record schema into a native JSON parser and parses documents with it
#include "recordc/Builder.hpp"
#include "recordc/CompiledParser.hpp"
#include "recordc/ErrorReporter.hpp"
#include "recordc/RecordDumpJSON.hpp"
#include "recordc/SchemaFile.hpp"

#include "gflags/gflags.h"
#include "spdlog/spdlog.h"

#include <chrono>
#include <iostream>
#include <memory>

DEFINE_string(schemaFile, "", "Path to the JSON record schema declaration.");
DEFINE_string(strategy, "process", "Parser strategy, either 'process' (one process per document) or 'worker' "
        "(one long-lived process).");
DEFINE_string(compiler, "", "C compiler command, defaults to $CC or cc.");
DEFINE_int32(timeoutMs, 0, "Per-document parse timeout in milliseconds, 0 for none.");
DEFINE_bool(keepWorkspace, false, "Keep the build workspace after exit, for inspecting generated code.");
DEFINE_string(emitSources, "", "If set, only write the generated header and implementation into this directory.");
DEFINE_string(logLevel, "warn", "Log level, one of trace, debug, info, warn, error, critical, off.");

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("recordc --schemaFile=<path> [options] <json document>...");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    spdlog::set_level(spdlog::level::from_str(FLAGS_logLevel));

    if (FLAGS_schemaFile.empty()) {
        std::cerr << "recordc: --schemaFile is required" << std::endl;
        return 1;
    }

    auto errorReporter = std::make_shared<recordc::ErrorReporter>();
    auto schema = recordc::SchemaFile::load(FLAGS_schemaFile, errorReporter.get());
    if (!schema) { return 1; }

    recordc::Builder builder(errorReporter);
    if (!FLAGS_compiler.empty()) {
        builder.setCompiler(FLAGS_compiler);
    }
    if (FLAGS_strategy == "worker") {
        builder.setStrategy(recordc::Builder::Strategy::kWorker);
    } else if (FLAGS_strategy != "process") {
        std::cerr << "recordc: unknown strategy '" << FLAGS_strategy << "'" << std::endl;
        return 1;
    }
    if (FLAGS_timeoutMs < 0) {
        std::cerr << "recordc: --timeoutMs must not be negative" << std::endl;
        return 1;
    }
    builder.setTimeout(std::chrono::milliseconds(FLAGS_timeoutMs));
    builder.setKeepWorkspace(FLAGS_keepWorkspace);

    if (!FLAGS_emitSources.empty()) {
        return builder.writeSources(*schema, FLAGS_emitSources) ? 0 : 1;
    }

    auto parser = builder.build(*schema);
    if (!parser) { return 1; }

    int status = 0;
    recordc::RecordDumpJSON dumper;
    for (int i = 1; i < argc; ++i) {
        auto record = parser->parse(argv[i]);
        if (!record) {
            status = 1;
            continue;
        }
        dumper.dump(parser->schema(), *record, false);
        std::cout << dumper.json() << std::endl;
    }

    parser->close();
    return status;
}
