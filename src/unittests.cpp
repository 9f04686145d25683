#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include "spdlog/spdlog.h"

int main(int argc, char* argv[]) {
    // Parser tests run artifacts from several threads at once, so log the thread id.
    spdlog::set_pattern("[%H:%M:%S.%e] [%l] [thread %t] %v");
    spdlog::set_level(spdlog::level::debug);
    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
