#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include "spdlog/sinks/stdout_sinks.h"
#include "spdlog/spdlog.h"

#include <csignal>

int main(int argc, char* argv[]) {
    // Tests write to language servers that are expected to die mid-conversation.
    std::signal(SIGPIPE, SIG_IGN);

    auto logger = spdlog::stderr_logger_mt("unittests");
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    int res = context.run();
    return res;
}
