// pathfinder serves jump-to-definition over the Model Context Protocol on stdin/stdout, answering from a language
// server it starts and supervises.
//
//   pathfinder --extensions=rs --workspace=/path/to/project -- rust-analyzer
//   pathfinder --extensions=py,pyi -- pyright-langserver --stdio
//   pathfinder --config=pathfinder.json
#include "pathfinder/Config.hpp"
#include "pathfinder/ErrorReporter.hpp"
#include "pathfinder/PathfinderService.hpp"
#include "pathfinder/internal/BuildInfo.hpp"
#include "pathfinder/internal/FileSystem.hpp"
#include "server/ToolServer.hpp"

#include "fmt/format.h"
#include "gflags/gflags.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_sinks.h"
#include "spdlog/spdlog.h"

#include <memory>
#include <stdio.h>
#include <string>
#include <system_error>
#include <vector>

DEFINE_string(extensions, "", "Comma separated file extensions routed to the language server, e.g. 'py,pyi'.");
DEFINE_string(workspace, "", "Workspace base directory, defaults to the current directory.");
DEFINE_string(config, "", "Path to a JSON config file. Replaces --extensions and the language server command.");
DEFINE_string(logFile, "", "Path and file name of log file. Logs go to stderr if empty, never to stdout.");
DEFINE_string(logLevel, "info", "One of trace, debug, info, warn, error, critical, off.");
DEFINE_uint32(workerThreads, 2, "Number of threads answering tool calls.");

namespace {

void setupLogging() {
    std::shared_ptr<spdlog::logger> logger;
    if (FLAGS_logFile.empty()) {
        logger = spdlog::stderr_logger_mt("pathfinder");
    } else {
        logger = spdlog::basic_logger_mt("file", FLAGS_logFile);
    }

    auto level = spdlog::level::from_str(FLAGS_logLevel);
    if (level == spdlog::level::off && FLAGS_logLevel != "off") {
        fmt::print(stderr, "Unrecognized --logLevel '{}', using info.\n", FLAGS_logLevel);
        level = spdlog::level::info;
    }
    logger->set_level(level);
    logger->flush_on(level);
    spdlog::set_default_logger(logger);
}

} // namespace

int main(int argc, char* argv[]) {
    gflags::SetVersionString(pathfinder::kPathfinderVersion);
    gflags::SetUsageMessage("pathfinder [flags] -- <language server command> [arguments]");
    gflags::ParseCommandLineFlags(&argc, &argv, true);
    setupLogging();
    SPDLOG_INFO("pathfinder version {} ({} build).", pathfinder::kPathfinderVersion,
                pathfinder::kPathfinderBuildType);

    // Everything left after flag parsing is the language server command line.
    std::vector<std::string> command;
    for (int i = 1; i < argc; ++i) {
        if (command.empty() && std::string(argv[i]) == "--") {
            continue;
        }
        command.emplace_back(argv[i]);
    }

    auto errorReporter = std::make_shared<pathfinder::ErrorReporter>();
    pathfinder::Config config;
    if (!FLAGS_config.empty()) {
        if (!command.empty() || !FLAGS_extensions.empty()) {
            SPDLOG_WARN("--config given, ignoring --extensions and the command line language server.");
        }
        if (!config.readFile(FLAGS_config, errorReporter.get())) {
            SPDLOG_CRITICAL("Invalid config file {}: {}", FLAGS_config, errorReporter->lastErrorMessage());
            return 1;
        }
    } else if (!config.setFromFlags(FLAGS_extensions, command, errorReporter.get())) {
        SPDLOG_CRITICAL("Invalid language server settings: {}", errorReporter->lastErrorMessage());
        gflags::ShowUsageWithFlagsRestrict(argv[0], "pathfinder");
        return 1;
    }

    std::error_code error;
    auto currentPath = fs::current_path(error);
    if (error) {
        SPDLOG_CRITICAL("Failed to get current directory: {}", error.message());
        return 1;
    }
    fs::path workspaceBase = currentPath;
    if (!FLAGS_workspace.empty()) {
        workspaceBase = pathfinder::resolveDirectory(FLAGS_workspace, currentPath, error);
        if (error) {
            SPDLOG_CRITICAL("Failed to resolve workspace {}: {}", FLAGS_workspace, error.message());
            return 1;
        }
    }

    SPDLOG_INFO("Starting pathfinder in {} for extensions [{}] with command '{}'", workspaceBase.string(),
                fmt::join(config.server().extensions, ", "), fmt::join(config.server().command, " "));

    pathfinder::PathfinderService::Options options;
    options.workspaceBase = workspaceBase;
    auto service = std::make_shared<pathfinder::PathfinderService>(config, options);
    if (!service->start()) {
        SPDLOG_CRITICAL("Failed to start language server: {}", service->lastErrorMessage());
        return 1;
    }

    int returnCode = 0;
    {
        server::ToolServer toolServer(stdin, stdout, service, FLAGS_workerThreads);
        returnCode = toolServer.runLoop();
    }

    auto outcome = service->shutdown();
    if (outcome == pathfinder::LSPBridge::kKillFailed) {
        returnCode = returnCode ? returnCode : 1;
    }
    SPDLOG_INFO("pathfinder exiting with status {}.", returnCode);
    gflags::ShutDownCommandLineFlags();
    return returnCode;
}
