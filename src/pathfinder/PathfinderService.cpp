#include "pathfinder/PathfinderService.hpp"

#include "pathfinder/ErrorReporter.hpp"
#include "pathfinder/FileURI.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace pathfinder {

PathfinderService::PathfinderService(Config config, Options options):
    m_config(std::move(config)),
    m_options(std::move(options)),
    m_errorReporter(std::make_shared<ErrorReporter>()),
    m_documents(m_errorReporter),
    m_normalizer(m_errorReporter) {
    m_normalizer.setRetryDelay(m_options.retryDelay);
    m_normalizer.setMaxAttempts(m_options.maxAttempts);
}

PathfinderService::~PathfinderService() {
    if (running()) {
        SPDLOG_WARN("PathfinderService destroyed while the language server is running, shutting it down.");
        shutdown();
    }
}

bool PathfinderService::start() {
    std::lock_guard<std::mutex> documentsLock(m_documentsMutex);
    std::lock_guard<std::mutex> sessionLock(m_sessionMutex);
    m_errorReporter->reset();

    if (m_bridge) {
        m_errorReporter->addError(ErrorReporter::kProcess, "language server already started");
        return false;
    }
    if (!m_config.validate(m_errorReporter.get())) {
        return false;
    }
    if (!m_config.resolveRootDirectory(m_options.workspaceBase, m_workspace, m_errorReporter.get())) {
        return false;
    }

    LSPBridge::Options bridgeOptions;
    bridgeOptions.command = m_config.server().command;
    bridgeOptions.workspace = m_workspace;
    bridgeOptions.requestTimeout = m_options.requestTimeout;
    SPDLOG_INFO("Starting language server '{}' for extensions [{}] in {}", m_config.server().command.front(),
                fmt::join(m_config.server().extensions, ", "), m_workspace.string());
    m_bridge = LSPBridge::launch(std::move(bridgeOptions), m_errorReporter);
    return m_bridge != nullptr;
}

bool PathfinderService::definition(const lsp::DefinitionRequest& request, lsp::DefinitionResponse& response,
                                   std::string& errorMessage) {
    auto extension = extensionFromURI(request.uri);
    if (!extension || !m_config.hasExtension(*extension)) {
        errorMessage = fmt::format("no language server configured for extension '{}'", extension.value_or(""));
        return false;
    }

    std::unique_lock<std::mutex> documentsLock(m_documentsMutex);
    std::unique_lock<std::mutex> sessionLock(m_sessionMutex);
    m_errorReporter->reset();
    if (!m_bridge) {
        errorMessage = "definition failed: language server is not running";
        return false;
    }

    if (!m_documents.ensureOpen(*m_bridge, request.uri)) {
        SPDLOG_WARN("Failed to sync document {} before definition call", request.uri);
        errorMessage = fmt::format("failed to prepare document: {}", m_errorReporter->lastErrorMessage());
        return false;
    }
    documentsLock.unlock();

    if (!m_normalizer.execute(*m_bridge, request, response)) {
        errorMessage = fmt::format("definition failed: {}", m_errorReporter->lastErrorMessage());
        return false;
    }
    return true;
}

LSPBridge::ShutdownOutcome PathfinderService::shutdown() {
    std::lock_guard<std::mutex> documentsLock(m_documentsMutex);
    std::lock_guard<std::mutex> sessionLock(m_sessionMutex);
    m_errorReporter->reset();
    if (!m_bridge) {
        return LSPBridge::kExitedCleanly;
    }

    SPDLOG_INFO("Closing {} open documents and shutting down the language server.", m_documents.size());
    m_documents.closeAll(*m_bridge);
    auto outcome = LSPBridge::shutdown(std::move(m_bridge));
    if (outcome == LSPBridge::kKillFailed) {
        SPDLOG_ERROR("Failed to terminate the language server.");
    }
    return outcome;
}

bool PathfinderService::running() const {
    std::lock_guard<std::mutex> sessionLock(m_sessionMutex);
    return m_bridge != nullptr;
}

std::string PathfinderService::lastErrorMessage() const {
    std::lock_guard<std::mutex> sessionLock(m_sessionMutex);
    return m_errorReporter->lastErrorMessage();
}

} // namespace pathfinder
