#ifndef SRC_PATHFINDER_PATHFINDER_SERVICE_HPP_
#define SRC_PATHFINDER_PATHFINDER_SERVICE_HPP_

#include "pathfinder/Config.hpp"
#include "pathfinder/DefinitionNormalizer.hpp"
#include "pathfinder/DocumentSynchronizer.hpp"
#include "pathfinder/LSPBridge.hpp"
#include "pathfinder/LSPTypes.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace pathfinder {

class ErrorReporter;

// Answers definition queries against one language server. Holds the document synchronizer and the bridge behind
// separate mutexes, always taken documents first, so concurrent callers are serialized on the session and never
// pipeline requests to the server.
class PathfinderService {
public:
    struct Options {
        // Relative root directories in the config are resolved against this.
        fs::path workspaceBase;
        std::chrono::milliseconds requestTimeout = LSPBridge::kDefaultRequestTimeout;
        std::chrono::milliseconds retryDelay = DefinitionNormalizer::kDefaultRetryDelay;
        // Definition queries answered with no targets are asked again up to this many times in total.
        int maxAttempts = DefinitionNormalizer::kDefaultMaxAttempts;
    };

    PathfinderService() = delete;
    PathfinderService(Config config, Options options);
    PathfinderService(const PathfinderService&) = delete;
    PathfinderService& operator=(const PathfinderService&) = delete;
    // Shuts down the language server if still running.
    ~PathfinderService();

    // Resolves the workspace and launches the language server. On failure the reason is available from
    // lastErrorMessage().
    bool start();

    // Synchronizes the document named by |request| and looks up its definition. On failure |errorMessage| holds a
    // description fit for the calling agent.
    bool definition(const lsp::DefinitionRequest& request, lsp::DefinitionResponse& response,
                    std::string& errorMessage);

    // Closes all open documents and then shuts down the language server. Safe to call more than once.
    LSPBridge::ShutdownOutcome shutdown();

    bool running() const;
    std::string lastErrorMessage() const;
    const Config& config() const { return m_config; }
    // The canonical workspace the server was started in, empty before start().
    const fs::path& workspace() const { return m_workspace; }

private:
    Config m_config;
    Options m_options;
    fs::path m_workspace;

    // Shared by every component below, reset at the start of each operation with both locks held.
    std::shared_ptr<ErrorReporter> m_errorReporter;

    // Guards m_documents. Always acquired before m_sessionMutex.
    std::mutex m_documentsMutex;
    DocumentSynchronizer m_documents;

    // Guards m_bridge, m_normalizer, and m_errorReporter.
    mutable std::mutex m_sessionMutex;
    std::unique_ptr<LSPBridge> m_bridge;
    DefinitionNormalizer m_normalizer;
};

} // namespace pathfinder

#endif // SRC_PATHFINDER_PATHFINDER_SERVICE_HPP_
