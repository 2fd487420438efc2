#ifndef SRC_PATHFINDER_LSP_BRIDGE_HPP_
#define SRC_PATHFINDER_LSP_BRIDGE_HPP_

#include "pathfinder/internal/FileSystem.hpp"

#include "rapidjson/document.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace pathfinder {

class ChildProcess;
class ErrorReporter;
class FramedTransport;

// Owns one language server process and the framed transport over its stdin and stdout. Performs the initialize
// handshake, issues requests one at a time and correlates responses by id, and shuts the server down in the order the
// Language Server Protocol prescribes.
class LSPBridge {
public:
    static constexpr std::chrono::milliseconds kDefaultRequestTimeout = std::chrono::milliseconds(15000);

    struct Options {
        // Executable followed by its arguments.
        std::vector<std::string> command;
        // Working directory of the server and the root of the workspace announced to it.
        fs::path workspace;
        // Bounds every request, measured from the start of the call. Also bounds the wait for exit during shutdown.
        std::chrono::milliseconds requestTimeout = kDefaultRequestTimeout;
    };

    enum ShutdownOutcome {
        // The server answered shutdown and exited by itself.
        kExitedCleanly,
        // The server had to be killed.
        kKilled,
        // The kill signal could not be delivered.
        kKillFailed,
    };

    LSPBridge() = delete;
    LSPBridge(const LSPBridge&) = delete;
    LSPBridge& operator=(const LSPBridge&) = delete;
    ~LSPBridge();

    // Spawns the server and performs the initialize handshake. On any failure the child is killed, the error is
    // reported to |errorReporter|, and nullptr is returned.
    static std::unique_ptr<LSPBridge> launch(Options options, std::shared_ptr<ErrorReporter> errorReporter);

    // Consumes |bridge|. Sends shutdown, then exit, then waits for the process, killing it if any step fails. The
    // process has terminated and been reaped on return unless the outcome is kKillFailed.
    static ShutdownOutcome shutdown(std::unique_ptr<LSPBridge> bridge);

    // Sends a request and blocks for its response. On success |result| holds a copy of the response's result member.
    // Notifications and responses to other ids that arrive in the meantime are discarded. Writing the request counts
    // against the same timeout as waiting for its response.
    bool request(std::string_view method, const rapidjson::Value& params, rapidjson::Document& result);
    // Fails with a kTimeout error if the server does not accept the whole message within the request timeout.
    bool notify(std::string_view method, const rapidjson::Value& params);

    // The id the next request will carry. Starts at 1 and is never reused.
    int64_t nextRequestId() const { return m_nextRequestId; }
    pid_t pid() const;
    const fs::path& workspace() const { return m_options.workspace; }
    std::chrono::milliseconds requestTimeout() const { return m_options.requestTimeout; }
    std::shared_ptr<ErrorReporter> errorReporter() const { return m_errorReporter; }

private:
    LSPBridge(Options options, std::shared_ptr<ErrorReporter> errorReporter);

    bool start();
    bool initialize();
    bool sendMessage(const rapidjson::Document& message, std::chrono::steady_clock::time_point deadline);

    Options m_options;
    std::shared_ptr<ErrorReporter> m_errorReporter;
    std::unique_ptr<ChildProcess> m_process;
    std::unique_ptr<FramedTransport> m_transport;
    int64_t m_nextRequestId;
};

} // namespace pathfinder

#endif // SRC_PATHFINDER_LSP_BRIDGE_HPP_
