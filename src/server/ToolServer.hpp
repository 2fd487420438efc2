#ifndef SRC_SERVER_TOOL_SERVER_HPP_
#define SRC_SERVER_TOOL_SERVER_HPP_

#include <memory>
#include <stdio.h>
#include <string>

namespace pathfinder {
class PathfinderService;
}

namespace server {

// Serves the Model Context Protocol over newline-delimited JSON-RPC. Lifecycle and discovery requests are answered on
// the reading thread, tool calls are handed to a pool of worker threads so a slow language server does not stall
// input. Every response is written as a single line under a lock.
class ToolServer {
public:
    static constexpr size_t kDefaultWorkerThreads = 2;

    ToolServer() = delete;
    // Non-owning stream pointers, same as the stdio streams they usually are.
    ToolServer(FILE* inputStream, FILE* outputStream, std::shared_ptr<pathfinder::PathfinderService> service,
               size_t workerThreads = kDefaultWorkerThreads);
    ~ToolServer();

    // The main run loop, returns an exit status code once the input stream ends and every accepted tool call has been
    // answered.
    int runLoop();

    enum ErrorCode : int {
        // Standardized JSON-RPC Error Codes
        kParseError = -32700,
        kInvalidRequest = -32600,
        kMethodNotFound = -32601,
        kInvalidParams = -32602,
        kInternalError = -32603,
    };

private:
    // pIMPL pattern to keep JSON headers from leaking into rest of server namespace.
    class ToolServerImpl;
    std::unique_ptr<ToolServerImpl> m_impl;
};

} // namespace server

#endif // SRC_SERVER_TOOL_SERVER_HPP_
