#include "pathfinder/LSPBridge.hpp"

#include "pathfinder/ChildProcess.hpp"
#include "pathfinder/ErrorReporter.hpp"
#include "pathfinder/FileURI.hpp"
#include "pathfinder/FramedTransport.hpp"

#include "fmt/format.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"
#include "spdlog/spdlog.h"

#include <string>
#include <unistd.h>

namespace {

std::string serialize(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

// LSP allows ids to be either numbers or strings, so both spellings of our integer id match.
bool matchesId(const rapidjson::Value& candidate, int64_t id) {
    if (candidate.IsInt64()) {
        return candidate.GetInt64() == id;
    }
    if (candidate.IsString()) {
        return std::string_view(candidate.GetString(), candidate.GetStringLength()) == std::to_string(id);
    }
    return false;
}

rapidjson::Value makeString(std::string_view string, rapidjson::Document::AllocatorType& allocator) {
    return rapidjson::Value(string.data(), static_cast<rapidjson::SizeType>(string.size()), allocator);
}

} // namespace

namespace pathfinder {

LSPBridge::LSPBridge(Options options, std::shared_ptr<ErrorReporter> errorReporter):
    m_options(std::move(options)),
    m_errorReporter(std::move(errorReporter)),
    m_process(std::make_unique<ChildProcess>(m_errorReporter)),
    m_nextRequestId(1) {}

LSPBridge::~LSPBridge() {}

std::unique_ptr<LSPBridge> LSPBridge::launch(Options options, std::shared_ptr<ErrorReporter> errorReporter) {
    std::unique_ptr<LSPBridge> bridge(new LSPBridge(std::move(options), std::move(errorReporter)));
    if (!bridge->start()) {
        return nullptr;
    }
    if (!bridge->initialize()) {
        SPDLOG_ERROR("Language server '{}' failed to initialize, killing it.", bridge->m_options.command.front());
        bridge->m_process->kill();
        return nullptr;
    }
    return bridge;
}

LSPBridge::ShutdownOutcome LSPBridge::shutdown(std::unique_ptr<LSPBridge> bridge) {
    if (!bridge) {
        return kExitedCleanly;
    }
    SPDLOG_DEBUG("Initiating graceful LSP shutdown of process {}", bridge->pid());
    auto& process = *bridge->m_process;

    rapidjson::Document result;
    if (!bridge->request("shutdown", rapidjson::Value(), result)) {
        SPDLOG_WARN("LSP shutdown request failed, forcing kill.");
        return process.kill() ? kKilled : kKillFailed;
    }

    if (!bridge->notify("exit", rapidjson::Value())) {
        SPDLOG_WARN("Failed to send LSP exit notification, will still wait for process.");
    }
    // Servers that wait for end of input before exiting see it now.
    process.closeStdin();

    switch (process.waitForExit(bridge->m_options.requestTimeout)) {
    case ChildProcess::kExited:
        SPDLOG_DEBUG("LSP server exited cleanly.");
        return kExitedCleanly;

    case ChildProcess::kTimedOut:
        SPDLOG_WARN("Timed out after {}ms waiting for LSP to exit, forcing kill.",
                    bridge->m_options.requestTimeout.count());
        break;

    case ChildProcess::kWaitError:
        SPDLOG_WARN("Error waiting for LSP process, forcing kill.");
        break;
    }

    return process.kill() ? kKilled : kKillFailed;
}

bool LSPBridge::request(std::string_view method, const rapidjson::Value& params, rapidjson::Document& result) {
    auto deadline = FramedTransport::Clock::now() + m_options.requestTimeout;
    int64_t id = m_nextRequestId++;

    rapidjson::Document message;
    message.SetObject();
    auto& allocator = message.GetAllocator();
    message.AddMember("jsonrpc", rapidjson::Value("2.0"), allocator);
    message.AddMember("id", rapidjson::Value(id), allocator);
    message.AddMember("method", makeString(method, allocator), allocator);
    message.AddMember("params", rapidjson::Value(params, allocator), allocator);
    SPDLOG_TRACE("Sending request {} '{}'", id, method);
    if (!sendMessage(message, deadline)) {
        return false;
    }

    while (true) {
        rapidjson::Document response;
        switch (m_transport->read(response, deadline)) {
        case FramedTransport::kMessage:
            break;

        case FramedTransport::kTimedOut:
            m_errorReporter->addTimeoutError(method, m_options.requestTimeout);
            return false;

        case FramedTransport::kEndOfStream:
            m_errorReporter->addError(ErrorReporter::kProcess,
                                      fmt::format("LSP server terminated unexpectedly before responding to '{}'",
                                                  method));
            return false;

        case FramedTransport::kFramingError:
            return false;
        }

        if (!response.IsObject()) {
            SPDLOG_WARN("Received unexpected non-object message from LSP server: {}", serialize(response));
            continue;
        }

        auto idMember = response.FindMember("id");
        if (idMember == response.MemberEnd()) {
            auto methodMember = response.FindMember("method");
            SPDLOG_TRACE("Discarding notification {}",
                         methodMember != response.MemberEnd() && methodMember->value.IsString() ?
                             methodMember->value.GetString() :
                             "<no method>");
            continue;
        }

        // Requests initiated by the server carry their own ids, which may collide with ours.
        if (response.HasMember("method")) {
            SPDLOG_DEBUG("Discarding server request '{}'", serialize(response["method"]));
            continue;
        }

        if (!matchesId(idMember->value, id)) {
            SPDLOG_DEBUG("Skipping response for different id {} while waiting for {}", serialize(idMember->value), id);
            continue;
        }

        auto resultMember = response.FindMember("result");
        if (resultMember != response.MemberEnd()) {
            result.CopyFrom(resultMember->value, result.GetAllocator());
            SPDLOG_TRACE("Received response to request {} '{}'", id, method);
            return true;
        }

        auto errorMember = response.FindMember("error");
        if (errorMember != response.MemberEnd()) {
            m_errorReporter->addRemoteError(method, serialize(errorMember->value));
            return false;
        }

        m_errorReporter->addError(ErrorReporter::kProtocol,
                                  fmt::format("invalid LSP response for '{}': missing both result and error fields",
                                              method));
        return false;
    }
}

bool LSPBridge::notify(std::string_view method, const rapidjson::Value& params) {
    rapidjson::Document message;
    message.SetObject();
    auto& allocator = message.GetAllocator();
    message.AddMember("jsonrpc", rapidjson::Value("2.0"), allocator);
    message.AddMember("method", makeString(method, allocator), allocator);
    message.AddMember("params", rapidjson::Value(params, allocator), allocator);
    SPDLOG_TRACE("Sending notification '{}'", method);
    return sendMessage(message, FramedTransport::Clock::now() + m_options.requestTimeout);
}

pid_t LSPBridge::pid() const { return m_process->pid(); }

bool LSPBridge::start() {
    if (m_options.command.empty()) {
        m_errorReporter->addError(ErrorReporter::kConfiguration, "language server command is empty");
        return false;
    }
    m_options.workspace = fs::absolute(m_options.workspace);

    SPDLOG_DEBUG("Spawning LSP child process '{}' with {} arguments", m_options.command.front(),
                 m_options.command.size() - 1);
    if (!m_process->spawn(m_options.command, m_options.workspace)) {
        return false;
    }
    m_transport = std::make_unique<FramedTransport>(m_process->stdoutFd(), m_process->stdinFd(), m_errorReporter);
    return true;
}

bool LSPBridge::initialize() {
    auto rootURI = pathToURI(m_options.workspace, true);
    auto workspaceName = directoryName(m_options.workspace);
    if (workspaceName.empty()) {
        workspaceName = "workspace";
    }

    rapidjson::Document params;
    params.SetObject();
    auto& allocator = params.GetAllocator();
    params.AddMember("processId", rapidjson::Value(static_cast<int64_t>(::getpid())), allocator);
    params.AddMember("rootUri", makeString(rootURI, allocator), allocator);
    params.AddMember("rootPath", makeString(m_options.workspace.string(), allocator), allocator);
    params.AddMember("capabilities", rapidjson::Value(rapidjson::kObjectType), allocator);
    rapidjson::Value folder(rapidjson::kObjectType);
    folder.AddMember("name", makeString(workspaceName, allocator), allocator);
    folder.AddMember("uri", makeString(rootURI, allocator), allocator);
    rapidjson::Value folders(rapidjson::kArrayType);
    folders.PushBack(folder, allocator);
    params.AddMember("workspaceFolders", folders, allocator);

    rapidjson::Document result;
    if (!request("initialize", params, result)) {
        return false;
    }
    SPDLOG_INFO("Language server {} initialized for workspace {}", m_process->pid(), m_options.workspace.string());

    return notify("initialized", rapidjson::Value(rapidjson::kObjectType));
}

bool LSPBridge::sendMessage(const rapidjson::Document& message, std::chrono::steady_clock::time_point deadline) {
    return m_transport->write(message, deadline);
}

} // namespace pathfinder
