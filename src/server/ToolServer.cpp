#include "server/ToolServer.hpp"

#include "pathfinder/LSPTypes.hpp"
#include "pathfinder/PathfinderService.hpp"
#include "pathfinder/internal/BuildInfo.hpp"
#include "server/MCPTypes.hpp"
#include "server/ToolMethods.hpp"

#include "fmt/format.h"
#include "rapidjson/document.h"
#include "rapidjson/pointer.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"
#include "spdlog/spdlog.h"

#include <array>
#include <cctype>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

namespace {

const char* kDefinitionToolName = "definition";
const char* kDefinitionToolDescription =
    "Return LSP-backed jump-to-definition targets for a given URI and position";
const char* kInstructions = "MCP server that bridges to Language Server Protocol (LSP) servers. Provides "
                            "jump-to-definition and other LSP features.";

rapidjson::Value makeString(std::string_view string, rapidjson::Document::AllocatorType& allocator) {
    return rapidjson::Value(string.data(), static_cast<rapidjson::SizeType>(string.size()), allocator);
}

std::string serialize(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

// {"targets": [{"uri": ..., "range": {"start_line": ..., "start_character": ..., "end_line": ...,
// "end_character": ...}}]}
std::string serializeDefinitionResponse(const pathfinder::lsp::DefinitionResponse& response) {
    rapidjson::Document document;
    document.SetObject();
    auto& allocator = document.GetAllocator();
    rapidjson::Value targets(rapidjson::kArrayType);
    for (const auto& target : response.targets) {
        rapidjson::Value range(rapidjson::kObjectType);
        range.AddMember("start_line", rapidjson::Value(target.range.startLine), allocator);
        range.AddMember("start_character", rapidjson::Value(target.range.startCharacter), allocator);
        range.AddMember("end_line", rapidjson::Value(target.range.endLine), allocator);
        range.AddMember("end_character", rapidjson::Value(target.range.endCharacter), allocator);
        rapidjson::Value entry(rapidjson::kObjectType);
        entry.AddMember("uri", makeString(target.uri, allocator), allocator);
        entry.AddMember("range", range, allocator);
        targets.PushBack(entry, allocator);
    }
    document.AddMember("targets", targets, allocator);
    return serialize(document);
}

void addSchemaProperty(rapidjson::Value& properties, const char* name, const char* type, const char* description,
                       rapidjson::Document::AllocatorType& allocator) {
    rapidjson::Value property(rapidjson::kObjectType);
    property.AddMember("type", rapidjson::StringRef(type), allocator);
    property.AddMember("description", rapidjson::StringRef(description), allocator);
    properties.AddMember(rapidjson::StringRef(name), property, allocator);
}

} // namespace

namespace server {

class ToolServer::ToolServerImpl {
public:
    ToolServerImpl() = delete;
    ToolServerImpl(FILE* inputStream, FILE* outputStream, std::shared_ptr<pathfinder::PathfinderService> service,
                   size_t workerThreads);
    ~ToolServerImpl();

    int runLoop();
    void sendErrorResponse(std::optional<mcp::ID> id, ErrorCode errorCode, std::string errorMessage);

private:
    bool readLine(std::string& line);
    void handleLine(std::string_view line);
    bool handleMethod(const std::string& methodName, std::optional<mcp::ID> id, rapidjson::Document& document);
    bool handleToolsCall(mcp::ID id, const rapidjson::Value* params);

    void sendInitializeResult(mcp::ID id);
    void sendEmptyResult(mcp::ID id);
    void sendToolsList(mcp::ID id);
    void sendToolResult(mcp::ID id, const std::string& text, bool isError);
    void sendMessage(rapidjson::Document& document);
    void encodeId(std::optional<mcp::ID> id, rapidjson::Document& document);

    void startWorkers();
    void stopWorkers();
    void workerThreadMain(size_t threadNumber);
    void enqueue(std::function<void()> job);
    void callDefinition(mcp::ID id, pathfinder::lsp::DefinitionRequest request);

    FILE* m_inputStream;
    FILE* m_outputStream;
    std::shared_ptr<pathfinder::PathfinderService> m_service;
    size_t m_numberOfWorkers;

    // Serializes whole lines onto m_outputStream.
    std::mutex m_outputMutex;

    std::vector<std::thread> m_workerThreads;
    // Protects m_jobQueue and m_quit
    std::mutex m_jobQueueMutex;
    std::condition_variable m_jobQueueCondition;
    std::deque<std::function<void()>> m_jobQueue;
    bool m_quit;
};

ToolServer::ToolServerImpl::ToolServerImpl(FILE* inputStream, FILE* outputStream,
                                           std::shared_ptr<pathfinder::PathfinderService> service,
                                           size_t workerThreads):
    m_inputStream(inputStream),
    m_outputStream(outputStream),
    m_service(std::move(service)),
    m_numberOfWorkers(workerThreads > 0 ? workerThreads : 1),
    m_quit(false) {}

ToolServer::ToolServerImpl::~ToolServerImpl() { stopWorkers(); }

int ToolServer::ToolServerImpl::runLoop() {
    SPDLOG_INFO("runLoop entry");
    startWorkers();

    std::string line;
    while (readLine(line)) {
        handleLine(line);
    }
    int status = ferror(m_inputStream) ? -1 : 0;

    // Answer every accepted tool call before returning, so the caller may tear down the service afterwards.
    stopWorkers();

    if (status == 0) {
        SPDLOG_INFO("Normal exit from processing loop.");
    } else {
        SPDLOG_CRITICAL("Input read failure, exiting processing loop.");
    }
    return status;
}

void ToolServer::ToolServerImpl::sendErrorResponse(std::optional<mcp::ID> id, ErrorCode errorCode,
                                                   std::string errorMessage) {
    SPDLOG_WARN("Sending error code: {}, message: {}", static_cast<int>(errorCode), errorMessage);
    rapidjson::Document document;
    document.SetObject();
    document.AddMember("jsonrpc", rapidjson::Value("2.0"), document.GetAllocator());
    encodeId(id, document);
    rapidjson::Value responseError;
    responseError.SetObject();
    responseError.AddMember("code", rapidjson::Value(static_cast<int>(errorCode)), document.GetAllocator());
    responseError.AddMember("message", makeString(errorMessage, document.GetAllocator()), document.GetAllocator());
    document.AddMember("error", responseError, document.GetAllocator());
    sendMessage(document);
}

// Reads one newline-terminated line, which may be longer than the read buffer. Returns false at end of input or on a
// stream error.
bool ToolServer::ToolServerImpl::readLine(std::string& line) {
    std::array<char, 4096> lineBuf;
    line.clear();

    while (true) {
        if (std::fgets(lineBuf.data(), static_cast<int>(lineBuf.size()), m_inputStream)) {
            line.append(lineBuf.data());
            if (!line.empty() && line.back() == '\n') {
                return true;
            }
            continue;
        }

        if (ferror(m_inputStream)) {
            if (errno == EINTR) {
                clearerr(m_inputStream);
                errno = 0;
                continue;
            }
            SPDLOG_ERROR("File error on input stream while reading line: {}.", std::strerror(errno));
            return false;
        }

        // End of input, a final unterminated line still counts.
        return !line.empty();
    }
}

void ToolServer::ToolServerImpl::handleLine(std::string_view line) {
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
        line.remove_suffix(1);
    }
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front()))) {
        line.remove_prefix(1);
    }
    if (line.empty()) {
        return;
    }
    SPDLOG_TRACE("Read {} JSON bytes", line.size());

    rapidjson::Document document;
    rapidjson::ParseResult parseResult = document.Parse(line.data(), line.size());
    if (!parseResult) {
        sendErrorResponse(std::nullopt, ErrorCode::kParseError, "Failed to parse input JSON.");
        return;
    }

    // Validate some basic properties of the received JSON-RPC object
    if (!document.IsObject()) {
        sendErrorResponse(std::nullopt, ErrorCode::kInvalidRequest, "Input JSON is not a JSON object.");
        return;
    }
    if (!document.HasMember("jsonrpc")) {
        sendErrorResponse(std::nullopt, ErrorCode::kInvalidRequest, "Input JSON missing 'jsonrpc' key.");
        return;
    }
    if (!document["jsonrpc"].IsString()) {
        sendErrorResponse(std::nullopt, ErrorCode::kInvalidRequest, "Input 'jsonrpc' key is not a string.");
        return;
    }
    rapidjson::Value& jsonrpc = document["jsonrpc"];
    if (std::strcmp(jsonrpc.GetString(), "2.0") != 0) {
        sendErrorResponse(std::nullopt, ErrorCode::kInvalidRequest,
                          fmt::format("Unsupported 'jsonrpc' value of '{}'.", jsonrpc.GetString()));
        return;
    }

    std::optional<mcp::ID> id;
    if (document.HasMember("id")) {
        if (document["id"].IsString()) {
            id = std::string(document["id"].GetString(), document["id"].GetStringLength());
        } else if (document["id"].IsInt64()) {
            id = document["id"].GetInt64();
        } else {
            sendErrorResponse(std::nullopt, ErrorCode::kInvalidRequest,
                              "Type for 'id' key must be string or integer.");
            return;
        }
    }
    std::optional<std::string> method;
    if (document.HasMember("method")) {
        if (document["method"].IsString()) {
            method = std::string(document["method"].GetString(), document["method"].GetStringLength());
        } else {
            sendErrorResponse(id, ErrorCode::kInvalidRequest, "Type for 'method' key must be string.");
            return;
        }
    }

    // JSON-RPC terminology:
    //           | no ID        | ID       |
    // ----------+--------------+----------+
    // no method | *invalid*    | response |
    // method    | notification | request  |
    if (!method) {
        if (!id) {
            sendErrorResponse(id, ErrorCode::kInvalidRequest, "Message missing both 'id' and 'method' keys.");
            return;
        }
        // This server never sends requests, so there is nothing to match a response against.
        SPDLOG_DEBUG("Ignoring response from client.");
        return;
    }

    handleMethod(method.value(), id, document);
}

bool ToolServer::ToolServerImpl::handleMethod(const std::string& methodName, std::optional<mcp::ID> id,
                                              rapidjson::Document& document) {
    auto method = mcp::getMethodNamed(methodName.data(), methodName.size());

    // Notifications never get a response, not even an error.
    if (!id) {
        SPDLOG_DEBUG("Received notification '{}'", methodName);
        return true;
    }

    // Look for a params object if present, as many methods call for that.
    const rapidjson::Value* params = rapidjson::Pointer("/params").Get(document);
    if (params && !params->IsObject()) {
        params = nullptr;
    }

    switch (method) {
    case mcp::Method::kNotFound:
        sendErrorResponse(id, ErrorCode::kMethodNotFound,
                          fmt::format("Failed to match method '{}' to supported name.", methodName));
        return false;
    case mcp::Method::kInitialize:
        SPDLOG_INFO("MCP client connected and initialized");
        sendInitializeResult(*id);
        break;
    case mcp::Method::kPing:
        sendEmptyResult(*id);
        break;
    case mcp::Method::kToolsList:
        sendToolsList(*id);
        break;
    case mcp::Method::kToolsCall:
        return handleToolsCall(*id, params);
    case mcp::Method::kInitialized:
    case mcp::Method::kCancelled:
        // Notifications sent with an id, acknowledge anyway.
        sendEmptyResult(*id);
        break;
    }
    return true;
}

bool ToolServer::ToolServerImpl::handleToolsCall(mcp::ID id, const rapidjson::Value* params) {
    if (!params) {
        sendErrorResponse(id, ErrorCode::kInvalidParams, "Absent or malformed params key in 'tools/call' method.");
        return false;
    }
    auto name = params->FindMember("name");
    if (name == params->MemberEnd() || !name->value.IsString()) {
        sendErrorResponse(id, ErrorCode::kInvalidParams, "Method 'tools/call' requires a string 'name'.");
        return false;
    }
    if (std::strcmp(name->value.GetString(), kDefinitionToolName) != 0) {
        sendErrorResponse(id, ErrorCode::kInvalidParams, fmt::format("Unknown tool '{}'.", name->value.GetString()));
        return false;
    }
    auto arguments = params->FindMember("arguments");
    if (arguments == params->MemberEnd() || !arguments->value.IsObject()) {
        sendErrorResponse(id, ErrorCode::kInvalidParams, "Tool 'definition' requires an 'arguments' object.");
        return false;
    }

    const auto& args = arguments->value;
    auto uri = args.FindMember("uri");
    if (uri == args.MemberEnd() || !uri->value.IsString()) {
        sendErrorResponse(id, ErrorCode::kInvalidParams, "Argument 'uri' must be a string.");
        return false;
    }
    auto line = args.FindMember("line");
    if (line == args.MemberEnd() || !line->value.IsUint()) {
        sendErrorResponse(id, ErrorCode::kInvalidParams, "Argument 'line' must be a non-negative integer.");
        return false;
    }
    auto character = args.FindMember("character");
    if (character == args.MemberEnd() || !character->value.IsUint()) {
        sendErrorResponse(id, ErrorCode::kInvalidParams, "Argument 'character' must be a non-negative integer.");
        return false;
    }

    pathfinder::lsp::DefinitionRequest request;
    request.uri.assign(uri->value.GetString(), uri->value.GetStringLength());
    request.line = line->value.GetUint();
    request.character = character->value.GetUint();
    SPDLOG_DEBUG("Queueing definition request for {} at {}:{}", request.uri, request.line, request.character);
    enqueue([this, id, request]() { callDefinition(id, request); });
    return true;
}

void ToolServer::ToolServerImpl::sendInitializeResult(mcp::ID id) {
    rapidjson::Document document;
    document.SetObject();
    auto& allocator = document.GetAllocator();
    document.AddMember("jsonrpc", rapidjson::Value("2.0"), allocator);
    encodeId(id, document);
    rapidjson::Value result(rapidjson::kObjectType);
    result.AddMember("protocolVersion", rapidjson::StringRef(mcp::kProtocolVersion), allocator);
    rapidjson::Value capabilities(rapidjson::kObjectType);
    capabilities.AddMember("tools", rapidjson::Value(rapidjson::kObjectType), allocator);
    result.AddMember("capabilities", capabilities, allocator);
    rapidjson::Value serverInfo(rapidjson::kObjectType);
    serverInfo.AddMember("name", rapidjson::Value("pathfinder"), allocator);
    serverInfo.AddMember("version", rapidjson::Value(pathfinder::kPathfinderVersion, allocator), allocator);
    result.AddMember("serverInfo", serverInfo, allocator);
    result.AddMember("instructions", rapidjson::StringRef(kInstructions), allocator);
    document.AddMember("result", result, allocator);
    sendMessage(document);
}

void ToolServer::ToolServerImpl::sendEmptyResult(mcp::ID id) {
    rapidjson::Document document;
    document.SetObject();
    document.AddMember("jsonrpc", rapidjson::Value("2.0"), document.GetAllocator());
    encodeId(id, document);
    document.AddMember("result", rapidjson::Value(rapidjson::kObjectType), document.GetAllocator());
    sendMessage(document);
}

void ToolServer::ToolServerImpl::sendToolsList(mcp::ID id) {
    rapidjson::Document document;
    document.SetObject();
    auto& allocator = document.GetAllocator();
    document.AddMember("jsonrpc", rapidjson::Value("2.0"), allocator);
    encodeId(id, document);

    rapidjson::Value properties(rapidjson::kObjectType);
    addSchemaProperty(properties, "uri", "string", "file:// URI of the document", allocator);
    addSchemaProperty(properties, "line", "integer", "Zero-based line index", allocator);
    addSchemaProperty(properties, "character", "integer", "Zero-based character index", allocator);
    rapidjson::Value required(rapidjson::kArrayType);
    required.PushBack(rapidjson::Value("uri"), allocator);
    required.PushBack(rapidjson::Value("line"), allocator);
    required.PushBack(rapidjson::Value("character"), allocator);
    rapidjson::Value inputSchema(rapidjson::kObjectType);
    inputSchema.AddMember("type", rapidjson::Value("object"), allocator);
    inputSchema.AddMember("properties", properties, allocator);
    inputSchema.AddMember("required", required, allocator);

    rapidjson::Value tool(rapidjson::kObjectType);
    tool.AddMember("name", rapidjson::StringRef(kDefinitionToolName), allocator);
    tool.AddMember("description", rapidjson::StringRef(kDefinitionToolDescription), allocator);
    tool.AddMember("inputSchema", inputSchema, allocator);
    rapidjson::Value tools(rapidjson::kArrayType);
    tools.PushBack(tool, allocator);

    rapidjson::Value result(rapidjson::kObjectType);
    result.AddMember("tools", tools, allocator);
    document.AddMember("result", result, allocator);
    sendMessage(document);
}

void ToolServer::ToolServerImpl::sendToolResult(mcp::ID id, const std::string& text, bool isError) {
    rapidjson::Document document;
    document.SetObject();
    auto& allocator = document.GetAllocator();
    document.AddMember("jsonrpc", rapidjson::Value("2.0"), allocator);
    encodeId(id, document);
    rapidjson::Value content(rapidjson::kObjectType);
    content.AddMember("type", rapidjson::Value("text"), allocator);
    content.AddMember("text", makeString(text, allocator), allocator);
    rapidjson::Value contents(rapidjson::kArrayType);
    contents.PushBack(content, allocator);
    rapidjson::Value result(rapidjson::kObjectType);
    result.AddMember("content", contents, allocator);
    result.AddMember("isError", rapidjson::Value(isError), allocator);
    document.AddMember("result", result, allocator);
    sendMessage(document);
}

// Serialize and send a JSON-RPC message to the client as a single line.
void ToolServer::ToolServerImpl::sendMessage(rapidjson::Document& document) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    document.Accept(writer);
    std::string output = fmt::format("{}\n", std::string_view(buffer.GetString(), buffer.GetSize()));

    std::lock_guard<std::mutex> lock(m_outputMutex);
    if (std::fwrite(output.data(), 1, output.size(), m_outputStream) != output.size()
        || std::fflush(m_outputStream) != 0) {
        SPDLOG_ERROR("Failed to write {} bytes to output stream: {}", output.size(), std::strerror(errno));
    }
}

void ToolServer::ToolServerImpl::encodeId(std::optional<mcp::ID> id, rapidjson::Document& document) {
    if (id) {
        if (std::holds_alternative<int64_t>(*id)) {
            document.AddMember("id", rapidjson::Value(std::get<int64_t>(*id)), document.GetAllocator());
        } else {
            document.AddMember("id", makeString(std::get<std::string>(*id), document.GetAllocator()),
                               document.GetAllocator());
        }
    } else {
        // Encode id with a value of null.
        document.AddMember("id", rapidjson::Value(), document.GetAllocator());
    }
}

void ToolServer::ToolServerImpl::startWorkers() {
    {
        std::lock_guard<std::mutex> lock(m_jobQueueMutex);
        m_quit = false;
    }
    SPDLOG_DEBUG("ToolServer starting {} worker threads.", m_numberOfWorkers);
    for (size_t i = 0; i < m_numberOfWorkers; ++i) {
        m_workerThreads.emplace_back(std::thread(&ToolServerImpl::workerThreadMain, this, i));
    }
}

void ToolServer::ToolServerImpl::stopWorkers() {
    {
        std::lock_guard<std::mutex> lock(m_jobQueueMutex);
        m_quit = true;
    }
    m_jobQueueCondition.notify_all();
    for (auto& thread : m_workerThreads) {
        thread.join();
    }
    m_workerThreads.clear();
}

void ToolServer::ToolServerImpl::workerThreadMain(size_t threadNumber) {
    SPDLOG_DEBUG("Worker thread {} entry.", threadNumber);

    while (true) {
        std::function<void()> workFunction;
        {
            std::unique_lock<std::mutex> lock(m_jobQueueMutex);
            m_jobQueueCondition.wait(lock, [this] { return m_quit || m_jobQueue.size(); });
            // Outstanding jobs are drained before quitting.
            if (m_jobQueue.empty()) {
                break;
            }
            workFunction = std::move(m_jobQueue.front());
            m_jobQueue.pop_front();
        }
        workFunction();
    }

    SPDLOG_DEBUG("Worker thread {} normal exit.", threadNumber);
}

void ToolServer::ToolServerImpl::enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(m_jobQueueMutex);
        m_jobQueue.emplace_back(std::move(job));
    }
    m_jobQueueCondition.notify_one();
}

void ToolServer::ToolServerImpl::callDefinition(mcp::ID id, pathfinder::lsp::DefinitionRequest request) {
    pathfinder::lsp::DefinitionResponse response;
    std::string errorMessage;
    if (!m_service->definition(request, response, errorMessage)) {
        SPDLOG_WARN("Definition for {} failed: {}", request.uri, errorMessage);
        sendToolResult(id, errorMessage, true);
        return;
    }
    SPDLOG_DEBUG("Definition for {} returned {} targets", request.uri, response.targets.size());
    sendToolResult(id, serializeDefinitionResponse(response), false);
}

//////////////////
// ToolServer
ToolServer::ToolServer(FILE* inputStream, FILE* outputStream, std::shared_ptr<pathfinder::PathfinderService> service,
                       size_t workerThreads):
    m_impl(std::make_unique<ToolServerImpl>(inputStream, outputStream, std::move(service), workerThreads)) {}

// Default destructor in header complains about incomplete Impl type so declare it here and explicity delete the Impl.
ToolServer::~ToolServer() { m_impl.reset(); }

int ToolServer::runLoop() { return m_impl->runLoop(); }

} // namespace server
