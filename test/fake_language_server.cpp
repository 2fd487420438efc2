/*! Fake Language Server
 *
 * A scripted stand-in for a real language server, driven by command line flags, used by the pathfinder unittests to
 * exercise the bridge, document synchronization and definition lookup without depending on any installed language
 * tooling. Speaks Content-Length framed JSON-RPC on stdin/stdout and logs to stderr.
 *
 * Every message received is recorded. The custom request "fake/received" answers with the array of all messages
 * received before it, which lets tests observe notifications in order once the request has been answered.
 */
#include "pathfinder/ErrorReporter.hpp"
#include "pathfinder/FramedTransport.hpp"

#include "gflags/gflags.h"
#include "rapidjson/document.h"
#include "spdlog/sinks/stdout_sinks.h"
#include "spdlog/spdlog.h"

#include <memory>
#include <string>
#include <unistd.h>

DEFINE_string(definitionReplies, "[]",
              "JSON array of results for successive textDocument/definition requests. The last entry repeats once "
              "the array is exhausted, an empty array answers null.");
DEFINE_bool(noisy, false,
            "Before each response send a notification, a response to a stale id, and a server request reusing the "
            "id being answered.");
DEFINE_string(hangOn, "", "Never answer requests for this method.");
DEFINE_string(failOn, "", "Answer requests for this method with an error object.");
DEFINE_string(malformedOn, "", "Answer requests for this method with neither result nor error.");
DEFINE_string(crashOn, "", "Exit with status 1 as soon as this method arrives.");
DEFINE_string(stopReadingOn, "", "Stop reading input, without exiting, once this method arrives.");
DEFINE_bool(ignoreExit, false, "Keep running after the exit notification and the end of input.");
DEFINE_int32(exitCode, 0, "Exit status after the exit notification.");

namespace {

class FakeServer {
public:
    FakeServer():
        m_errorReporter(std::make_shared<pathfinder::ErrorReporter>()),
        m_transport(STDIN_FILENO, STDOUT_FILENO, m_errorReporter),
        m_definitionCount(0) {
        m_received.SetArray();
        m_definitionReplies.Parse(FLAGS_definitionReplies.c_str());
        if (m_definitionReplies.HasParseError() || !m_definitionReplies.IsArray()) {
            spdlog::error("--definitionReplies must be a JSON array.");
            m_definitionReplies.SetArray();
        }
    }

    int run() {
        while (true) {
            rapidjson::Document message;
            auto readResult = m_transport.read(message);
            if (readResult == pathfinder::FramedTransport::kEndOfStream) {
                spdlog::info("fake server: end of input.");
                return idle(0);
            }
            if (readResult != pathfinder::FramedTransport::kMessage) {
                spdlog::error("fake server: framing error, {}", m_errorReporter->lastErrorMessage());
                return 2;
            }
            if (!message.IsObject() || !message.HasMember("method") || !message["method"].IsString()) {
                spdlog::warn("fake server: ignoring message without method.");
                continue;
            }

            std::string method = message["method"].GetString();
            if (method == FLAGS_crashOn) {
                spdlog::info("fake server: crashing on {}.", method);
                return 1;
            }
            if (method == FLAGS_stopReadingOn) {
                spdlog::info("fake server: no longer reading after {}.", method);
                while (true) {
                    ::pause();
                }
            }

            if (!message.HasMember("id")) {
                rapidjson::Value copy(message, m_received.GetAllocator());
                m_received.PushBack(copy, m_received.GetAllocator());
                if (method == "exit") {
                    return idle(FLAGS_exitCode);
                }
                continue;
            }

            handleRequest(method, message);
            rapidjson::Value copy(message, m_received.GetAllocator());
            m_received.PushBack(copy, m_received.GetAllocator());
        }
    }

private:
    int idle(int exitCode) {
        if (FLAGS_ignoreExit) {
            spdlog::info("fake server: ignoring exit.");
            while (true) {
                ::pause();
            }
        }
        return exitCode;
    }

    void handleRequest(const std::string& method, const rapidjson::Document& message) {
        if (method == FLAGS_hangOn) {
            spdlog::info("fake server: not answering {}.", method);
            return;
        }
        if (FLAGS_noisy) {
            sendNoise(message["id"]);
        }

        rapidjson::Document response;
        response.SetObject();
        auto& allocator = response.GetAllocator();
        response.AddMember("jsonrpc", rapidjson::Value("2.0"), allocator);
        response.AddMember("id", rapidjson::Value(message["id"], allocator), allocator);

        if (method == FLAGS_failOn) {
            rapidjson::Value error(rapidjson::kObjectType);
            error.AddMember("code", rapidjson::Value(-32603), allocator);
            error.AddMember("message", rapidjson::Value("scripted failure"), allocator);
            response.AddMember("error", error, allocator);
        } else if (method == FLAGS_malformedOn) {
            // Neither result nor error.
        } else if (method == "initialize") {
            rapidjson::Value result(rapidjson::kObjectType);
            rapidjson::Value capabilities(rapidjson::kObjectType);
            capabilities.AddMember("definitionProvider", rapidjson::Value(true), allocator);
            capabilities.AddMember("textDocumentSync", rapidjson::Value(1), allocator);
            result.AddMember("capabilities", capabilities, allocator);
            rapidjson::Value serverInfo(rapidjson::kObjectType);
            serverInfo.AddMember("name", rapidjson::Value("fake_language_server"), allocator);
            result.AddMember("serverInfo", serverInfo, allocator);
            response.AddMember("result", result, allocator);
        } else if (method == "textDocument/definition") {
            rapidjson::Value result;
            auto replies = m_definitionReplies.Size();
            if (replies > 0) {
                auto index = m_definitionCount < replies ? m_definitionCount : replies - 1;
                result.CopyFrom(m_definitionReplies[index], allocator);
            }
            ++m_definitionCount;
            response.AddMember("result", result, allocator);
        } else if (method == "fake/received") {
            rapidjson::Value result(m_received, allocator);
            response.AddMember("result", result, allocator);
        } else {
            response.AddMember("result", rapidjson::Value(), allocator);
        }

        send(response);
    }

    void send(const rapidjson::Value& message) {
        if (!m_transport.write(message)) {
            spdlog::error("fake server: write failed, {}", m_errorReporter->lastErrorMessage());
        }
    }

    void sendNoise(const rapidjson::Value& id) {
        rapidjson::Document notification;
        notification.Parse(
            R"({"jsonrpc":"2.0","method":"window/logMessage","params":{"type":3,"message":"indexing"}})");
        send(notification);

        rapidjson::Document stale;
        stale.Parse(R"({"jsonrpc":"2.0","id":-7,"result":{"stale":true}})");
        send(stale);

        rapidjson::Document serverRequest;
        serverRequest.Parse(R"({"jsonrpc":"2.0","method":"window/workDoneProgress/create","params":{"token":"t"}})");
        serverRequest.AddMember("id", rapidjson::Value(id, serverRequest.GetAllocator()), serverRequest.GetAllocator());
        send(serverRequest);
    }

    std::shared_ptr<pathfinder::ErrorReporter> m_errorReporter;
    pathfinder::FramedTransport m_transport;
    rapidjson::Document m_definitionReplies;
    rapidjson::SizeType m_definitionCount;
    rapidjson::Document m_received;
};

} // namespace

int main(int argc, char* argv[]) {
    gflags::ParseCommandLineFlags(&argc, &argv, true);
    spdlog::set_default_logger(spdlog::stderr_logger_mt("fake_language_server"));

    FakeServer server;
    return server.run();
}
