#include "server/ToolServer.hpp"

#include "pathfinder/Config.hpp"
#include "pathfinder/ErrorReporter.hpp"
#include "pathfinder/FileURI.hpp"
#include "pathfinder/PathfinderService.hpp"
#include "pathfinder/TestFixtures.hpp"

#include "doctest/doctest.h"
#include "fmt/format.h"
#include "rapidjson/document.h"

#include <array>
#include <stdio.h>
#include <string>
#include <vector>

namespace server {

// Runs a ToolServer over temporary files: the input is written up front, the run loop consumes it to the end, and
// every output line is parsed back.
class ToolServerFixture : public pathfinder::TemporaryDirectoryFixture {
public:
    ToolServerFixture(): m_input(tmpfile()), m_output(tmpfile()) {}
    ~ToolServerFixture() {
        if (m_input) {
            fclose(m_input);
        }
        if (m_output) {
            fclose(m_output);
        }
    }

protected:
    std::shared_ptr<pathfinder::PathfinderService> makeService(std::vector<std::string> flags) {
        std::vector<std::string> command({pathfinder::kFakeServerPath});
        command.insert(command.end(), flags.begin(), flags.end());
        pathfinder::ErrorReporter er(true);
        pathfinder::Config config;
        REQUIRE(config.setFromFlags("rs", std::move(command), &er));

        pathfinder::PathfinderService::Options options;
        options.workspaceBase = directory();
        options.requestTimeout = std::chrono::milliseconds(5000);
        options.retryDelay = std::chrono::milliseconds(10);
        return std::make_shared<pathfinder::PathfinderService>(std::move(config), std::move(options));
    }

    // Feeds |lines| to a fresh ToolServer and collects its responses. Returns the run loop status.
    int serve(const std::vector<std::string>& lines, std::shared_ptr<pathfinder::PathfinderService> service,
              size_t workerThreads = 2) {
        REQUIRE(m_input);
        REQUIRE(m_output);
        for (const auto& line : lines) {
            fputs(line.c_str(), m_input);
            fputc('\n', m_input);
        }
        rewind(m_input);

        int status = 0;
        {
            ToolServer toolServer(m_input, m_output, service, workerThreads);
            status = toolServer.runLoop();
        }

        rewind(m_output);
        std::array<char, 16384> lineBuf;
        while (fgets(lineBuf.data(), static_cast<int>(lineBuf.size()), m_output)) {
            rapidjson::Document response;
            response.Parse(lineBuf.data());
            REQUIRE(!response.HasParseError());
            REQUIRE(response.IsObject());
            m_responses.emplace_back(std::move(response));
        }
        return status;
    }

    // The response carrying integer |id|, or nullptr.
    const rapidjson::Document* responseWithId(int64_t id) const {
        for (const auto& response : m_responses) {
            if (response.HasMember("id") && response["id"].IsInt64() && response["id"].GetInt64() == id) {
                return &response;
            }
        }
        return nullptr;
    }

    static std::string toolCall(int64_t id, const std::string& uri, int line, int character) {
        return fmt::format(R"({{"jsonrpc":"2.0","id":{},"method":"tools/call","params":{{"name":"definition",)"
                           R"("arguments":{{"uri":"{}","line":{},"character":{}}}}}}})",
                           id, uri, line, character);
    }

    FILE* m_input;
    FILE* m_output;
    std::vector<rapidjson::Document> m_responses;
};

TEST_CASE_FIXTURE(ToolServerFixture, "ToolServer lifecycle and discovery") {
    auto service = makeService({});
    CHECK(serve({R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05",)"
                 R"("capabilities":{},"clientInfo":{"name":"test","version":"0"}}})",
                 R"({"jsonrpc":"2.0","method":"notifications/initialized"})",
                 R"({"jsonrpc":"2.0","id":"two","method":"ping"})",
                 R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})"},
                service)
          == 0);

    // The notification is not answered.
    REQUIRE(m_responses.size() == 3);

    const auto* initialize = responseWithId(1);
    REQUIRE(initialize);
    const auto& result = (*initialize)["result"];
    CHECK(std::string(result["protocolVersion"].GetString()) == "2024-11-05");
    CHECK(result["capabilities"]["tools"].IsObject());
    CHECK(std::string(result["serverInfo"]["name"].GetString()) == "pathfinder");
    CHECK(result["serverInfo"]["version"].IsString());
    CHECK(result["instructions"].IsString());

    const rapidjson::Document* ping = nullptr;
    for (const auto& response : m_responses) {
        if (response["id"].IsString() && std::string(response["id"].GetString()) == "two") {
            ping = &response;
        }
    }
    REQUIRE(ping);
    CHECK((*ping)["result"].IsObject());
    CHECK((*ping)["result"].MemberCount() == 0);

    const auto* toolsList = responseWithId(3);
    REQUIRE(toolsList);
    const auto& tools = (*toolsList)["result"]["tools"];
    REQUIRE(tools.IsArray());
    REQUIRE(tools.Size() == 1);
    CHECK(std::string(tools[0]["name"].GetString()) == "definition");
    const auto& schema = tools[0]["inputSchema"];
    CHECK(std::string(schema["type"].GetString()) == "object");
    CHECK(std::string(schema["properties"]["uri"]["type"].GetString()) == "string");
    CHECK(std::string(schema["properties"]["line"]["type"].GetString()) == "integer");
    CHECK(std::string(schema["properties"]["character"]["type"].GetString()) == "integer");
    CHECK(schema["required"].Size() == 3);
}

TEST_CASE_FIXTURE(ToolServerFixture, "ToolServer protocol errors") {
    auto service = makeService({});
    CHECK(serve({"{not json",
                 R"([1, 2])",
                 R"({"id":4,"method":"ping"})",
                 R"({"jsonrpc":"1.0","id":5,"method":"ping"})",
                 R"({"jsonrpc":"2.0","id":6,"method":"resources/list"})",
                 R"({"jsonrpc":"2.0","id":7,"method":"tools/call"})",
                 R"({"jsonrpc":"2.0","id":8,"method":"tools/call","params":{"name":"references","arguments":{}}})",
                 R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"definition",)"
                 R"("arguments":{"uri":"file:///a.rs","line":-1,"character":0}}})",
                 R"({"jsonrpc":"2.0","id":10,"method":"tools/call","params":{"name":"definition",)"
                 R"("arguments":{"line":1,"character":0}}})",
                 R"({"jsonrpc":"2.0","method":"unknown/notification"})",
                 ""},
                service)
          == 0);

    auto errorCode = [](const rapidjson::Value& response) { return response["error"]["code"].GetInt(); };

    REQUIRE(m_responses.size() == 9);
    CHECK(m_responses[0]["id"].IsNull());
    CHECK(errorCode(m_responses[0]) == ToolServer::kParseError);
    CHECK(errorCode(m_responses[1]) == ToolServer::kInvalidRequest);
    CHECK(errorCode(m_responses[2]) == ToolServer::kInvalidRequest);
    CHECK(errorCode(m_responses[3]) == ToolServer::kInvalidRequest);

    const auto* unknownMethod = responseWithId(6);
    REQUIRE(unknownMethod);
    CHECK(errorCode(*unknownMethod) == ToolServer::kMethodNotFound);
    for (int64_t id = 7; id <= 10; ++id) {
        CAPTURE(id);
        const auto* response = responseWithId(id);
        REQUIRE(response);
        REQUIRE(response->HasMember("error"));
        CHECK(errorCode(*response) == ToolServer::kInvalidParams);
    }
}

TEST_CASE_FIXTURE(ToolServerFixture, "ToolServer definition calls") {
    auto mainURI = pathfinder::pathToURI(writeFile("src/main.rs", "mod lib;\n"));
    auto libURI = pathfinder::pathToURI(writeFile("src/lib.rs", "pub fn go() {}\n"));
    auto service = makeService({fmt::format(
        R"(--definitionReplies=[[{{"targetUri":"{}","targetRange":{{"start":{{"line":0,"character":7}},)"
        R"("end":{{"line":0,"character":9}}}}}}]])",
        libURI)});
    REQUIRE(service->start());

    CHECK(serve({toolCall(1, mainURI, 0, 4),
                 toolCall(2, pathfinder::pathToURI(directory() / "src" / "missing.rs"), 0, 0),
                 toolCall(3, "file:///elsewhere/script.py", 0, 0),
                 toolCall(4, mainURI, 0, 5)},
                service)
          == 0);
    REQUIRE(m_responses.size() == 4);

    for (int64_t id : {1, 4}) {
        CAPTURE(id);
        const auto* response = responseWithId(id);
        REQUIRE(response);
        const auto& result = (*response)["result"];
        CHECK(!result["isError"].GetBool());
        REQUIRE(result["content"].Size() == 1);
        CHECK(std::string(result["content"][0]["type"].GetString()) == "text");

        rapidjson::Document payload;
        payload.Parse(result["content"][0]["text"].GetString());
        REQUIRE(!payload.HasParseError());
        REQUIRE(payload["targets"].Size() == 1);
        const auto& target = payload["targets"][0];
        CHECK(std::string(target["uri"].GetString()) == libURI);
        CHECK(target["range"]["start_line"].GetUint() == 0);
        CHECK(target["range"]["start_character"].GetUint() == 7);
        CHECK(target["range"]["end_line"].GetUint() == 0);
        CHECK(target["range"]["end_character"].GetUint() == 9);
    }

    const auto* missing = responseWithId(2);
    REQUIRE(missing);
    CHECK((*missing)["result"]["isError"].GetBool());
    CHECK(std::string((*missing)["result"]["content"][0]["text"].GetString()).find("failed to prepare document: ")
          == 0);

    const auto* unrouted = responseWithId(3);
    REQUIRE(unrouted);
    CHECK((*unrouted)["result"]["isError"].GetBool());
    CHECK(std::string((*unrouted)["result"]["content"][0]["text"].GetString())
          == "no language server configured for extension 'py'");

    CHECK(service->shutdown() == pathfinder::LSPBridge::kExitedCleanly);
}

TEST_CASE_FIXTURE(ToolServerFixture, "ToolServer answers every call before returning") {
    auto uri = pathfinder::pathToURI(writeFile("main.rs", "fn main() {}\n"));
    auto service = makeService({"--definitionReplies=[null]"});
    REQUIRE(service->start());

    std::vector<std::string> lines;
    for (int64_t id = 1; id <= 8; ++id) {
        lines.emplace_back(toolCall(id, uri, 0, static_cast<int>(id)));
    }
    CHECK(serve(lines, service, 3) == 0);

    REQUIRE(m_responses.size() == 8);
    for (int64_t id = 1; id <= 8; ++id) {
        CAPTURE(id);
        const auto* response = responseWithId(id);
        REQUIRE(response);
        CHECK(!(*response)["result"]["isError"].GetBool());
        CHECK(std::string((*response)["result"]["content"][0]["text"].GetString()) == R"({"targets":[]})");
    }

    CHECK(service->shutdown() == pathfinder::LSPBridge::kExitedCleanly);
}

TEST_CASE_FIXTURE(ToolServerFixture, "ToolServer without a running language server") {
    auto service = makeService({});
    CHECK(serve({toolCall(1, "file:///nowhere/main.rs", 0, 0)}, service) == 0);
    REQUIRE(m_responses.size() == 1);
    CHECK(m_responses[0]["result"]["isError"].GetBool());
    CHECK(std::string(m_responses[0]["result"]["content"][0]["text"].GetString())
          == "definition failed: language server is not running");
}

} // namespace server
