#include "pathfinder/LSPBridge.hpp"

#include "pathfinder/ErrorReporter.hpp"
#include "pathfinder/FileURI.hpp"
#include "pathfinder/TestFixtures.hpp"

#include "doctest/doctest.h"

#include <string>
#include <vector>

namespace pathfinder {

TEST_CASE_FIXTURE(FakeServerFixture, "LSPBridge handshake") {
    auto bridge = launchFake({});
    REQUIRE(bridge);
    CHECK(m_errorReporter->ok());
    CHECK(bridge->workspace() == directory());

    rapidjson::Document messages;
    REQUIRE(received(*bridge, messages));
    REQUIRE(messages.IsArray());
    REQUIRE(messages.Size() == 2);

    const auto& initialize = messages[0];
    CHECK(std::string(initialize["method"].GetString()) == "initialize");
    CHECK(initialize["id"].GetInt64() == 1);
    const auto& params = initialize["params"];
    CHECK(params["processId"].GetInt64() == static_cast<int64_t>(::getpid()));
    CHECK(std::string(params["rootUri"].GetString()) == pathToURI(directory(), true));
    CHECK(std::string(params["rootPath"].GetString()) == directory().string());
    CHECK(params["capabilities"].IsObject());
    REQUIRE(params["workspaceFolders"].IsArray());
    REQUIRE(params["workspaceFolders"].Size() == 1);
    CHECK(std::string(params["workspaceFolders"][0]["name"].GetString()) == directory().filename().string());
    CHECK(std::string(params["workspaceFolders"][0]["uri"].GetString()) == pathToURI(directory(), true));

    const auto& initialized = messages[1];
    CHECK(std::string(initialized["method"].GetString()) == "initialized");
    CHECK(!initialized.HasMember("id"));
    CHECK(initialized["params"].IsObject());

    CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kExitedCleanly);
}

TEST_CASE_FIXTURE(FakeServerFixture, "LSPBridge request ids") {
    auto bridge = launchFake({"--failOn=test/fail"});
    REQUIRE(bridge);
    CHECK(bridge->nextRequestId() == 2);

    rapidjson::Document result;
    CHECK(bridge->request("test/one", rapidjson::Value(), result));
    CHECK(bridge->nextRequestId() == 3);
    // A failed request still consumes its id.
    CHECK(!bridge->request("test/fail", rapidjson::Value(), result));
    CHECK(bridge->nextRequestId() == 4);
    CHECK(bridge->request("test/two", rapidjson::Value(), result));
    CHECK(bridge->nextRequestId() == 5);

    rapidjson::Document messages;
    REQUIRE(received(*bridge, messages));
    std::vector<int64_t> ids;
    for (const auto& message : messages.GetArray()) {
        if (message.HasMember("id")) {
            ids.emplace_back(message["id"].GetInt64());
        }
    }
    CHECK(ids == std::vector<int64_t>({1, 2, 3, 4}));

    CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kExitedCleanly);
}

TEST_CASE_FIXTURE(FakeServerFixture, "LSPBridge discards notifications, stale responses and server requests") {
    auto bridge = launchFake({"--noisy", R"(--definitionReplies=[{"uri":"file:///a.rs"}])"});
    REQUIRE(bridge);

    rapidjson::Document result;
    REQUIRE(bridge->request("textDocument/definition", rapidjson::Value(rapidjson::kObjectType), result));
    REQUIRE(result.IsObject());
    CHECK(std::string(result["uri"].GetString()) == "file:///a.rs");
    CHECK(!result.HasMember("stale"));

    // The stream stays in step for the following request.
    REQUIRE(bridge->request("test/next", rapidjson::Value(), result));
    CHECK(result.IsNull());
    CHECK(m_errorReporter->ok());

    CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kExitedCleanly);
}

TEST_CASE_FIXTURE(FakeServerFixture, "LSPBridge request failures") {
    SUBCASE("remote error") {
        auto bridge = launchFake({"--failOn=textDocument/definition"});
        REQUIRE(bridge);
        rapidjson::Document result;
        CHECK(!bridge->request("textDocument/definition", rapidjson::Value(), result));
        CHECK(m_errorReporter->hasErrorOfKind(ErrorReporter::kRemote));
        CHECK(m_errorReporter->lastErrorMessage().find("scripted failure") != std::string::npos);
        CHECK(m_errorReporter->lastErrorMessage().find("'textDocument/definition'") != std::string::npos);
        CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kExitedCleanly);
    }
    SUBCASE("missing result and error") {
        auto bridge = launchFake({"--malformedOn=textDocument/definition"});
        REQUIRE(bridge);
        rapidjson::Document result;
        CHECK(!bridge->request("textDocument/definition", rapidjson::Value(), result));
        CHECK(m_errorReporter->hasErrorOfKind(ErrorReporter::kProtocol));
        CHECK(m_errorReporter->lastErrorMessage().find("missing both result and error") != std::string::npos);
        CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kExitedCleanly);
    }
    SUBCASE("server terminates") {
        auto bridge = launchFake({"--crashOn=textDocument/definition"});
        REQUIRE(bridge);
        auto pid = bridge->pid();
        rapidjson::Document result;
        CHECK(!bridge->request("textDocument/definition", rapidjson::Value(), result));
        CHECK(m_errorReporter->hasErrorOfKind(ErrorReporter::kProcess));
        CHECK(m_errorReporter->lastErrorMessage().find("terminated unexpectedly") != std::string::npos);
        CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kKilled);
        CHECK(processGone(pid));
    }
}

TEST_CASE_FIXTURE(FakeServerFixture, "LSPBridge request timeout") {
    auto timeout = std::chrono::milliseconds(400);
    auto bridge = launchFake({"--hangOn=textDocument/definition"}, timeout);
    REQUIRE(bridge);

    rapidjson::Document result;
    auto start = std::chrono::steady_clock::now();
    CHECK(!bridge->request("textDocument/definition", rapidjson::Value(), result));
    auto elapsed = std::chrono::steady_clock::now() - start;
    CHECK(elapsed >= timeout);
    CHECK(m_errorReporter->hasErrorOfKind(ErrorReporter::kTimeout));
    CHECK(m_errorReporter->lastErrorMessage().find("'textDocument/definition'") != std::string::npos);

    // The session survives the timeout.
    m_errorReporter->reset();
    CHECK(bridge->request("test/after", rapidjson::Value(), result));
    CHECK(m_errorReporter->ok());

    CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kExitedCleanly);
}

TEST_CASE_FIXTURE(FakeServerFixture, "LSPBridge launch failures") {
    SUBCASE("missing executable") {
        LSPBridge::Options options;
        options.command = {"/nonexistent/pathfinder/language-server"};
        options.workspace = directory();
        auto bridge = LSPBridge::launch(std::move(options), m_errorReporter);
        CHECK(!bridge);
        CHECK(m_errorReporter->hasErrorOfKind(ErrorReporter::kProcess));
    }
    SUBCASE("empty command") {
        LSPBridge::Options options;
        options.workspace = directory();
        auto bridge = LSPBridge::launch(std::move(options), m_errorReporter);
        CHECK(!bridge);
        CHECK(m_errorReporter->hasErrorOfKind(ErrorReporter::kConfiguration));
    }
    SUBCASE("server exits during initialize") {
        auto bridge = launchFake({"--crashOn=initialize"});
        CHECK(!bridge);
        CHECK(m_errorReporter->hasErrorOfKind(ErrorReporter::kProcess));
    }
    SUBCASE("initialize rejected") {
        auto bridge = launchFake({"--failOn=initialize"});
        CHECK(!bridge);
        CHECK(m_errorReporter->hasErrorOfKind(ErrorReporter::kRemote));
    }
}

TEST_CASE_FIXTURE(FakeServerFixture, "LSPBridge shutdown releases the process") {
    SUBCASE("clean exit") {
        auto bridge = launchFake({"--exitCode=3"});
        REQUIRE(bridge);
        auto pid = bridge->pid();
        CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kExitedCleanly);
        CHECK(processGone(pid));
    }
    SUBCASE("shutdown request fails") {
        auto bridge = launchFake({"--failOn=shutdown"});
        REQUIRE(bridge);
        auto pid = bridge->pid();
        CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kKilled);
        CHECK(processGone(pid));
    }
    SUBCASE("exit ignored") {
        auto timeout = std::chrono::milliseconds(400);
        auto bridge = launchFake({"--ignoreExit"}, timeout);
        REQUIRE(bridge);
        auto pid = bridge->pid();
        auto start = std::chrono::steady_clock::now();
        CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kKilled);
        CHECK(std::chrono::steady_clock::now() - start >= timeout);
        CHECK(processGone(pid));
    }
    SUBCASE("server already crashed") {
        auto bridge = launchFake({"--crashOn=test/crash"});
        REQUIRE(bridge);
        auto pid = bridge->pid();
        rapidjson::Document result;
        CHECK(!bridge->request("test/crash", rapidjson::Value(), result));
        CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kKilled);
        CHECK(processGone(pid));
    }
    SUBCASE("no bridge") { CHECK(LSPBridge::shutdown(nullptr) == LSPBridge::kExitedCleanly); }
}

} // namespace pathfinder
