#include "pathfinder/DefinitionNormalizer.hpp"

#include "pathfinder/ErrorReporter.hpp"
#include "pathfinder/LSPBridge.hpp"
#include "pathfinder/TestFixtures.hpp"

#include "doctest/doctest.h"

#include <string>
#include <vector>

namespace {

const char* kLocation = R"({"uri":"file:///w/src/lib.rs","range":{"start":{"line":4,"character":7},)"
                        R"("end":{"line":4,"character":12}}})";
const char* kLocationLink = R"({"originSelectionRange":{"start":{"line":0,"character":0},)"
                            R"("end":{"line":0,"character":3}},"targetUri":"file:///w/src/lib.rs",)"
                            R"("targetRange":{"start":{"line":4,"character":7},"end":{"line":4,"character":12}},)"
                            R"("targetSelectionRange":{"start":{"line":4,"character":9},)"
                            R"("end":{"line":4,"character":10}}})";

} // namespace

namespace pathfinder {

TEST_CASE("DefinitionNormalizer normalize") {
    ErrorReporter er(true);
    std::vector<lsp::DefinitionTarget> targets;

    lsp::DefinitionTarget expected;
    expected.uri = "file:///w/src/lib.rs";
    expected.range.startLine = 4;
    expected.range.startCharacter = 7;
    expected.range.endLine = 4;
    expected.range.endCharacter = 12;

    SUBCASE("null is empty") {
        rapidjson::Document reply;
        reply.Parse("null");
        REQUIRE(DefinitionNormalizer::normalize(reply, targets, &er));
        CHECK(targets.empty());
        CHECK(er.ok());
    }
    SUBCASE("empty array is empty") {
        rapidjson::Document reply;
        reply.Parse("[]");
        REQUIRE(DefinitionNormalizer::normalize(reply, targets, &er));
        CHECK(targets.empty());
    }
    SUBCASE("single location, location list and location link agree") {
        rapidjson::Document single;
        single.Parse(kLocation);
        rapidjson::Document list;
        list.Parse(fmt::format("[{}]", kLocation).c_str());
        rapidjson::Document links;
        links.Parse(fmt::format("[{}]", kLocationLink).c_str());

        std::vector<lsp::DefinitionTarget> fromSingle;
        std::vector<lsp::DefinitionTarget> fromList;
        std::vector<lsp::DefinitionTarget> fromLinks;
        REQUIRE(DefinitionNormalizer::normalize(single, fromSingle, &er));
        REQUIRE(DefinitionNormalizer::normalize(list, fromList, &er));
        REQUIRE(DefinitionNormalizer::normalize(links, fromLinks, &er));
        REQUIRE(fromSingle.size() == 1);
        CHECK(fromSingle[0] == expected);
        CHECK(fromList == fromSingle);
        CHECK(fromLinks == fromSingle);
    }
    SUBCASE("order is kept") {
        rapidjson::Document reply;
        reply.Parse(R"([{"uri":"file:///b","range":{"start":{"line":1,"character":0},"end":{"line":1,"character":1}}},)"
                    R"({"targetUri":"file:///a","targetRange":{"start":{"line":0,"character":0},)"
                    R"("end":{"line":0,"character":1}}}])");
        REQUIRE(DefinitionNormalizer::normalize(reply, targets, &er));
        REQUIRE(targets.size() == 2);
        CHECK(targets[0].uri == "file:///b");
        CHECK(targets[1].uri == "file:///a");
    }
    SUBCASE("large coordinates survive") {
        rapidjson::Document reply;
        reply.Parse(R"({"uri":"file:///a","range":{"start":{"line":4294967295,"character":0},)"
                    R"("end":{"line":4294967295,"character":65536}}})");
        REQUIRE(DefinitionNormalizer::normalize(reply, targets, &er));
        REQUIRE(targets.size() == 1);
        CHECK(targets[0].range.startLine == 4294967295u);
        CHECK(targets[0].range.endCharacter == 65536u);
    }
    SUBCASE("scalar reply") {
        rapidjson::Document reply;
        reply.Parse("42");
        CHECK(!DefinitionNormalizer::normalize(reply, targets, &er));
        CHECK(er.hasErrorOfKind(ErrorReporter::kProtocol));
        CHECK(er.lastErrorMessage().find("unexpected definition response format") != std::string::npos);
    }
    SUBCASE("entry without uri") {
        rapidjson::Document reply;
        reply.Parse(R"([{"range":{"start":{"line":1,"character":0},"end":{"line":1,"character":1}}}])");
        CHECK(!DefinitionNormalizer::normalize(reply, targets, &er));
        CHECK(er.hasErrorOfKind(ErrorReporter::kProtocol));
    }
    SUBCASE("uri not a string") {
        rapidjson::Document reply;
        reply.Parse(R"({"uri":7,"range":{"start":{"line":1,"character":0},"end":{"line":1,"character":1}}})");
        CHECK(!DefinitionNormalizer::normalize(reply, targets, &er));
        CHECK(er.hasErrorOfKind(ErrorReporter::kProtocol));
    }
    SUBCASE("missing range") {
        rapidjson::Document reply;
        reply.Parse(R"({"targetUri":"file:///a"})");
        CHECK(!DefinitionNormalizer::normalize(reply, targets, &er));
        CHECK(er.hasErrorOfKind(ErrorReporter::kProtocol));
    }
    SUBCASE("bad coordinates") {
        const char* replies[] = {
            R"({"uri":"file:///a","range":{"start":{"line":-1,"character":0},"end":{"line":1,"character":1}}})",
            R"({"uri":"file:///a","range":{"start":{"line":1.5,"character":0},"end":{"line":1,"character":1}}})",
            R"({"uri":"file:///a","range":{"start":{"line":1,"character":"0"},"end":{"line":1,"character":1}}})",
            R"({"uri":"file:///a","range":{"start":{"line":1,"character":0},"end":{"line":4294967296,"character":1}}})",
            R"({"uri":"file:///a","range":{"start":{"line":1,"character":0}}})",
            R"({"uri":"file:///a","range":[]})",
        };
        for (auto text : replies) {
            CAPTURE(text);
            rapidjson::Document reply;
            reply.Parse(text);
            REQUIRE(!reply.HasParseError());
            er.reset();
            CHECK(!DefinitionNormalizer::normalize(reply, targets, &er));
            CHECK(er.hasErrorOfKind(ErrorReporter::kProtocol));
        }
    }
}

TEST_CASE_FIXTURE(FakeServerFixture, "DefinitionNormalizer execute") {
    lsp::DefinitionRequest request;
    request.uri = "file:///w/src/main.rs";
    request.line = 3;
    request.character = 14;
    lsp::DefinitionResponse response;

    DefinitionNormalizer normalizer(m_errorReporter);
    normalizer.setRetryDelay(std::chrono::milliseconds(20));

    SUBCASE("sends the position") {
        auto bridge = launchFake({fmt::format("--definitionReplies=[{}]", kLocation)});
        REQUIRE(bridge);
        REQUIRE(normalizer.execute(*bridge, request, response));
        REQUIRE(response.targets.size() == 1);
        CHECK(response.targets[0].uri == "file:///w/src/lib.rs");

        rapidjson::Document messages;
        REQUIRE(received(*bridge, messages));
        auto definitions = messagesNamed(messages, "textDocument/definition");
        REQUIRE(definitions.size() == 1);
        const auto& params = (*definitions[0])["params"];
        CHECK(std::string(params["textDocument"]["uri"].GetString()) == request.uri);
        CHECK(params["position"]["line"].GetUint() == 3);
        CHECK(params["position"]["character"].GetUint() == 14);
        CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kExitedCleanly);
    }
    SUBCASE("retries empty replies until targets arrive") {
        auto bridge = launchFake({fmt::format("--definitionReplies=[[],null,[{}]]", kLocation)});
        REQUIRE(bridge);
        REQUIRE(normalizer.execute(*bridge, request, response));
        REQUIRE(response.targets.size() == 1);
        CHECK(response.targets[0].range.startLine == 4);

        rapidjson::Document messages;
        REQUIRE(received(*bridge, messages));
        CHECK(messagesNamed(messages, "textDocument/definition").size() == 3);
        CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kExitedCleanly);
    }
    SUBCASE("three empty replies give an empty response") {
        auto bridge = launchFake({"--definitionReplies=[[]]"});
        REQUIRE(bridge);
        auto start = std::chrono::steady_clock::now();
        REQUIRE(normalizer.execute(*bridge, request, response));
        CHECK(std::chrono::steady_clock::now() - start >= 2 * normalizer.retryDelay());
        CHECK(response.targets.empty());
        CHECK(m_errorReporter->ok());

        rapidjson::Document messages;
        REQUIRE(received(*bridge, messages));
        CHECK(messagesNamed(messages, "textDocument/definition").size() == 3);
        CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kExitedCleanly);
    }
    SUBCASE("raised attempt limit reaches a late reply") {
        normalizer.setMaxAttempts(5);
        CHECK(normalizer.maxAttempts() == 5);
        auto bridge = launchFake({fmt::format("--definitionReplies=[[],[],null,[],[{}]]", kLocation)});
        REQUIRE(bridge);
        REQUIRE(normalizer.execute(*bridge, request, response));
        REQUIRE(response.targets.size() == 1);

        rapidjson::Document messages;
        REQUIRE(received(*bridge, messages));
        CHECK(messagesNamed(messages, "textDocument/definition").size() == 5);
        CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kExitedCleanly);
    }
    SUBCASE("attempt limit never drops below one") {
        normalizer.setMaxAttempts(0);
        CHECK(normalizer.maxAttempts() == 1);
        auto bridge = launchFake({"--definitionReplies=[null]"});
        REQUIRE(bridge);
        REQUIRE(normalizer.execute(*bridge, request, response));
        CHECK(response.targets.empty());

        rapidjson::Document messages;
        REQUIRE(received(*bridge, messages));
        CHECK(messagesNamed(messages, "textDocument/definition").size() == 1);
        CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kExitedCleanly);
    }
    SUBCASE("malformed reply is not retried") {
        auto bridge = launchFake({R"(--definitionReplies=["nonsense"])"});
        REQUIRE(bridge);
        CHECK(!normalizer.execute(*bridge, request, response));
        CHECK(m_errorReporter->hasErrorOfKind(ErrorReporter::kProtocol));

        rapidjson::Document messages;
        REQUIRE(received(*bridge, messages));
        CHECK(messagesNamed(messages, "textDocument/definition").size() == 1);
        CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kExitedCleanly);
    }
    SUBCASE("remote error is not retried") {
        auto bridge = launchFake({"--failOn=textDocument/definition"});
        REQUIRE(bridge);
        CHECK(!normalizer.execute(*bridge, request, response));
        CHECK(m_errorReporter->hasErrorOfKind(ErrorReporter::kRemote));

        rapidjson::Document messages;
        REQUIRE(received(*bridge, messages));
        CHECK(messagesNamed(messages, "textDocument/definition").size() == 1);
        CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kExitedCleanly);
    }
}

} // namespace pathfinder
