#include "pathfinder/DocumentSynchronizer.hpp"

#include "pathfinder/ErrorReporter.hpp"
#include "pathfinder/FileURI.hpp"
#include "pathfinder/LSPBridge.hpp"
#include "pathfinder/TestFixtures.hpp"

#include "doctest/doctest.h"

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

namespace pathfinder {

TEST_CASE_FIXTURE(FakeServerFixture, "DocumentSynchronizer ensureOpen") {
    auto bridge = launchFake({});
    REQUIRE(bridge);
    DocumentSynchronizer documents(m_errorReporter);

    SUBCASE("first access opens the document") {
        auto path = writeFile("src/main.rs", "fn main() {}\n");
        auto uri = pathToURI(path);
        REQUIRE(documents.ensureOpen(*bridge, uri));
        CHECK(documents.isOpen(uri));
        CHECK(documents.version(uri) == std::optional<int>(1));
        CHECK(documents.size() == 1);

        rapidjson::Document messages;
        REQUIRE(received(*bridge, messages));
        auto opens = messagesNamed(messages, "textDocument/didOpen");
        REQUIRE(opens.size() == 1);
        const auto& textDocument = (*opens[0])["params"]["textDocument"];
        CHECK(std::string(textDocument["uri"].GetString()) == uri);
        CHECK(std::string(textDocument["languageId"].GetString()) == "rust");
        CHECK(textDocument["version"].GetInt() == 1);
        CHECK(std::string(textDocument["text"].GetString()) == "fn main() {}\n");
    }

    SUBCASE("unchanged document is announced once") {
        auto uri = pathToURI(writeFile("lib.py", "def f():\n    pass\n"));
        REQUIRE(documents.ensureOpen(*bridge, uri));
        REQUIRE(documents.ensureOpen(*bridge, uri));
        REQUIRE(documents.ensureOpen(*bridge, uri));
        CHECK(documents.version(uri) == std::optional<int>(1));

        rapidjson::Document messages;
        REQUIRE(received(*bridge, messages));
        CHECK(messagesNamed(messages, "textDocument/didOpen").size() == 1);
        CHECK(messagesNamed(messages, "textDocument/didChange").empty());
    }

    SUBCASE("modified document sends the new text") {
        auto path = writeFile("config.toml", "a = 1\n");
        auto uri = pathToURI(path);
        REQUIRE(documents.ensureOpen(*bridge, uri));

        writeFile("config.toml", "a = 2\n");
        touchForward(path);
        REQUIRE(documents.ensureOpen(*bridge, uri));
        CHECK(documents.version(uri) == std::optional<int>(2));

        rapidjson::Document messages;
        REQUIRE(received(*bridge, messages));
        auto changes = messagesNamed(messages, "textDocument/didChange");
        REQUIRE(changes.size() == 1);
        const auto& params = (*changes[0])["params"];
        CHECK(std::string(params["textDocument"]["uri"].GetString()) == uri);
        CHECK(params["textDocument"]["version"].GetInt() == 2);
        REQUIRE(params["contentChanges"].Size() == 1);
        CHECK(std::string(params["contentChanges"][0]["text"].GetString()) == "a = 2\n");
    }

    SUBCASE("missing file leaves nothing tracked") {
        auto uri = pathToURI(directory() / "gone.rs");
        CHECK(!documents.ensureOpen(*bridge, uri));
        CHECK(m_errorReporter->hasErrorOfKind(ErrorReporter::kDocument));
        CHECK(!documents.isOpen(uri));
        CHECK(documents.size() == 0);
    }

    SUBCASE("non-file uri is rejected") {
        CHECK(!documents.ensureOpen(*bridge, "https://example.com/main.rs"));
        CHECK(m_errorReporter->hasErrorOfKind(ErrorReporter::kDocument));
        CHECK(documents.size() == 0);
    }

    documents.closeAll(*bridge);
    CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kExitedCleanly);
}

TEST_CASE_FIXTURE(FakeServerFixture, "DocumentSynchronizer close") {
    auto bridge = launchFake({});
    REQUIRE(bridge);
    DocumentSynchronizer documents(m_errorReporter);

    auto first = pathToURI(writeFile("a.go", "package a\n"));
    auto second = pathToURI(writeFile("b.go", "package b\n"));
    REQUIRE(documents.ensureOpen(*bridge, first));
    REQUIRE(documents.ensureOpen(*bridge, second));

    SUBCASE("single document") {
        CHECK(documents.close(*bridge, first));
        CHECK(!documents.isOpen(first));
        CHECK(documents.isOpen(second));
        CHECK(!documents.close(*bridge, first));

        // Reopening starts again from version 1.
        REQUIRE(documents.ensureOpen(*bridge, first));
        CHECK(documents.version(first) == std::optional<int>(1));
    }

    SUBCASE("all documents") {
        documents.closeAll(*bridge);
        CHECK(documents.size() == 0);

        rapidjson::Document messages;
        REQUIRE(received(*bridge, messages));
        auto closes = messagesNamed(messages, "textDocument/didClose");
        REQUIRE(closes.size() == 2);
        std::vector<std::string> closed;
        for (const auto* close : closes) {
            closed.emplace_back((*close)["params"]["textDocument"]["uri"].GetString());
        }
        std::sort(closed.begin(), closed.end());
        std::vector<std::string> expected({first, second});
        std::sort(expected.begin(), expected.end());
        CHECK(closed == expected);
    }

    SUBCASE("server gone") {
        auto crashed = launchFake({"--crashOn=test/crash"});
        REQUIRE(crashed);
        rapidjson::Document result;
        CHECK(!crashed->request("test/crash", rapidjson::Value(), result));

        DocumentSynchronizer orphaned(m_errorReporter);
        auto third = pathToURI(writeFile("c.go", "package c\n"));
        // Announcing to a dead server fails without tracking the document.
        CHECK(!orphaned.ensureOpen(*crashed, third));
        CHECK(orphaned.size() == 0);
        CHECK(LSPBridge::shutdown(std::move(crashed)) == LSPBridge::kKilled);
    }

    documents.closeAll(*bridge);
    CHECK(documents.size() == 0);
    CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kExitedCleanly);
}

TEST_CASE_FIXTURE(FakeServerFixture, "DocumentSynchronizer closeAll on a dead server") {
    auto bridge = launchFake({"--crashOn=test/crash"});
    REQUIRE(bridge);
    DocumentSynchronizer documents(m_errorReporter);
    std::vector<std::string> uris;
    for (const char* name : {"a.c", "b.c", "c.c"}) {
        uris.emplace_back(pathToURI(writeFile(name, "int x;\n")));
        REQUIRE(documents.ensureOpen(*bridge, uris.back()));
    }
    REQUIRE(documents.size() == 3);

    rapidjson::Document result;
    CHECK(!bridge->request("test/crash", rapidjson::Value(), result));
    m_errorReporter->reset();

    // Every document gets its own attempt, none of the failures escape, and the map is cleared regardless.
    documents.closeAll(*bridge);
    CHECK(m_errorReporter->errorCount() == uris.size());
    CHECK(m_errorReporter->hasErrorOfKind(ErrorReporter::kFraming));
    CHECK(documents.size() == 0);
    for (const auto& uri : uris) {
        CHECK(!documents.isOpen(uri));
    }
    CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kKilled);
}

TEST_CASE_FIXTURE(FakeServerFixture, "DocumentSynchronizer server that stopped reading") {
    constexpr auto kTimeout = std::chrono::milliseconds(400);
    auto bridge = launchFake({"--stopReadingOn=initialized"}, kTimeout);
    REQUIRE(bridge);
    DocumentSynchronizer documents(m_errorReporter);

    // Much larger than the pipe buffer, so the announcement cannot be written in full.
    auto uri = pathToURI(writeFile("large.rs", std::string(512 * 1024, '/') + "\n"));
    auto start = std::chrono::steady_clock::now();
    CHECK(!documents.ensureOpen(*bridge, uri));
    CHECK(std::chrono::steady_clock::now() - start >= kTimeout);
    CHECK(m_errorReporter->hasErrorOfKind(ErrorReporter::kTimeout));
    CHECK(!documents.isOpen(uri));

    auto pid = bridge->pid();
    CHECK(LSPBridge::shutdown(std::move(bridge)) == LSPBridge::kKilled);
    CHECK(processGone(pid));
}

} // namespace pathfinder
