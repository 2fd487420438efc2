#include "pathfinder/PathfinderService.hpp"

#include "pathfinder/ErrorReporter.hpp"
#include "pathfinder/FileURI.hpp"
#include "pathfinder/TestFixtures.hpp"

#include "doctest/doctest.h"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace pathfinder {

class ServiceFixture : public TemporaryDirectoryFixture {
public:
    ServiceFixture() = default;

protected:
    std::unique_ptr<PathfinderService> makeService(std::vector<std::string> flags, std::string extensions = "rs,toml",
                                                   int maxAttempts = DefinitionNormalizer::kDefaultMaxAttempts) {
        std::vector<std::string> command({kFakeServerPath});
        command.insert(command.end(), flags.begin(), flags.end());
        ErrorReporter er(true);
        Config config;
        REQUIRE(config.setFromFlags(extensions, std::move(command), &er));

        PathfinderService::Options options;
        options.workspaceBase = directory();
        options.requestTimeout = std::chrono::milliseconds(5000);
        options.retryDelay = std::chrono::milliseconds(10);
        options.maxAttempts = maxAttempts;
        return std::make_unique<PathfinderService>(std::move(config), std::move(options));
    }

    std::string location(const std::string& uri, int line) {
        return fmt::format(R"({{"uri":"{}","range":{{"start":{{"line":{},"character":4}},)"
                           R"("end":{{"line":{},"character":9}}}}}})",
                           uri, line, line);
    }
};

TEST_CASE_FIXTURE(ServiceFixture, "PathfinderService definition") {
    auto mainURI = pathToURI(writeFile("src/main.rs", "mod lib;\nfn main() { lib::go(); }\n"));
    auto libURI = pathToURI(writeFile("src/lib.rs", "pub fn go() {}\n"));
    auto service = makeService({fmt::format("--definitionReplies=[[{}]]", location(libURI, 0))});
    REQUIRE(service->start());
    CHECK(service->running());
    CHECK(service->workspace() == directory());

    lsp::DefinitionRequest request;
    request.uri = mainURI;
    request.line = 1;
    request.character = 17;
    lsp::DefinitionResponse response;
    std::string errorMessage;

    SUBCASE("returns targets") {
        REQUIRE(service->definition(request, response, errorMessage));
        REQUIRE(response.targets.size() == 1);
        CHECK(response.targets[0].uri == libURI);
        CHECK(response.targets[0].range.startCharacter == 4);
        CHECK(response.targets[0].range.endCharacter == 9);
        CHECK(errorMessage.empty());

        // Repeated queries reuse the open document.
        REQUIRE(service->definition(request, response, errorMessage));
        CHECK(response.targets.size() == 1);
    }
    SUBCASE("fragment after the extension") {
        request.uri = mainURI + "#L2";
        REQUIRE(service->definition(request, response, errorMessage));
        CHECK(response.targets.size() == 1);
    }
    SUBCASE("unconfigured extension") {
        request.uri = pathToURI(writeFile("script.py", "print(1)\n"));
        CHECK(!service->definition(request, response, errorMessage));
        CHECK(errorMessage == "no language server configured for extension 'py'");
    }
    SUBCASE("missing document") {
        request.uri = pathToURI(directory() / "src" / "gone.rs");
        CHECK(!service->definition(request, response, errorMessage));
        CHECK(errorMessage.find("failed to prepare document: ") == 0);
        CHECK(errorMessage.find("does not exist") != std::string::npos);
    }

    CHECK(service->shutdown() == LSPBridge::kExitedCleanly);
    CHECK(!service->running());
    CHECK(service->shutdown() == LSPBridge::kExitedCleanly);

    CHECK(!service->definition(request, response, errorMessage));
    CHECK(errorMessage == "definition failed: language server is not running");
}

TEST_CASE_FIXTURE(ServiceFixture, "PathfinderService query failures") {
    auto uri = pathToURI(writeFile("main.rs", "fn main() {}\n"));
    lsp::DefinitionRequest request;
    request.uri = uri;
    lsp::DefinitionResponse response;
    std::string errorMessage;

    SUBCASE("remote error") {
        auto service = makeService({"--failOn=textDocument/definition"});
        REQUIRE(service->start());
        CHECK(!service->definition(request, response, errorMessage));
        CHECK(errorMessage.find("definition failed: LSP error for 'textDocument/definition'") == 0);
        CHECK(service->shutdown() == LSPBridge::kExitedCleanly);
    }
    SUBCASE("empty after retries") {
        auto service = makeService({"--definitionReplies=[null]"});
        REQUIRE(service->start());
        REQUIRE(service->definition(request, response, errorMessage));
        CHECK(response.targets.empty());
        CHECK(service->shutdown() == LSPBridge::kExitedCleanly);
    }
    SUBCASE("single attempt leaves a late reply for the next query") {
        auto service = makeService({fmt::format("--definitionReplies=[[],[{}]]", location(uri, 0))}, "rs", 1);
        REQUIRE(service->start());
        REQUIRE(service->definition(request, response, errorMessage));
        CHECK(response.targets.empty());
        REQUIRE(service->definition(request, response, errorMessage));
        REQUIRE(response.targets.size() == 1);
        CHECK(response.targets[0].uri == uri);
        CHECK(service->shutdown() == LSPBridge::kExitedCleanly);
    }
    SUBCASE("server dies") {
        auto service = makeService({"--crashOn=textDocument/definition"});
        REQUIRE(service->start());
        CHECK(!service->definition(request, response, errorMessage));
        CHECK(errorMessage.find("definition failed: ") == 0);
        CHECK(errorMessage.find("terminated unexpectedly") != std::string::npos);
        CHECK(service->shutdown() == LSPBridge::kKilled);
    }
}

TEST_CASE_FIXTURE(ServiceFixture, "PathfinderService start failures") {
    SUBCASE("missing executable") {
        ErrorReporter er(true);
        Config config;
        REQUIRE(config.setFromFlags("rs", {"/nonexistent/pathfinder/language-server"}, &er));
        PathfinderService::Options options;
        options.workspaceBase = directory();
        PathfinderService service(std::move(config), std::move(options));
        CHECK(!service.start());
        CHECK(!service.running());
        CHECK(service.lastErrorMessage().find("failed to spawn") != std::string::npos);
    }
    SUBCASE("missing root directory") {
        ErrorReporter er(true);
        Config config;
        auto json = fmt::format(R"({{"server": {{"extensions": ["rs"], "command": ["{}"], "rootDir": "nope"}}}})",
                                kFakeServerPath);
        REQUIRE(config.parse(json, &er));
        PathfinderService::Options options;
        options.workspaceBase = directory();
        PathfinderService service(std::move(config), std::move(options));
        CHECK(!service.start());
        CHECK(service.lastErrorMessage().find("failed to resolve root directory") != std::string::npos);
    }
    SUBCASE("started twice") {
        auto service = makeService({});
        REQUIRE(service->start());
        CHECK(!service->start());
        CHECK(service->running());
        CHECK(service->shutdown() == LSPBridge::kExitedCleanly);
    }
}

TEST_CASE_FIXTURE(ServiceFixture, "PathfinderService language server stops reading") {
    ErrorReporter er(true);
    Config config;
    REQUIRE(config.setFromFlags("rs", {kFakeServerPath, "--stopReadingOn=initialized"}, &er));
    PathfinderService::Options options;
    options.workspaceBase = directory();
    options.requestTimeout = std::chrono::milliseconds(300);
    options.retryDelay = std::chrono::milliseconds(10);
    PathfinderService service(std::move(config), std::move(options));
    REQUIRE(service.start());

    lsp::DefinitionRequest request;
    request.uri = pathToURI(writeFile("large.rs", std::string(512 * 1024, ' ') + "fn main() {}\n"));
    lsp::DefinitionResponse response;
    std::string errorMessage;
    CHECK(!service.definition(request, response, errorMessage));
    CHECK(errorMessage.find("failed to prepare document: timed out writing frame") == 0);

    // Every later call fails promptly and shutdown still releases the process.
    request.uri = pathToURI(writeFile("small.rs", "fn main() {}\n"));
    CHECK(!service.definition(request, response, errorMessage));
    CHECK(service.shutdown() == LSPBridge::kKilled);
    CHECK(!service.running());
}

TEST_CASE_FIXTURE(ServiceFixture, "PathfinderService concurrent callers") {
    constexpr int kThreads = 4;
    constexpr int kCallsPerThread = 5;

    std::vector<std::string> uris;
    for (int i = 0; i < kThreads; ++i) {
        uris.emplace_back(pathToURI(writeFile(fmt::format("src/file{}.rs", i), fmt::format("// file {}\n", i))));
    }
    auto service = makeService({fmt::format("--definitionReplies=[[{}]]", location(uris[0], 2)), "--noisy"});
    REQUIRE(service->start());

    std::atomic<int> successes(0);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&service, &successes, &uris, i] {
            for (int j = 0; j < kCallsPerThread; ++j) {
                lsp::DefinitionRequest request;
                request.uri = uris[i];
                request.line = static_cast<uint32_t>(j);
                lsp::DefinitionResponse response;
                std::string errorMessage;
                if (service->definition(request, response, errorMessage) && response.targets.size() == 1
                    && response.targets[0].range.startLine == 2) {
                    successes.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(successes.load() == kThreads * kCallsPerThread);
    CHECK(service->shutdown() == LSPBridge::kExitedCleanly);
}

} // namespace pathfinder
