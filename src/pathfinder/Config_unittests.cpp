#include "pathfinder/Config.hpp"

#include "pathfinder/ErrorReporter.hpp"
#include "pathfinder/TestFixtures.hpp"

#include "doctest/doctest.h"

namespace pathfinder {

TEST_CASE("Config parse") {
    ErrorReporter er(true);
    Config config;

    SUBCASE("valid") {
        REQUIRE(config.parse(R"({
            "server": {
                "extensions": ["js", "ts"],
                "command": ["typescript-language-server", "--stdio"],
                "rootDir": "packages/app"
            }
        })", &er));
        CHECK(config.server().extensions == std::vector<std::string>({"js", "ts"}));
        CHECK(config.server().command == std::vector<std::string>({"typescript-language-server", "--stdio"}));
        CHECK(config.server().rootDirectory == fs::path("packages/app"));
        CHECK(config.hasExtension("ts"));
        CHECK(!config.hasExtension("tsx"));
        CHECK(er.ok());
    }
    SUBCASE("rootDir defaults to the workspace") {
        REQUIRE(config.parse(R"({"server": {"extensions": ["rs"], "command": ["rust-analyzer"]}})", &er));
        CHECK(config.server().rootDirectory == fs::path("."));
    }
    SUBCASE("leading dots are dropped") {
        REQUIRE(config.parse(R"({"server": {"extensions": [".py", "pyi"], "command": ["pyright-langserver"]}})", &er));
        CHECK(config.hasExtension("py"));
        CHECK(config.hasExtension("pyi"));
    }
    SUBCASE("empty extensions") {
        CHECK(!config.parse(R"({"server": {"extensions": [], "command": ["server1"], "rootDir": "."}})", &er));
        CHECK(er.hasErrorOfKind(ErrorReporter::kConfiguration));
        CHECK(er.lastErrorMessage() == "server has no extensions");
    }
    SUBCASE("empty command") {
        CHECK(!config.parse(R"({"server": {"extensions": ["rs"], "command": []}})", &er));
        CHECK(er.lastErrorMessage() == "server has empty command");
    }
    SUBCASE("malformed") {
        CHECK(!config.parse(R"({"server": )", &er));
        CHECK(er.hasErrorOfKind(ErrorReporter::kConfiguration));
        CHECK(!config.parse(R"([])", &er));
        CHECK(!config.parse(R"({"server": {"extensions": "rs", "command": ["x"]}})", &er));
        CHECK(!config.parse(R"({"server": {"extensions": ["rs", 4], "command": ["x"]}})", &er));
        CHECK(!config.parse(R"({"server": {"extensions": ["rs"]}})", &er));
        CHECK(!config.parse(R"({"server": {"extensions": ["rs"], "command": ["x"], "rootDir": 3}})", &er));
    }
}

TEST_CASE("Config setFromFlags") {
    ErrorReporter er(true);
    Config config;

    SUBCASE("comma separated extensions") {
        REQUIRE(config.setFromFlags("py, pyi,,.rs", {"uv", "run", "pyright-langserver", "--stdio"}, &er));
        CHECK(config.server().extensions == std::vector<std::string>({"py", "pyi", "rs"}));
        CHECK(config.server().command == std::vector<std::string>({"uv", "run", "pyright-langserver", "--stdio"}));
        CHECK(config.server().rootDirectory == fs::path("."));
    }
    SUBCASE("no extensions") {
        CHECK(!config.setFromFlags("", {"rust-analyzer"}, &er));
        CHECK(er.hasErrorOfKind(ErrorReporter::kConfiguration));
    }
    SUBCASE("no command") {
        CHECK(!config.setFromFlags("rs", {}, &er));
        CHECK(er.hasErrorOfKind(ErrorReporter::kConfiguration));
    }
}

TEST_CASE_FIXTURE(TemporaryDirectoryFixture, "Config files and root directory") {
    ErrorReporter er(true);
    Config config;

    SUBCASE("read from file") {
        auto path = writeFile("pathfinder.json",
                              R"({"server": {"extensions": ["go"], "command": ["gopls"], "rootDir": "module"}})");
        REQUIRE(config.readFile(path, &er));
        CHECK(config.hasExtension("go"));
    }
    SUBCASE("missing file") {
        CHECK(!config.readFile(directory() / "absent.json", &er));
        CHECK(er.hasErrorOfKind(ErrorReporter::kConfiguration));
    }
    SUBCASE("relative root directory") {
        fs::create_directories(directory() / "module");
        REQUIRE(config.parse(R"({"server": {"extensions": ["go"], "command": ["gopls"], "rootDir": "module/."}})",
                             &er));
        fs::path root;
        REQUIRE(config.resolveRootDirectory(directory(), root, &er));
        CHECK(root == directory() / "module");
    }
    SUBCASE("absolute root directory") {
        auto json = fmt::format(R"({{"server": {{"extensions": ["go"], "command": ["gopls"], "rootDir": "{}"}}}})",
                                directory().string());
        REQUIRE(config.parse(json, &er));
        fs::path root;
        REQUIRE(config.resolveRootDirectory("/", root, &er));
        CHECK(root == directory());
    }
    SUBCASE("root directory must exist") {
        REQUIRE(config.setFromFlags("go", {"gopls"}, &er));
        fs::path root;
        CHECK(!config.resolveRootDirectory(directory() / "missing", root, &er));
        CHECK(er.hasErrorOfKind(ErrorReporter::kConfiguration));
    }
    SUBCASE("root directory must be a directory") {
        writeFile("file.txt", "");
        REQUIRE(config.parse(R"({"server": {"extensions": ["go"], "command": ["gopls"], "rootDir": "file.txt"}})",
                             &er));
        fs::path root;
        CHECK(!config.resolveRootDirectory(directory(), root, &er));
    }
}

} // namespace pathfinder
