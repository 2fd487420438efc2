#include "pathfinder/FileURI.hpp"

#include "pathfinder/ErrorReporter.hpp"
#include "pathfinder/TestFixtures.hpp"

#include "doctest/doctest.h"

namespace pathfinder {

TEST_CASE("languageIdForPath") {
    CHECK(languageIdForPath("file.rs") == "rust");
    CHECK(languageIdForPath("file.go") == "go");
    CHECK(languageIdForPath("file.py") == "python");
    CHECK(languageIdForPath("file.ts") == "typescript");
    CHECK(languageIdForPath("file.tsx") == "typescriptreact");
    CHECK(languageIdForPath("file.js") == "javascript");
    CHECK(languageIdForPath("file.jsx") == "javascriptreact");
    CHECK(languageIdForPath("file.json") == "json");
    CHECK(languageIdForPath("Cargo.toml") == "toml");
    CHECK(languageIdForPath("a.yaml") == "yaml");
    CHECK(languageIdForPath("a.yml") == "yaml");
    CHECK(languageIdForPath("README.md") == "markdown");
    CHECK(languageIdForPath("file.unknown") == "unknown");
    CHECK(languageIdForPath("/some/dir/file") == "plaintext");
}

TEST_CASE("extensionFromURI") {
    CHECK(extensionFromURI("file:///path/to/file.rs") == std::optional<std::string>("rs"));
    CHECK(extensionFromURI("file:///path/to/file.py") == std::optional<std::string>("py"));
    CHECK(!extensionFromURI("file:///path/to/file"));
    CHECK(!extensionFromURI("file:///path.d/file"));
    CHECK(!extensionFromURI("file:///path/.hidden"));
    CHECK(extensionFromURI("file:///path/to/file.rs#L3") == std::optional<std::string>("rs"));
    CHECK(extensionFromURI("file:///path/to/file.py?rev=2") == std::optional<std::string>("py"));
    CHECK(!extensionFromURI("file:///path/to/file#section.md"));
}

TEST_CASE_FIXTURE(TemporaryDirectoryFixture, "uriToPath") {
    SUBCASE("existing file") {
        auto path = writeFile("main.rs", "fn main() {}\n");
        ErrorReporter er(true);
        auto resolved = uriToPath(pathToURI(path), &er);
        REQUIRE(resolved);
        CHECK(*resolved == path);
        CHECK(er.ok());
    }
    SUBCASE("percent-encoded path") {
        auto path = writeFile("with space/lib #1.rs", "");
        auto uri = pathToURI(path);
        CHECK(uri.find("with%20space/lib%20%231.rs") != std::string::npos);
        ErrorReporter er(true);
        auto resolved = uriToPath(uri, &er);
        REQUIRE(resolved);
        CHECK(*resolved == path);
    }
    SUBCASE("localhost authority") {
        auto path = writeFile("a.py", "");
        ErrorReporter er(true);
        auto resolved = uriToPath("file://localhost" + path.generic_string(), &er);
        REQUIRE(resolved);
        CHECK(*resolved == path);
    }
    SUBCASE("missing file") {
        ErrorReporter er(true);
        CHECK(!uriToPath(pathToURI(directory() / "absent.rs"), &er));
        CHECK(er.hasErrorOfKind(ErrorReporter::kDocument));
        CHECK(er.lastErrorMessage().find("does not exist") != std::string::npos);
    }
    SUBCASE("wrong scheme") {
        ErrorReporter er(true);
        CHECK(!uriToPath("https://example.com/a.rs", &er));
        CHECK(er.lastErrorMessage().find("only file://") != std::string::npos);
    }
    SUBCASE("remote host") {
        ErrorReporter er(true);
        CHECK(!uriToPath("file://otherhost/etc/hosts", &er));
        CHECK(er.errorCount() == 1);
    }
    SUBCASE("bad escape") {
        ErrorReporter er(true);
        CHECK(!uriToPath("file:///tmp/%zz", &er));
        CHECK(!uriToPath("file:///tmp/%4", &er));
        CHECK(er.errorCount() == 2);
    }
}

TEST_CASE("pathToURI") {
    CHECK(pathToURI("/tmp/project") == "file:///tmp/project");
    CHECK(pathToURI("/tmp/project", true) == "file:///tmp/project/");
    CHECK(pathToURI("/tmp/project/", true) == "file:///tmp/project/");
}

} // namespace pathfinder
