#include "pathfinder/ChildProcess.hpp"

#include "pathfinder/ErrorReporter.hpp"
#include "pathfinder/TestFixtures.hpp"

#include "doctest/doctest.h"

#include <cerrno>
#include <csignal>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

namespace pathfinder {

namespace {

std::string readAll(int fd) {
    std::string output;
    char buffer[256];
    ssize_t bytesRead;
    while ((bytesRead = ::read(fd, buffer, sizeof(buffer))) > 0) {
        output.append(buffer, static_cast<size_t>(bytesRead));
    }
    return output;
}

} // namespace

TEST_CASE_FIXTURE(TemporaryDirectoryFixture, "ChildProcess spawn and exit") {
    SUBCASE("exit status is collected") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        ChildProcess child(errorReporter);
        REQUIRE(child.spawn({"/bin/sh", "-c", "exit 3"}, directory()));
        CHECK(child.pid() > 0);
        REQUIRE(child.waitForExit(std::chrono::seconds(10)) == ChildProcess::kExited);
        CHECK(!child.running());
        auto status = child.waitStatus();
        REQUIRE(status);
        CHECK(WIFEXITED(*status));
        CHECK(WEXITSTATUS(*status) == 3);
        CHECK(errorReporter->ok());
    }
    SUBCASE("runs in the working directory") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        ChildProcess child(errorReporter);
        REQUIRE(child.spawn({"pwd"}, directory()));
        auto output = readAll(child.stdoutFd());
        CHECK(output == directory().string() + "\n");
        CHECK(child.waitForExit(std::chrono::seconds(10)) == ChildProcess::kExited);
    }
    SUBCASE("stdin and stdout are piped") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        ChildProcess child(errorReporter);
        REQUIRE(child.spawn({"cat"}, directory()));
        std::string input("hello child\n");
        REQUIRE(::write(child.stdinFd(), input.data(), input.size()) == static_cast<ssize_t>(input.size()));
        child.closeStdin();
        CHECK(child.stdinFd() == -1);
        CHECK(readAll(child.stdoutFd()) == input);
        CHECK(child.waitForExit(std::chrono::seconds(10)) == ChildProcess::kExited);
    }
}

TEST_CASE_FIXTURE(TemporaryDirectoryFixture, "ChildProcess spawn failures") {
    SUBCASE("missing executable") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        ChildProcess child(errorReporter);
        CHECK(!child.spawn({"pathfinder-no-such-language-server"}, directory()));
        CHECK(errorReporter->hasErrorOfKind(ErrorReporter::kProcess));
        CHECK(errorReporter->lastErrorMessage().find("pathfinder-no-such-language-server") != std::string::npos);
        CHECK(!child.running());
    }
    SUBCASE("missing working directory") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        ChildProcess child(errorReporter);
        CHECK(!child.spawn({"/bin/sh", "-c", "exit 0"}, directory() / "absent"));
        CHECK(errorReporter->hasErrorOfKind(ErrorReporter::kProcess));
    }
    SUBCASE("empty command") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        ChildProcess child(errorReporter);
        CHECK(!child.spawn({}, directory()));
        CHECK(errorReporter->errorCount() == 1);
    }
}

TEST_CASE_FIXTURE(TemporaryDirectoryFixture, "ChildProcess timeout and kill") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    ChildProcess child(errorReporter);
    REQUIRE(child.spawn({"sleep", "30"}, directory()));
    auto start = std::chrono::steady_clock::now();
    CHECK(child.waitForExit(std::chrono::milliseconds(100)) == ChildProcess::kTimedOut);
    CHECK(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(100));
    CHECK(child.running());

    CHECK(child.kill());
    CHECK(!child.running());
    auto status = child.waitStatus();
    REQUIRE(status);
    CHECK(WIFSIGNALED(*status));
    CHECK(WTERMSIG(*status) == SIGKILL);
    // Killing an already reaped child is a no-op.
    CHECK(child.kill());
    CHECK(errorReporter->ok());
}

TEST_CASE_FIXTURE(TemporaryDirectoryFixture, "ChildProcess destruction kills a running child") {
    pid_t pid = -1;
    {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        ChildProcess child(errorReporter);
        REQUIRE(child.spawn({"sleep", "30"}, directory()));
        pid = child.pid();
        CHECK(child.running());
    }
    // Reaped before the destructor returned.
    CHECK(::kill(pid, 0) == -1);
    CHECK(errno == ESRCH);
}

TEST_CASE_FIXTURE(TemporaryDirectoryFixture, "ChildProcess stdin never blocks the writer") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    ChildProcess child(errorReporter);
    // sleep never reads its input, so the pipe fills up.
    REQUIRE(child.spawn({"sleep", "30"}, directory()));

    std::string chunk(64 * 1024, 'x');
    ssize_t result = 0;
    for (int i = 0; i < 64 && result >= 0; ++i) {
        result = ::write(child.stdinFd(), chunk.data(), chunk.size());
    }
    CHECK(result == -1);
    CHECK((errno == EAGAIN || errno == EWOULDBLOCK));
    CHECK(child.kill());
}

} // namespace pathfinder
