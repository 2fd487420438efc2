#ifndef SRC_PATHFINDER_TEST_FIXTURES_HPP_
#define SRC_PATHFINDER_TEST_FIXTURES_HPP_

#include "pathfinder/ErrorReporter.hpp"
#include "pathfinder/LSPBridge.hpp"
#include "pathfinder/internal/FileSystem.hpp"

#include "fmt/format.h"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>
#include <unistd.h>
#include <vector>

// For consumption by unittests only.
namespace pathfinder {

// Path to the scripted language server built alongside the unittests.
#ifndef PATHFINDER_FAKE_SERVER_PATH
#    error PATHFINDER_FAKE_SERVER_PATH must be defined by the build.
#endif
inline const char* const kFakeServerPath = PATHFINDER_FAKE_SERVER_PATH;

// Creates a fresh directory under the system temporary directory, removed with its contents on destruction.
class TemporaryDirectoryFixture {
public:
    TemporaryDirectoryFixture() {
        static std::atomic<int> counter(0);
        m_directory = fs::temp_directory_path() /
            fmt::format("pathfinder-test-{}-{}", ::getpid(), counter.fetch_add(1));
        fs::create_directories(m_directory);
        m_directory = fs::canonical(m_directory);
    }
    virtual ~TemporaryDirectoryFixture() {
        std::error_code error;
        fs::remove_all(m_directory, error);
    }

protected:
    const fs::path& directory() const { return m_directory; }

    fs::path writeFile(const std::string& name, const std::string& contents) {
        auto path = m_directory / name;
        fs::create_directories(path.parent_path());
        std::ofstream outFile(path, std::ofstream::binary | std::ofstream::trunc);
        outFile << contents;
        return path;
    }

    // Moves the modification time of |path| forward so that a rewrite is observable regardless of the timestamp
    // granularity of the file system.
    void touchForward(const fs::path& path, std::chrono::seconds delta = std::chrono::seconds(2)) {
        fs::last_write_time(path, fs::last_write_time(path) + delta);
    }

private:
    fs::path m_directory;
};

// Launches the fake language server with a workspace in a fresh temporary directory. Errors are collected in a
// suppressed reporter.
class FakeServerFixture : public TemporaryDirectoryFixture {
public:
    FakeServerFixture(): m_errorReporter(std::make_shared<ErrorReporter>(true)) {}
    virtual ~FakeServerFixture() = default;

protected:
    std::unique_ptr<LSPBridge> launchFake(std::vector<std::string> flags,
                                          std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        LSPBridge::Options options;
        options.command.emplace_back(kFakeServerPath);
        for (auto& flag : flags) {
            options.command.emplace_back(std::move(flag));
        }
        options.workspace = directory();
        options.requestTimeout = timeout;
        return LSPBridge::launch(std::move(options), m_errorReporter);
    }

    // Everything the fake server has received so far, in order.
    bool received(LSPBridge& bridge, rapidjson::Document& messages) {
        return bridge.request("fake/received", rapidjson::Value(rapidjson::kObjectType), messages);
    }

    // Messages received by the fake server with the given method, in order.
    std::vector<const rapidjson::Value*> messagesNamed(const rapidjson::Document& messages, const std::string& method) {
        std::vector<const rapidjson::Value*> named;
        for (const auto& message : messages.GetArray()) {
            if (message.HasMember("method") && method == message["method"].GetString()) {
                named.emplace_back(&message);
            }
        }
        return named;
    }

    static bool processGone(pid_t pid) { return ::kill(pid, 0) == -1 && errno == ESRCH; }

    std::shared_ptr<ErrorReporter> m_errorReporter;
};

} // namespace pathfinder

#endif // SRC_PATHFINDER_TEST_FIXTURES_HPP_
