#include "pathfinder/FramedTransport.hpp"

#include "pathfinder/ErrorReporter.hpp"

#include "doctest/doctest.h"
#include "fmt/format.h"

#include <fcntl.h>
#include <string>
#include <thread>
#include <unistd.h>

namespace pathfinder {

namespace {

// A pipe with a FramedTransport reading from one end, and raw access to the write end so tests can produce arbitrary
// byte sequences.
class PipeFixture {
public:
    PipeFixture(): m_errorReporter(std::make_shared<ErrorReporter>(true)) {
        int descriptors[2];
        REQUIRE(::pipe(descriptors) == 0);
        m_readFd = descriptors[0];
        m_writeFd = descriptors[1];
        m_transport = std::make_unique<FramedTransport>(m_readFd, m_writeFd, m_errorReporter);
    }
    virtual ~PipeFixture() {
        m_transport.reset();
        ::close(m_readFd);
        closeWriteEnd();
    }

protected:
    void writeRaw(const std::string& bytes) {
        REQUIRE(::write(m_writeFd, bytes.data(), bytes.size()) == static_cast<ssize_t>(bytes.size()));
    }
    void makeWriteEndNonBlocking() { REQUIRE(::fcntl(m_writeFd, F_SETFL, O_NONBLOCK) == 0); }
    void closeWriteEnd() {
        if (m_writeFd >= 0) {
            ::close(m_writeFd);
            m_writeFd = -1;
        }
    }
    FramedTransport* transport() { return m_transport.get(); }
    ErrorReporter* errorReporter() { return m_errorReporter.get(); }

private:
    int m_readFd;
    int m_writeFd;
    std::shared_ptr<ErrorReporter> m_errorReporter;
    std::unique_ptr<FramedTransport> m_transport;
};

// An object whose serialization is far larger than a pipe buffer.
void makeLargeMessage(rapidjson::Document& message) {
    std::string text(256 * 1024, 'a');
    message.SetObject();
    message.AddMember("text",
                      rapidjson::Value(text.data(), static_cast<rapidjson::SizeType>(text.size()),
                                       message.GetAllocator()),
                      message.GetAllocator());
}

std::string frame(const std::string& body) { return fmt::format("Content-Length: {}\r\n\r\n{}", body.size(), body); }

bool sameValue(const rapidjson::Value& a, const rapidjson::Value& b) { return a == b; }

} // namespace

TEST_CASE_FIXTURE(PipeFixture, "FramedTransport round trip") {
    const char* payloads[] = {
        R"({"jsonrpc":"2.0","id":1,"method":"test"})",
        R"({"jsonrpc":"2.0","method":"window/logMessage","params":{"type":3,"message":"café ☃"}})",
        R"([1,-2,3.5,true,false,null,"x",{"nested":[{}]}])",
        R"("just a string")",
        R"(null)",
    };
    for (auto payload : payloads) {
        rapidjson::Document sent;
        sent.Parse(payload);
        REQUIRE(!sent.HasParseError());
        REQUIRE(transport()->write(sent));

        rapidjson::Document received;
        REQUIRE(transport()->read(received) == FramedTransport::kMessage);
        CHECK(sameValue(received, sent));
    }
    CHECK(errorReporter()->ok());
}

TEST_CASE_FIXTURE(PipeFixture, "FramedTransport end of stream before data") {
    closeWriteEnd();
    rapidjson::Document message;
    CHECK(transport()->read(message) == FramedTransport::kEndOfStream);
    CHECK(errorReporter()->ok());
    // Remains at end of stream.
    CHECK(transport()->read(message) == FramedTransport::kEndOfStream);
}

TEST_CASE_FIXTURE(PipeFixture, "FramedTransport end of stream after a complete frame") {
    writeRaw(frame(R"({"a":1})"));
    closeWriteEnd();
    rapidjson::Document message;
    REQUIRE(transport()->read(message) == FramedTransport::kMessage);
    CHECK(message["a"].GetInt() == 1);
    CHECK(transport()->read(message) == FramedTransport::kEndOfStream);
    CHECK(errorReporter()->ok());
}

TEST_CASE_FIXTURE(PipeFixture, "FramedTransport header handling") {
    SUBCASE("case insensitive header name and extra headers") {
        writeRaw("content-LENGTH:   7  \r\nContent-Type: application/vscode-jsonrpc; charset=utf-8\r\n\r\n{\"a\":1}");
        rapidjson::Document message;
        REQUIRE(transport()->read(message) == FramedTransport::kMessage);
        CHECK(message["a"].GetInt() == 1);
    }
    SUBCASE("non-header lines are skipped") {
        writeRaw("this is not a header\r\nContent-Length: 2\r\n\r\n{}");
        rapidjson::Document message;
        REQUIRE(transport()->read(message) == FramedTransport::kMessage);
        CHECK(message.IsObject());
        CHECK(errorReporter()->ok());
    }
    SUBCASE("blank lines before a frame are skipped") {
        writeRaw("\r\n\r\n" + frame("[]"));
        rapidjson::Document message;
        REQUIRE(transport()->read(message) == FramedTransport::kMessage);
        CHECK(message.IsArray());
    }
    SUBCASE("bare newlines terminate headers") {
        writeRaw("Content-Length: 4\n\ntrue");
        rapidjson::Document message;
        REQUIRE(transport()->read(message) == FramedTransport::kMessage);
        CHECK(message.IsTrue());
    }
    SUBCASE("back to back frames in one write") {
        writeRaw(frame(R"({"id":1})") + frame(R"({"id":2})"));
        rapidjson::Document first;
        rapidjson::Document second;
        REQUIRE(transport()->read(first) == FramedTransport::kMessage);
        REQUIRE(transport()->read(second) == FramedTransport::kMessage);
        CHECK(first["id"].GetInt() == 1);
        CHECK(second["id"].GetInt() == 2);
    }
}

TEST_CASE_FIXTURE(PipeFixture, "FramedTransport framing errors") {
    rapidjson::Document message;
    SUBCASE("missing Content-Length") {
        writeRaw("Content-Type: text/plain\r\n\r\n{}");
        CHECK(transport()->read(message) == FramedTransport::kFramingError);
        CHECK(errorReporter()->hasErrorOfKind(ErrorReporter::kFraming));
        CHECK(errorReporter()->lastErrorMessage() == "missing Content-Length header");
    }
    SUBCASE("unparseable Content-Length") {
        writeRaw("Content-Length: twelve\r\n\r\n{}");
        CHECK(transport()->read(message) == FramedTransport::kFramingError);
        CHECK(errorReporter()->lastErrorMessage().find("twelve") != std::string::npos);
    }
    SUBCASE("end of stream inside headers") {
        writeRaw("Content-Length: 10\r\n");
        closeWriteEnd();
        CHECK(transport()->read(message) == FramedTransport::kFramingError);
        CHECK(errorReporter()->lastErrorMessage().find("headers") != std::string::npos);
    }
    SUBCASE("end of stream inside body") {
        writeRaw("Content-Length: 10\r\n\r\n{\"a\"");
        closeWriteEnd();
        CHECK(transport()->read(message) == FramedTransport::kFramingError);
        CHECK(errorReporter()->lastErrorMessage().find("got 4 of 10 bytes") != std::string::npos);
    }
    SUBCASE("malformed JSON body") {
        writeRaw(frame("{\"a\":}"));
        CHECK(transport()->read(message) == FramedTransport::kFramingError);
        CHECK(errorReporter()->lastErrorMessage().find("invalid JSON") != std::string::npos);
    }
    SUBCASE("invalid UTF-8 body") {
        writeRaw(frame("\"\xff\xfe\""));
        CHECK(transport()->read(message) == FramedTransport::kFramingError);
        CHECK(errorReporter()->hasErrorOfKind(ErrorReporter::kFraming));
    }
    SUBCASE("transport continues after a bad body") {
        writeRaw(frame("nope") + frame("42"));
        CHECK(transport()->read(message) == FramedTransport::kFramingError);
        REQUIRE(transport()->read(message) == FramedTransport::kMessage);
        CHECK(message.GetInt() == 42);
    }
}

TEST_CASE_FIXTURE(PipeFixture, "FramedTransport deadline") {
    SUBCASE("times out with no input") {
        rapidjson::Document message;
        auto start = FramedTransport::Clock::now();
        CHECK(transport()->read(message, start + std::chrono::milliseconds(100)) == FramedTransport::kTimedOut);
        CHECK(FramedTransport::Clock::now() - start >= std::chrono::milliseconds(100));
        CHECK(errorReporter()->ok());
    }
    SUBCASE("resumes a partial frame after timing out") {
        std::string full = frame(R"({"method":"partial"})");
        writeRaw(full.substr(0, 25));
        rapidjson::Document message;
        CHECK(transport()->read(message, FramedTransport::Clock::now() + std::chrono::milliseconds(50)) ==
              FramedTransport::kTimedOut);
        writeRaw(full.substr(25));
        REQUIRE(transport()->read(message, FramedTransport::Clock::now() + std::chrono::seconds(5)) ==
                FramedTransport::kMessage);
        CHECK(std::string(message["method"].GetString()) == "partial");
    }
}

TEST_CASE_FIXTURE(PipeFixture, "FramedTransport write deadline") {
    makeWriteEndNonBlocking();
    rapidjson::Document large;
    makeLargeMessage(large);

    SUBCASE("times out when nothing reads the output") {
        auto start = FramedTransport::Clock::now();
        CHECK(!transport()->write(large, start + std::chrono::milliseconds(200)));
        CHECK(FramedTransport::Clock::now() - start >= std::chrono::milliseconds(200));
        CHECK(errorReporter()->hasErrorOfKind(ErrorReporter::kTimeout));

        // Part of the frame went out, so nothing more can be framed on this stream.
        rapidjson::Document small;
        small.Parse("{}");
        CHECK(!transport()->write(small, FramedTransport::Clock::now() + std::chrono::milliseconds(200)));
        CHECK(errorReporter()->hasErrorOfKind(ErrorReporter::kFraming));
    }
    SUBCASE("waits for a slow reader") {
        rapidjson::Document received;
        FramedTransport::ReadResult readResult = FramedTransport::kTimedOut;
        std::thread reader([this, &received, &readResult] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            readResult = transport()->read(received, FramedTransport::Clock::now() + std::chrono::seconds(5));
        });
        CHECK(transport()->write(large, FramedTransport::Clock::now() + std::chrono::seconds(5)));
        reader.join();
        REQUIRE(readResult == FramedTransport::kMessage);
        CHECK(sameValue(received, large));
        CHECK(errorReporter()->ok());
    }
}

} // namespace pathfinder
