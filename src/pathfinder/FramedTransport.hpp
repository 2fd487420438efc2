#ifndef SRC_PATHFINDER_FRAMED_TRANSPORT_HPP_
#define SRC_PATHFINDER_FRAMED_TRANSPORT_HPP_

#include "rapidjson/document.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace pathfinder {

class ErrorReporter;

// Reads and writes Content-Length framed JSON messages over a pair of file descriptors, as used by the Language Server
// Protocol on stdio. Knows nothing of JSON-RPC beyond the framing.
//
// Input is buffered inside the transport and only consumed when a full frame is available, so a read that gives up at
// its deadline in the middle of a frame resumes that same frame on the next call.
class FramedTransport {
public:
    using Clock = std::chrono::steady_clock;

    enum ReadResult {
        kMessage,
        kEndOfStream,
        kTimedOut,
        kFramingError,
    };

    // Frames larger than this are rejected as framing errors.
    static constexpr size_t kMaxContentLength = 64 * 1024 * 1024;

    FramedTransport() = delete;
    // Non-owning descriptors. |inputFd| is read from, |outputFd| written to.
    FramedTransport(int inputFd, int outputFd, std::shared_ptr<ErrorReporter> errorReporter);
    ~FramedTransport();

    // Blocks until a complete frame has arrived and parses its body into |message|, or until |deadline| passes. Returns
    // kEndOfStream, which is not an error, if the stream closes before any header of a new frame.
    ReadResult read(rapidjson::Document& message, std::optional<Clock::time_point> deadline = std::nullopt);

    // Serializes |message| and writes it as a single frame. When |outputFd| is in non-blocking mode a full output is
    // waited on until |deadline|, after which the write fails with a kTimeout error. A frame left partially written
    // makes every later write fail, as the stream can no longer be framed.
    bool write(const rapidjson::Value& message, std::optional<Clock::time_point> deadline = std::nullopt);

private:
    enum FillResult {
        kFilled,
        kFillEndOfStream,
        kFillTimedOut,
        kFillError,
    };
    FillResult fill(std::optional<Clock::time_point> deadline);
    bool consumeHeaderLine(std::string line);
    ReadResult parseBody(const std::string& body, rapidjson::Document& message);
    bool writeAll(const std::string& output, std::optional<Clock::time_point> deadline);
    void resetFrame();

    int m_inputFd;
    int m_outputFd;
    std::shared_ptr<ErrorReporter> m_errorReporter;

    std::string m_buffer;
    // Header names are lowercased.
    std::unordered_map<std::string, std::string> m_headers;
    bool m_readingBody;
    size_t m_contentLength;
    bool m_outputBroken;
};

} // namespace pathfinder

#endif // SRC_PATHFINDER_FRAMED_TRANSPORT_HPP_
