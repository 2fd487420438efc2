#include "pathfinder/FramedTransport.hpp"

#include "pathfinder/ErrorReporter.hpp"

#include "fmt/format.h"
#include "rapidjson/error/en.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace {

std::string trim(const std::string& input) {
    auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return std::string();
    }
    auto end = input.find_last_not_of(" \t\r\n");
    return input.substr(begin, end - begin + 1);
}

// Milliseconds left until |deadline| for poll(), -1 to wait indefinitely.
int pollTimeout(std::optional<pathfinder::FramedTransport::Clock::time_point> deadline) {
    if (!deadline) {
        return -1;
    }
    auto remaining =
        std::chrono::ceil<std::chrono::milliseconds>(*deadline - pathfinder::FramedTransport::Clock::now());
    return static_cast<int>(std::max<std::chrono::milliseconds::rep>(remaining.count(), 0));
}

} // namespace

namespace pathfinder {

FramedTransport::FramedTransport(int inputFd, int outputFd, std::shared_ptr<ErrorReporter> errorReporter):
    m_inputFd(inputFd),
    m_outputFd(outputFd),
    m_errorReporter(std::move(errorReporter)),
    m_readingBody(false),
    m_contentLength(0),
    m_outputBroken(false) {}

FramedTransport::~FramedTransport() {}

FramedTransport::ReadResult FramedTransport::read(rapidjson::Document& message,
                                                  std::optional<Clock::time_point> deadline) {
    while (true) {
        if (!m_readingBody) {
            auto lineEnd = m_buffer.find('\n');
            if (lineEnd != std::string::npos) {
                std::string line = m_buffer.substr(0, lineEnd);
                m_buffer.erase(0, lineEnd + 1);
                if (!consumeHeaderLine(std::move(line))) {
                    return kFramingError;
                }
                continue;
            }
        } else if (m_buffer.size() >= m_contentLength) {
            std::string body = m_buffer.substr(0, m_contentLength);
            m_buffer.erase(0, m_contentLength);
            resetFrame();
            return parseBody(body, message);
        }

        auto fillResult = fill(deadline);
        if (fillResult == kFilled) {
            continue;
        } else if (fillResult == kFillTimedOut) {
            return kTimedOut;
        } else if (fillResult == kFillError) {
            resetFrame();
            return kFramingError;
        }

        // End of stream. A final header line may be missing its line terminator.
        if (!m_readingBody && !m_buffer.empty()) {
            std::string line;
            line.swap(m_buffer);
            if (!consumeHeaderLine(std::move(line))) {
                return kFramingError;
            }
        }

        if (!m_readingBody && m_headers.empty()) {
            SPDLOG_DEBUG("End of stream on descriptor {}.", m_inputFd);
            return kEndOfStream;
        }

        if (m_readingBody) {
            m_errorReporter->addError(ErrorReporter::kFraming,
                                      fmt::format("unexpected end of stream while reading body, got {} of {} bytes",
                                                  m_buffer.size(), m_contentLength));
        } else {
            m_errorReporter->addError(ErrorReporter::kFraming, "unexpected end of stream while reading headers");
        }
        m_buffer.clear();
        resetFrame();
        return kFramingError;
    }
}

bool FramedTransport::write(const rapidjson::Value& message, std::optional<Clock::time_point> deadline) {
    // Serialize the message to memory to compute its length, needed for the header.
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    if (!message.Accept(writer)) {
        m_errorReporter->addError(ErrorReporter::kFraming, "failed to serialize JSON payload");
        return false;
    }
    std::string output = fmt::format("Content-Length: {}\r\n\r\n", buffer.GetSize());
    output.append(buffer.GetString(), buffer.GetSize());
    SPDLOG_TRACE("Writing {} byte frame", buffer.GetSize());
    return writeAll(output, deadline);
}

FramedTransport::FillResult FramedTransport::fill(std::optional<Clock::time_point> deadline) {
    std::array<char, 4096> chunk;
    while (true) {
        struct pollfd pollDescriptor;
        pollDescriptor.fd = m_inputFd;
        pollDescriptor.events = POLLIN;
        pollDescriptor.revents = 0;
        int pollResult = ::poll(&pollDescriptor, 1, pollTimeout(deadline));
        if (pollResult < 0) {
            if (errno == EINTR) {
                continue;
            }
            m_errorReporter->addError(ErrorReporter::kFraming,
                                      fmt::format("failed to wait for input: {}", std::strerror(errno)));
            return kFillError;
        }
        if (pollResult == 0) {
            return kFillTimedOut;
        }

        ssize_t bytesRead = ::read(m_inputFd, chunk.data(), chunk.size());
        if (bytesRead < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            m_errorReporter->addError(ErrorReporter::kFraming,
                                      fmt::format("failed to read input: {}", std::strerror(errno)));
            return kFillError;
        }
        if (bytesRead == 0) {
            return kFillEndOfStream;
        }

        m_buffer.append(chunk.data(), static_cast<size_t>(bytesRead));
        return kFilled;
    }
}

bool FramedTransport::consumeHeaderLine(std::string line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    if (line.empty()) {
        // Blank lines ahead of a frame are tolerated.
        if (m_headers.empty()) {
            return true;
        }

        auto lengthHeader = m_headers.find("content-length");
        if (lengthHeader == m_headers.end()) {
            m_errorReporter->addError(ErrorReporter::kFraming, "missing Content-Length header");
            resetFrame();
            return false;
        }

        const auto& value = lengthHeader->second;
        size_t contentLength = 0;
        auto [end, error] = std::from_chars(value.data(), value.data() + value.size(), contentLength);
        if (error != std::errc() || end != value.data() + value.size()) {
            m_errorReporter->addError(ErrorReporter::kFraming,
                                      fmt::format("could not parse Content-Length header '{}'", value));
            resetFrame();
            return false;
        }
        if (contentLength > kMaxContentLength) {
            m_errorReporter->addError(ErrorReporter::kFraming,
                                      fmt::format("rejecting Content-Length {} > {}", contentLength,
                                                  kMaxContentLength));
            resetFrame();
            return false;
        }

        SPDLOG_TRACE("Parsed end of headers, Content-Length {}", contentLength);
        m_contentLength = contentLength;
        m_readingBody = true;
        return true;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) {
        SPDLOG_WARN("Ignoring non-header line from language server: {}", line);
        return true;
    }

    std::string name = trim(line.substr(0, colon));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    m_headers[name] = trim(line.substr(colon + 1));
    return true;
}

FramedTransport::ReadResult FramedTransport::parseBody(const std::string& body, rapidjson::Document& message) {
    rapidjson::ParseResult parseResult =
        message.Parse<rapidjson::kParseValidateEncodingFlag>(body.data(), body.size());
    if (!parseResult) {
        m_errorReporter->addError(ErrorReporter::kFraming,
                                  fmt::format("invalid JSON in framed payload at offset {}: {}",
                                              parseResult.Offset(), rapidjson::GetParseError_En(parseResult.Code())));
        return kFramingError;
    }
    SPDLOG_TRACE("Read {} JSON bytes", body.size());
    return kMessage;
}

bool FramedTransport::writeAll(const std::string& output, std::optional<Clock::time_point> deadline) {
    if (m_outputBroken) {
        m_errorReporter->addError(ErrorReporter::kFraming, "output stream unusable after an incomplete frame write");
        return false;
    }

    size_t written = 0;
    while (written < output.size()) {
        ssize_t result = ::write(m_outputFd, output.data() + written, output.size() - written);
        if (result >= 0) {
            written += static_cast<size_t>(result);
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            m_outputBroken = written > 0;
            m_errorReporter->addError(ErrorReporter::kFraming,
                                      fmt::format("failed to write frame: {}", std::strerror(errno)));
            return false;
        }

        // The reader is not keeping up, wait for room in the output.
        struct pollfd pollDescriptor;
        pollDescriptor.fd = m_outputFd;
        pollDescriptor.events = POLLOUT;
        pollDescriptor.revents = 0;
        int pollResult = ::poll(&pollDescriptor, 1, pollTimeout(deadline));
        if (pollResult < 0 && errno != EINTR) {
            m_outputBroken = written > 0;
            m_errorReporter->addError(ErrorReporter::kFraming,
                                      fmt::format("failed to wait for output: {}", std::strerror(errno)));
            return false;
        }
        if (pollResult == 0) {
            m_outputBroken = written > 0;
            m_errorReporter->addError(ErrorReporter::kTimeout,
                                      fmt::format("timed out writing frame after {} of {} bytes", written,
                                                  output.size()));
            return false;
        }
    }
    return true;
}

void FramedTransport::resetFrame() {
    m_headers.clear();
    m_readingBody = false;
    m_contentLength = 0;
}

} // namespace pathfinder
