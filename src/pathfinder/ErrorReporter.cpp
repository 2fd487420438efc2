#include "pathfinder/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace pathfinder {

ErrorReporter::ErrorReporter(bool suppress): m_suppress(suppress) {}

ErrorReporter::~ErrorReporter() {}

void ErrorReporter::addError(ErrorKind kind, const std::string& error) {
    if (!m_suppress) {
        spdlog::error("{} error: {}", kindName(kind), error);
    }
    m_errors.emplace_back(Error{kind, error});
}

void ErrorReporter::addFileNotFoundError(std::string filePath) {
    addError(kDocument, fmt::format("document path does not exist: {}", filePath));
}

void ErrorReporter::addFileOpenError(std::string filePath) {
    addError(kDocument, fmt::format("failed to open {}", filePath));
}

void ErrorReporter::addFileReadError(std::string filePath) {
    addError(kDocument, fmt::format("failed to read {}", filePath));
}

void ErrorReporter::addTimeoutError(std::string_view method, std::chrono::milliseconds timeout) {
    addError(kTimeout, fmt::format("timed out after {}ms waiting for LSP response to '{}'", timeout.count(), method));
}

void ErrorReporter::addRemoteError(std::string_view method, std::string_view payload) {
    addError(kRemote, fmt::format("LSP error for '{}': {}", method, payload));
}

std::string ErrorReporter::lastErrorMessage() const {
    if (m_errors.empty()) {
        return std::string();
    }
    return m_errors.back().message;
}

bool ErrorReporter::hasErrorOfKind(ErrorKind kind) const {
    for (const auto& error : m_errors) {
        if (error.kind == kind) {
            return true;
        }
    }
    return false;
}

const char* ErrorReporter::kindName(ErrorKind kind) {
    switch (kind) {
    case kFraming:
        return "framing";
    case kProtocol:
        return "protocol";
    case kRemote:
        return "remote";
    case kTimeout:
        return "timeout";
    case kProcess:
        return "process";
    case kDocument:
        return "document";
    case kConfiguration:
        return "configuration";
    }
    return "unknown";
}

} // namespace pathfinder
