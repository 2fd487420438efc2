#include "pathfinder/SourceFile.hpp"

#include "pathfinder/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <fstream>
#include <system_error>

namespace pathfinder {

SourceFile::SourceFile(fs::path path): m_path(std::move(path)), m_lastWriteTime(fs::file_time_type::min()) {}

bool SourceFile::stat(ErrorReporter* errorReporter) {
    std::error_code error;
    if (!fs::exists(m_path, error)) {
        errorReporter->addFileNotFoundError(m_path.string());
        return false;
    }

    m_lastWriteTime = fs::last_write_time(m_path, error);
    if (error) {
        errorReporter->addError(ErrorReporter::kDocument,
                                fmt::format("failed to read metadata for {}: {}", m_path.string(), error.message()));
        return false;
    }

    return true;
}

bool SourceFile::read(ErrorReporter* errorReporter) {
    if (!stat(errorReporter)) {
        return false;
    }

    std::error_code error;
    auto fileSize = fs::file_size(m_path, error);
    if (error) {
        errorReporter->addFileReadError(m_path.string());
        return false;
    }

    std::ifstream inFile(m_path, std::ifstream::binary);
    if (!inFile) {
        errorReporter->addFileOpenError(m_path.string());
        return false;
    }
    m_text.resize(fileSize);
    inFile.read(m_text.data(), static_cast<std::streamsize>(fileSize));
    if (!inFile) {
        errorReporter->addFileReadError(m_path.string());
        return false;
    }

    SPDLOG_TRACE("Read {} bytes from {}", m_text.size(), m_path.string());
    return true;
}

} // namespace pathfinder
