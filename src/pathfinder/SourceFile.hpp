#ifndef SRC_PATHFINDER_SOURCE_FILE_HPP_
#define SRC_PATHFINDER_SOURCE_FILE_HPP_

#include "pathfinder/internal/FileSystem.hpp"

#include <string>
#include <string_view>

namespace pathfinder {

class ErrorReporter;

// A document on disk whose full text is sent to the language server. Captures the modification time along with the
// contents so callers can compare against what was last announced.
class SourceFile {
public:
    SourceFile() = delete;
    explicit SourceFile(fs::path path);
    ~SourceFile() = default;

    // Reads only the modification time.
    bool stat(ErrorReporter* errorReporter);
    // Reads the modification time and the full contents.
    bool read(ErrorReporter* errorReporter);

    const fs::path& path() const { return m_path; }
    fs::file_time_type lastWriteTime() const { return m_lastWriteTime; }
    const std::string& text() const { return m_text; }
    std::string_view textView() const { return std::string_view(m_text); }

private:
    fs::path m_path;
    fs::file_time_type m_lastWriteTime;
    std::string m_text;
};

} // namespace pathfinder

#endif // SRC_PATHFINDER_SOURCE_FILE_HPP_
