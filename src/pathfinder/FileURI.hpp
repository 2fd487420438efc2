#ifndef SRC_PATHFINDER_FILE_URI_HPP_
#define SRC_PATHFINDER_FILE_URI_HPP_

#include "pathfinder/internal/FileSystem.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace pathfinder {

class ErrorReporter;

// Converts a file:// URI to a local path. Only the file scheme with an empty or "localhost" authority is accepted, and
// the resulting path must exist. Reports a kDocument error and returns an empty optional otherwise.
std::optional<fs::path> uriToPath(std::string_view uri, ErrorReporter* errorReporter);

// Converts an absolute path to a file:// URI, percent-encoding as needed. Directories get a trailing slash.
std::string pathToURI(const fs::path& path, bool isDirectory = false);

// Extension of the last path segment of |uri| without the dot, if any.
std::optional<std::string> extensionFromURI(std::string_view uri);

// LSP languageId for |path|, looked up by extension. Unknown extensions map to themselves and a missing extension to
// "plaintext".
std::string languageIdForPath(const fs::path& path);

} // namespace pathfinder

#endif // SRC_PATHFINDER_FILE_URI_HPP_
