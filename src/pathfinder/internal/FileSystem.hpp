#ifndef SRC_PATHFINDER_INTERNAL_FILE_SYSTEM_HPP_
#define SRC_PATHFINDER_INTERNAL_FILE_SYSTEM_HPP_

#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace pathfinder {

// Returns |path| made absolute against |base| when relative, then canonicalized. Returns an empty path and sets
// |error| if the result does not exist.
fs::path resolveDirectory(const fs::path& path, const fs::path& base, std::error_code& error);

// Final path segment of a directory path, ignoring any trailing separator. Empty if there is none.
std::string directoryName(const fs::path& path);

} // namespace pathfinder

#endif // SRC_PATHFINDER_INTERNAL_FILE_SYSTEM_HPP_
