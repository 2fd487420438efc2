#include "pathfinder/internal/FileSystem.hpp"

#include "spdlog/spdlog.h"

namespace pathfinder {

fs::path resolveDirectory(const fs::path& path, const fs::path& base, std::error_code& error) {
    auto absolute = path.is_absolute() ? path : base / path;
    auto canonical = fs::canonical(absolute, error);
    if (error) {
        SPDLOG_DEBUG("Failed to canonicalize {}: {}", absolute.string(), error.message());
        return fs::path();
    }
    return canonical;
}

std::string directoryName(const fs::path& path) {
    auto name = path.filename();
    if (name.empty()) {
        name = path.parent_path().filename();
    }
    return name.string();
}

} // namespace pathfinder
