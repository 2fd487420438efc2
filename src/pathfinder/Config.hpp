#ifndef SRC_PATHFINDER_CONFIG_HPP_
#define SRC_PATHFINDER_CONFIG_HPP_

#include "pathfinder/internal/FileSystem.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pathfinder {

class ErrorReporter;

// Which language server to run and for which documents.
struct ServerConfig {
    // Without the leading dot, for example "rs".
    std::vector<std::string> extensions;
    // Executable followed by its arguments.
    std::vector<std::string> command;
    // Relative paths are taken against the workspace base directory.
    fs::path rootDirectory = ".";
};

// Server configuration, read either from a JSON file of the form
//   {"server": {"extensions": ["rs"], "command": ["rust-analyzer"], "rootDir": "."}}
// or assembled from command line flags. All loaders validate before returning true.
class Config {
public:
    Config() = default;
    ~Config() = default;

    bool readFile(const fs::path& path, ErrorReporter* errorReporter);
    bool parse(std::string_view json, ErrorReporter* errorReporter);
    // |extensionList| is comma separated.
    bool setFromFlags(std::string_view extensionList, std::vector<std::string> command, ErrorReporter* errorReporter);

    // Requires at least one extension and a non-empty command.
    bool validate(ErrorReporter* errorReporter) const;

    bool hasExtension(std::string_view extension) const;

    // Resolves the configured root directory against |base| and canonicalizes it. The directory must exist.
    bool resolveRootDirectory(const fs::path& base, fs::path& rootDirectory, ErrorReporter* errorReporter) const;

    const ServerConfig& server() const { return m_server; }

private:
    ServerConfig m_server;
};

} // namespace pathfinder

#endif // SRC_PATHFINDER_CONFIG_HPP_
