#ifndef SRC_PATHFINDER_LSP_TYPES_HPP_
#define SRC_PATHFINDER_LSP_TYPES_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace pathfinder {
namespace lsp {

// Zero-based, as reported by the language server. Not re-validated here.
struct Range {
    uint32_t startLine = 0;
    uint32_t startCharacter = 0;
    uint32_t endLine = 0;
    uint32_t endCharacter = 0;

    bool operator==(const Range& other) const {
        return startLine == other.startLine && startCharacter == other.startCharacter && endLine == other.endLine &&
            endCharacter == other.endCharacter;
    }
};

struct DefinitionTarget {
    std::string uri;
    Range range;

    bool operator==(const DefinitionTarget& other) const { return uri == other.uri && range == other.range; }
};

struct DefinitionRequest {
    // file:// URI of the document.
    std::string uri;
    uint32_t line = 0;
    uint32_t character = 0;
};

struct DefinitionResponse {
    // In the order the server returned them, possibly empty.
    std::vector<DefinitionTarget> targets;
};

} // namespace lsp
} // namespace pathfinder

#endif // SRC_PATHFINDER_LSP_TYPES_HPP_
