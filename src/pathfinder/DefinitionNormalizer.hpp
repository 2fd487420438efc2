#ifndef SRC_PATHFINDER_DEFINITION_NORMALIZER_HPP_
#define SRC_PATHFINDER_DEFINITION_NORMALIZER_HPP_

#include "pathfinder/LSPTypes.hpp"

#include "rapidjson/document.h"

#include <chrono>
#include <memory>
#include <vector>

namespace pathfinder {

class ErrorReporter;
class LSPBridge;

// Issues textDocument/definition and converts the reply, which may be null, a Location, an array of Locations or an
// array of LocationLinks, into a list of DefinitionTargets. Servers that are still indexing answer with empty results,
// so empty replies are retried a bounded number of times before being accepted.
class DefinitionNormalizer {
public:
    static constexpr int kDefaultMaxAttempts = 3;
    static constexpr std::chrono::milliseconds kDefaultRetryDelay = std::chrono::milliseconds(150);

    DefinitionNormalizer() = delete;
    explicit DefinitionNormalizer(std::shared_ptr<ErrorReporter> errorReporter);
    ~DefinitionNormalizer() = default;

    // Fills |response| with the targets for |request|. An empty response after the last attempt is a success. A failed
    // request or a reply of unexpected shape stops immediately without retrying.
    bool execute(LSPBridge& bridge, const lsp::DefinitionRequest& request, lsp::DefinitionResponse& response);

    // Converts a raw definition reply, appending to |targets|. Reports a kProtocol error on any malformed entry.
    static bool normalize(const rapidjson::Value& reply, std::vector<lsp::DefinitionTarget>& targets,
                          ErrorReporter* errorReporter);

    int maxAttempts() const { return m_maxAttempts; }
    // At least one attempt is always made.
    void setMaxAttempts(int maxAttempts) { m_maxAttempts = maxAttempts > 0 ? maxAttempts : 1; }
    std::chrono::milliseconds retryDelay() const { return m_retryDelay; }
    void setRetryDelay(std::chrono::milliseconds retryDelay) { m_retryDelay = retryDelay; }

private:
    static bool convertLocation(const rapidjson::Value& entry, lsp::DefinitionTarget& target,
                                ErrorReporter* errorReporter);
    static bool parseRange(const rapidjson::Value& value, lsp::Range& range, ErrorReporter* errorReporter);

    std::shared_ptr<ErrorReporter> m_errorReporter;
    int m_maxAttempts;
    std::chrono::milliseconds m_retryDelay;
};

} // namespace pathfinder

#endif // SRC_PATHFINDER_DEFINITION_NORMALIZER_HPP_
