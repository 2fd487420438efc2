#ifndef SRC_PATHFINDER_DOCUMENT_SYNCHRONIZER_HPP_
#define SRC_PATHFINDER_DOCUMENT_SYNCHRONIZER_HPP_

#include "pathfinder/internal/FileSystem.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace pathfinder {

class ErrorReporter;
class LSPBridge;

// Tracks which documents the language server has been told about and at what version, and announces opens, changes
// and closes so the server's view matches what is on disk. Modification times decide whether a document changed.
class DocumentSynchronizer {
public:
    DocumentSynchronizer() = delete;
    explicit DocumentSynchronizer(std::shared_ptr<ErrorReporter> errorReporter);
    ~DocumentSynchronizer() = default;

    // Makes sure the server holds the current contents of the file at |uri|, sending didOpen the first time and
    // didChange when the file has been modified since it was last announced. Leaves the tracked state unchanged on
    // failure.
    bool ensureOpen(LSPBridge& bridge, const std::string& uri);

    // Sends didClose for |uri| and forgets it. Returns false if |uri| was not open or the notification failed, the
    // document is forgotten either way.
    bool close(LSPBridge& bridge, const std::string& uri);

    // Sends didClose for every tracked document and then forgets all of them. Failures are reported but do not stop
    // the remaining closes.
    void closeAll(LSPBridge& bridge);

    bool isOpen(const std::string& uri) const { return m_documents.find(uri) != m_documents.end(); }
    // Last version announced for |uri|, if open.
    std::optional<int> version(const std::string& uri) const;
    size_t size() const { return m_documents.size(); }

private:
    struct DocumentState {
        int version;
        fs::file_time_type lastWriteTime;
    };

    bool sendDidClose(LSPBridge& bridge, const std::string& uri);

    std::shared_ptr<ErrorReporter> m_errorReporter;
    std::unordered_map<std::string, DocumentState> m_documents;
};

} // namespace pathfinder

#endif // SRC_PATHFINDER_DOCUMENT_SYNCHRONIZER_HPP_
