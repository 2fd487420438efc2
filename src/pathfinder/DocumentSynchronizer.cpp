#include "pathfinder/DocumentSynchronizer.hpp"

#include "pathfinder/ErrorReporter.hpp"
#include "pathfinder/FileURI.hpp"
#include "pathfinder/LSPBridge.hpp"
#include "pathfinder/SourceFile.hpp"

#include "rapidjson/document.h"
#include "spdlog/spdlog.h"

namespace {

rapidjson::Value makeString(const std::string& string, rapidjson::Document::AllocatorType& allocator) {
    return rapidjson::Value(string.data(), static_cast<rapidjson::SizeType>(string.size()), allocator);
}

} // namespace

namespace pathfinder {

DocumentSynchronizer::DocumentSynchronizer(std::shared_ptr<ErrorReporter> errorReporter):
    m_errorReporter(std::move(errorReporter)) {}

bool DocumentSynchronizer::ensureOpen(LSPBridge& bridge, const std::string& uri) {
    auto path = uriToPath(uri, m_errorReporter.get());
    if (!path) {
        return false;
    }

    SourceFile sourceFile(*path);
    if (!sourceFile.stat(m_errorReporter.get())) {
        return false;
    }

    auto iter = m_documents.find(uri);
    if (iter != m_documents.end() && iter->second.lastWriteTime >= sourceFile.lastWriteTime()) {
        SPDLOG_TRACE("Document {} unchanged at version {}", uri, iter->second.version);
        return true;
    }

    if (!sourceFile.read(m_errorReporter.get())) {
        return false;
    }

    rapidjson::Document params;
    params.SetObject();
    auto& allocator = params.GetAllocator();
    rapidjson::Value textDocument(rapidjson::kObjectType);
    textDocument.AddMember("uri", makeString(uri, allocator), allocator);

    if (iter == m_documents.end()) {
        textDocument.AddMember("languageId", makeString(languageIdForPath(*path), allocator), allocator);
        textDocument.AddMember("version", rapidjson::Value(1), allocator);
        textDocument.AddMember("text", makeString(sourceFile.text(), allocator), allocator);
        params.AddMember("textDocument", textDocument, allocator);
        if (!bridge.notify("textDocument/didOpen", params)) {
            return false;
        }
        m_documents.emplace(uri, DocumentState{1, sourceFile.lastWriteTime()});
        SPDLOG_DEBUG("Opened document {}", uri);
        return true;
    }

    int version = iter->second.version + 1;
    textDocument.AddMember("version", rapidjson::Value(version), allocator);
    params.AddMember("textDocument", textDocument, allocator);
    rapidjson::Value change(rapidjson::kObjectType);
    change.AddMember("text", makeString(sourceFile.text(), allocator), allocator);
    rapidjson::Value contentChanges(rapidjson::kArrayType);
    contentChanges.PushBack(change, allocator);
    params.AddMember("contentChanges", contentChanges, allocator);
    if (!bridge.notify("textDocument/didChange", params)) {
        return false;
    }
    iter->second = DocumentState{version, sourceFile.lastWriteTime()};
    SPDLOG_DEBUG("Updated document {} to version {}", uri, version);
    return true;
}

bool DocumentSynchronizer::close(LSPBridge& bridge, const std::string& uri) {
    auto iter = m_documents.find(uri);
    if (iter == m_documents.end()) {
        SPDLOG_WARN("Asked to close document {} which is not open.", uri);
        return false;
    }
    m_documents.erase(iter);
    return sendDidClose(bridge, uri);
}

void DocumentSynchronizer::closeAll(LSPBridge& bridge) {
    size_t failures = 0;
    for (const auto& document : m_documents) {
        if (!sendDidClose(bridge, document.first)) {
            ++failures;
        }
    }
    if (failures) {
        SPDLOG_WARN("Failed to close {} of {} documents.", failures, m_documents.size());
    }
    m_documents.clear();
}

std::optional<int> DocumentSynchronizer::version(const std::string& uri) const {
    auto iter = m_documents.find(uri);
    if (iter == m_documents.end()) {
        return std::nullopt;
    }
    return iter->second.version;
}

bool DocumentSynchronizer::sendDidClose(LSPBridge& bridge, const std::string& uri) {
    rapidjson::Document params;
    params.SetObject();
    auto& allocator = params.GetAllocator();
    rapidjson::Value textDocument(rapidjson::kObjectType);
    textDocument.AddMember("uri", makeString(uri, allocator), allocator);
    params.AddMember("textDocument", textDocument, allocator);
    if (!bridge.notify("textDocument/didClose", params)) {
        SPDLOG_WARN("Failed to send didClose for {}", uri);
        return false;
    }
    SPDLOG_DEBUG("Closed document {}", uri);
    return true;
}

} // namespace pathfinder
