#include "pathfinder/DefinitionNormalizer.hpp"

#include "pathfinder/ErrorReporter.hpp"
#include "pathfinder/LSPBridge.hpp"

#include "fmt/format.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"
#include "spdlog/spdlog.h"

#include <string>
#include <thread>

namespace {

std::string serialize(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

bool getCoordinate(const rapidjson::Value& position, const char* coordinate, const char* label, uint32_t& value,
                   pathfinder::ErrorReporter* errorReporter) {
    if (position.IsObject()) {
        auto member = position.FindMember(coordinate);
        if (member != position.MemberEnd() && member->value.IsUint()) {
            value = member->value.GetUint();
            return true;
        }
    }
    errorReporter->addError(pathfinder::ErrorReporter::kProtocol,
                            fmt::format("range.{}.{} must be an unsigned integer", label, coordinate));
    return false;
}

} // namespace

namespace pathfinder {

DefinitionNormalizer::DefinitionNormalizer(std::shared_ptr<ErrorReporter> errorReporter):
    m_errorReporter(std::move(errorReporter)),
    m_maxAttempts(kDefaultMaxAttempts),
    m_retryDelay(kDefaultRetryDelay) {}

bool DefinitionNormalizer::execute(LSPBridge& bridge, const lsp::DefinitionRequest& request,
                                   lsp::DefinitionResponse& response) {
    rapidjson::Document params;
    params.SetObject();
    auto& allocator = params.GetAllocator();
    rapidjson::Value textDocument(rapidjson::kObjectType);
    textDocument.AddMember("uri", rapidjson::Value(request.uri.c_str(), allocator), allocator);
    params.AddMember("textDocument", textDocument, allocator);
    rapidjson::Value position(rapidjson::kObjectType);
    position.AddMember("line", rapidjson::Value(request.line), allocator);
    position.AddMember("character", rapidjson::Value(request.character), allocator);
    params.AddMember("position", position, allocator);

    response.targets.clear();
    for (int attempt = 1; attempt <= m_maxAttempts; ++attempt) {
        rapidjson::Document reply;
        if (!bridge.request("textDocument/definition", params, reply)) {
            return false;
        }
        std::vector<lsp::DefinitionTarget> targets;
        if (!normalize(reply, targets, m_errorReporter.get())) {
            return false;
        }

        if (!targets.empty()) {
            if (attempt > 1) {
                SPDLOG_DEBUG("Definition for {} succeeded on attempt {}", request.uri, attempt);
            }
            response.targets = std::move(targets);
            return true;
        }

        if (attempt < m_maxAttempts) {
            SPDLOG_DEBUG("Definition for {} empty on attempt {}, retrying in {}ms", request.uri, attempt,
                         m_retryDelay.count());
            std::this_thread::sleep_for(m_retryDelay);
        }
    }

    SPDLOG_DEBUG("Definition for {} still empty after {} attempts", request.uri, m_maxAttempts);
    return true;
}

// static
bool DefinitionNormalizer::normalize(const rapidjson::Value& reply, std::vector<lsp::DefinitionTarget>& targets,
                                     ErrorReporter* errorReporter) {
    if (reply.IsNull()) {
        return true;
    }

    if (reply.IsArray()) {
        targets.reserve(targets.size() + reply.Size());
        for (const auto& entry : reply.GetArray()) {
            lsp::DefinitionTarget target;
            if (!convertLocation(entry, target, errorReporter)) {
                return false;
            }
            targets.emplace_back(std::move(target));
        }
        return true;
    }

    if (reply.IsObject()) {
        lsp::DefinitionTarget target;
        if (!convertLocation(reply, target, errorReporter)) {
            return false;
        }
        targets.emplace_back(std::move(target));
        return true;
    }

    errorReporter->addError(ErrorReporter::kProtocol,
                            fmt::format("unexpected definition response format: {}", serialize(reply)));
    return false;
}

// static
bool DefinitionNormalizer::convertLocation(const rapidjson::Value& entry, lsp::DefinitionTarget& target,
                                           ErrorReporter* errorReporter) {
    if (!entry.IsObject()) {
        errorReporter->addError(ErrorReporter::kProtocol, "definition entry must be an object");
        return false;
    }

    // Location carries uri and range, LocationLink carries targetUri and targetRange.
    const char* uriName = nullptr;
    const char* rangeName = nullptr;
    if (entry.HasMember("uri")) {
        uriName = "uri";
        rangeName = "range";
    } else if (entry.HasMember("targetUri")) {
        uriName = "targetUri";
        rangeName = "targetRange";
    } else {
        errorReporter->addError(ErrorReporter::kProtocol,
                                fmt::format("definition entry missing required fields (expected 'uri' or "
                                            "'targetUri'): {}",
                                            serialize(entry)));
        return false;
    }

    const auto& uri = entry[uriName];
    if (!uri.IsString()) {
        errorReporter->addError(ErrorReporter::kProtocol, fmt::format("{} must be a string", uriName));
        return false;
    }
    auto range = entry.FindMember(rangeName);
    if (range == entry.MemberEnd()) {
        errorReporter->addError(ErrorReporter::kProtocol, fmt::format("{} missing", rangeName));
        return false;
    }
    if (!parseRange(range->value, target.range, errorReporter)) {
        return false;
    }
    target.uri.assign(uri.GetString(), uri.GetStringLength());
    return true;
}

// static
bool DefinitionNormalizer::parseRange(const rapidjson::Value& value, lsp::Range& range, ErrorReporter* errorReporter) {
    if (!value.IsObject()) {
        errorReporter->addError(ErrorReporter::kProtocol, "range must be an object");
        return false;
    }
    auto start = value.FindMember("start");
    if (start == value.MemberEnd()) {
        errorReporter->addError(ErrorReporter::kProtocol, "range.start missing");
        return false;
    }
    auto end = value.FindMember("end");
    if (end == value.MemberEnd()) {
        errorReporter->addError(ErrorReporter::kProtocol, "range.end missing");
        return false;
    }

    return getCoordinate(start->value, "line", "start", range.startLine, errorReporter) &&
        getCoordinate(start->value, "character", "start", range.startCharacter, errorReporter) &&
        getCoordinate(end->value, "line", "end", range.endLine, errorReporter) &&
        getCoordinate(end->value, "character", "end", range.endCharacter, errorReporter);
}

} // namespace pathfinder
