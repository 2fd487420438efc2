#include "pathfinder/Config.hpp"

#include "pathfinder/ErrorReporter.hpp"
#include "pathfinder/SourceFile.hpp"

#include "fmt/format.h"
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace {

std::string normalizeExtension(std::string_view extension) {
    while (!extension.empty() && std::isspace(static_cast<unsigned char>(extension.front()))) {
        extension.remove_prefix(1);
    }
    while (!extension.empty() && std::isspace(static_cast<unsigned char>(extension.back()))) {
        extension.remove_suffix(1);
    }
    if (!extension.empty() && extension.front() == '.') {
        extension.remove_prefix(1);
    }
    return std::string(extension);
}

bool readStringArray(const rapidjson::Value& object, const char* name, std::vector<std::string>& strings,
                     pathfinder::ErrorReporter* errorReporter) {
    auto member = object.FindMember(name);
    if (member == object.MemberEnd()) {
        errorReporter->addError(pathfinder::ErrorReporter::kConfiguration,
                                fmt::format("config is missing server.{}", name));
        return false;
    }
    if (!member->value.IsArray()) {
        errorReporter->addError(pathfinder::ErrorReporter::kConfiguration,
                                fmt::format("server.{} must be an array of strings", name));
        return false;
    }
    strings.clear();
    for (const auto& element : member->value.GetArray()) {
        if (!element.IsString()) {
            errorReporter->addError(pathfinder::ErrorReporter::kConfiguration,
                                    fmt::format("server.{} must be an array of strings", name));
            return false;
        }
        strings.emplace_back(element.GetString(), element.GetStringLength());
    }
    return true;
}

} // namespace

namespace pathfinder {

bool Config::readFile(const fs::path& path, ErrorReporter* errorReporter) {
    SourceFile configFile(path);
    if (!configFile.read(errorReporter)) {
        errorReporter->addError(ErrorReporter::kConfiguration,
                                fmt::format("failed to read config file: {}", path.string()));
        return false;
    }
    SPDLOG_DEBUG("Parsing config file {}", path.string());
    return parse(configFile.textView(), errorReporter);
}

bool Config::parse(std::string_view json, ErrorReporter* errorReporter) {
    rapidjson::Document document;
    document.Parse(json.data(), json.size());
    if (document.HasParseError()) {
        errorReporter->addError(ErrorReporter::kConfiguration,
                                fmt::format("failed to parse config JSON at offset {}: {}", document.GetErrorOffset(),
                                            rapidjson::GetParseError_En(document.GetParseError())));
        return false;
    }
    if (!document.IsObject() || !document.HasMember("server") || !document["server"].IsObject()) {
        errorReporter->addError(ErrorReporter::kConfiguration, "config must be an object with a \"server\" object");
        return false;
    }

    const auto& server = document["server"];
    ServerConfig serverConfig;
    std::vector<std::string> extensions;
    if (!readStringArray(server, "extensions", extensions, errorReporter)
        || !readStringArray(server, "command", serverConfig.command, errorReporter)) {
        return false;
    }
    for (const auto& extension : extensions) {
        serverConfig.extensions.emplace_back(normalizeExtension(extension));
    }

    auto rootDir = server.FindMember("rootDir");
    if (rootDir != server.MemberEnd()) {
        if (!rootDir->value.IsString()) {
            errorReporter->addError(ErrorReporter::kConfiguration, "server.rootDir must be a string");
            return false;
        }
        serverConfig.rootDirectory = fs::path(std::string(rootDir->value.GetString(),
                                                          rootDir->value.GetStringLength()));
    }

    std::swap(m_server, serverConfig);
    return validate(errorReporter);
}

bool Config::setFromFlags(std::string_view extensionList, std::vector<std::string> command,
                          ErrorReporter* errorReporter) {
    ServerConfig serverConfig;
    while (!extensionList.empty()) {
        auto comma = extensionList.find(',');
        auto extension = normalizeExtension(extensionList.substr(0, comma));
        if (!extension.empty()) {
            serverConfig.extensions.emplace_back(std::move(extension));
        }
        if (comma == std::string_view::npos) {
            break;
        }
        extensionList.remove_prefix(comma + 1);
    }
    serverConfig.command = std::move(command);

    std::swap(m_server, serverConfig);
    return validate(errorReporter);
}

bool Config::validate(ErrorReporter* errorReporter) const {
    if (m_server.extensions.empty()) {
        errorReporter->addError(ErrorReporter::kConfiguration, "server has no extensions");
        return false;
    }
    if (std::any_of(m_server.extensions.begin(), m_server.extensions.end(),
                    [](const std::string& extension) { return extension.empty(); })) {
        errorReporter->addError(ErrorReporter::kConfiguration, "server has an empty extension");
        return false;
    }
    if (m_server.command.empty() || m_server.command.front().empty()) {
        errorReporter->addError(ErrorReporter::kConfiguration, "server has empty command");
        return false;
    }
    return true;
}

bool Config::hasExtension(std::string_view extension) const {
    return std::find(m_server.extensions.begin(), m_server.extensions.end(), extension) != m_server.extensions.end();
}

bool Config::resolveRootDirectory(const fs::path& base, fs::path& rootDirectory, ErrorReporter* errorReporter) const {
    std::error_code error;
    auto resolved = resolveDirectory(m_server.rootDirectory, base, error);
    if (error) {
        errorReporter->addError(ErrorReporter::kConfiguration,
                                fmt::format("failed to resolve root directory: {}: {}",
                                            (base / m_server.rootDirectory).string(), error.message()));
        return false;
    }
    if (!fs::is_directory(resolved, error)) {
        errorReporter->addError(ErrorReporter::kConfiguration,
                                fmt::format("root directory is not a directory: {}", resolved.string()));
        return false;
    }
    rootDirectory = resolved;
    return true;
}

} // namespace pathfinder
