#include "pathfinder/FileURI.hpp"

#include "pathfinder/ErrorReporter.hpp"

#include "fmt/format.h"

#include <array>
#include <system_error>
#include <unordered_map>

namespace {

const std::string_view kFileScheme("file://");

int hexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

bool percentDecode(std::string_view encoded, std::string& decoded) {
    decoded.clear();
    decoded.reserve(encoded.size());
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] != '%') {
            decoded.push_back(encoded[i]);
            continue;
        }
        if (i + 2 >= encoded.size()) {
            return false;
        }
        int high = hexValue(encoded[i + 1]);
        int low = hexValue(encoded[i + 2]);
        if (high < 0 || low < 0) {
            return false;
        }
        decoded.push_back(static_cast<char>((high << 4) | low));
        i += 2;
    }
    return true;
}

bool isUnreserved(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '.' ||
        c == '_' || c == '~' || c == '/';
}

} // namespace

namespace pathfinder {

std::optional<fs::path> uriToPath(std::string_view uri, ErrorReporter* errorReporter) {
    if (uri.substr(0, kFileScheme.size()) != kFileScheme) {
        errorReporter->addError(ErrorReporter::kDocument,
                                fmt::format("only file:// URIs are supported, got '{}'", uri));
        return std::nullopt;
    }

    // Authority runs up to the first slash after the scheme.
    auto remainder = uri.substr(kFileScheme.size());
    auto pathStart = remainder.find('/');
    if (pathStart == std::string_view::npos) {
        errorReporter->addError(ErrorReporter::kDocument, fmt::format("invalid URI '{}': missing path", uri));
        return std::nullopt;
    }
    auto authority = remainder.substr(0, pathStart);
    if (!authority.empty() && authority != "localhost") {
        errorReporter->addError(ErrorReporter::kDocument,
                                fmt::format("only local file:// URIs are supported, got host '{}'", authority));
        return std::nullopt;
    }

    // Drop any query or fragment.
    auto encodedPath = remainder.substr(pathStart);
    auto suffix = encodedPath.find_first_of("?#");
    if (suffix != std::string_view::npos) {
        encodedPath = encodedPath.substr(0, suffix);
    }

    std::string decodedPath;
    if (!percentDecode(encodedPath, decodedPath)) {
        errorReporter->addError(ErrorReporter::kDocument, fmt::format("invalid percent-encoding in URI '{}'", uri));
        return std::nullopt;
    }

    fs::path path(decodedPath);
    std::error_code error;
    if (!fs::exists(path, error)) {
        errorReporter->addFileNotFoundError(path.string());
        return std::nullopt;
    }

    return path;
}

std::string pathToURI(const fs::path& path, bool isDirectory) {
    static const std::array<char, 16> kHexDigits = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                    '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};
    auto generic = path.generic_string();
    std::string uri(kFileScheme);
    if (generic.empty() || generic.front() != '/') {
        uri.push_back('/');
    }
    for (unsigned char c : generic) {
        if (isUnreserved(c)) {
            uri.push_back(static_cast<char>(c));
        } else {
            uri.push_back('%');
            uri.push_back(kHexDigits[c >> 4]);
            uri.push_back(kHexDigits[c & 0x0f]);
        }
    }
    if (isDirectory && uri.back() != '/') {
        uri.push_back('/');
    }
    return uri;
}

std::optional<std::string> extensionFromURI(std::string_view uri) {
    uri = uri.substr(0, uri.find_first_of("?#"));
    auto lastSlash = uri.rfind('/');
    auto segment = lastSlash == std::string_view::npos ? uri : uri.substr(lastSlash + 1);
    auto dot = segment.rfind('.');
    // A leading dot names a hidden file, not an extension.
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == segment.size()) {
        return std::nullopt;
    }
    return std::string(segment.substr(dot + 1));
}

std::string languageIdForPath(const fs::path& path) {
    static const std::unordered_map<std::string, std::string> kLanguageIds = {
        {"rs", "rust"},
        {"go", "go"},
        {"py", "python"},
        {"ts", "typescript"},
        {"tsx", "typescriptreact"},
        {"js", "javascript"},
        {"jsx", "javascriptreact"},
        {"json", "json"},
        {"toml", "toml"},
        {"yaml", "yaml"},
        {"yml", "yaml"},
        {"md", "markdown"},
    };

    auto extension = path.extension().string();
    if (extension.empty() || extension == ".") {
        return "plaintext";
    }
    extension = extension.substr(1);
    auto iter = kLanguageIds.find(extension);
    if (iter == kLanguageIds.end()) {
        return extension;
    }
    return iter->second;
}

} // namespace pathfinder
