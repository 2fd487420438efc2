#ifndef SRC_PATHFINDER_ERROR_REPORTER_HPP_
#define SRC_PATHFINDER_ERROR_REPORTER_HPP_

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace pathfinder {

class ErrorReporter {
public:
    enum ErrorKind {
        kFraming,
        kProtocol,
        kRemote,
        kTimeout,
        kProcess,
        kDocument,
        kConfiguration,
    };

    struct Error {
        ErrorKind kind;
        std::string message;
    };

    // If suppress is true, will not print reported errors to log (useful for testing failures without
    // polluting the log)
    explicit ErrorReporter(bool suppress = false);
    ~ErrorReporter();

    void addError(ErrorKind kind, const std::string& error);

    // Specific errors.

    // Unable to locate a file under filePath.
    void addFileNotFoundError(std::string filePath);
    // Unable to open file at filePath.
    void addFileOpenError(std::string filePath);
    // Failed to read file at filePath.
    void addFileReadError(std::string filePath);
    // No response to method arrived before the request deadline.
    void addTimeoutError(std::string_view method, std::chrono::milliseconds timeout);
    // The language server answered method with an error object, serialized in payload.
    void addRemoteError(std::string_view method, std::string_view payload);

    size_t errorCount() const { return m_errors.size(); }
    bool ok() const { return m_errors.size() == 0; }
    const std::vector<Error>& errors() const { return m_errors; }

    // Message of the most recently reported error, or an empty string if there are none.
    std::string lastErrorMessage() const;
    bool hasErrorOfKind(ErrorKind kind) const;

    void reset() { m_errors.clear(); }

    static const char* kindName(ErrorKind kind);

private:
    bool m_suppress;
    std::vector<Error> m_errors;
};

} // namespace pathfinder

#endif // SRC_PATHFINDER_ERROR_REPORTER_HPP_
