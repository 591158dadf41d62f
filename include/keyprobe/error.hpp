#ifndef KEYPROBE_ERROR_HPP
#define KEYPROBE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace keyprobe {

/**
 * Structured error reporting for fatal conditions.
 * Per-attempt lookup failures are not exceptions; they travel as empty results.
 */

enum class ErrorCode {
    INVALID_ARGUMENT = 1,

    // I/O errors
    FILE_NOT_FOUND = 300,
    READ_FAILED = 301,
    WRITE_FAILED = 302
};

class KeyprobeException : public std::runtime_error {
public:
    explicit KeyprobeException(ErrorCode code, const std::string& message,
                               const std::string& context = "")
        : std::runtime_error(format_message(code, message, context))
        , code_(code)
        , context_(context) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context) {
        std::string result = "keyprobe error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += " (in " + context + ")";
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
};

class InvalidArgumentError : public KeyprobeException {
public:
    explicit InvalidArgumentError(const std::string& message, const std::string& context = "")
        : KeyprobeException(ErrorCode::INVALID_ARGUMENT, message, context) {}
};

class FileNotFoundError : public KeyprobeException {
public:
    explicit FileNotFoundError(const std::string& path, const std::string& context = "")
        : KeyprobeException(ErrorCode::FILE_NOT_FOUND, "File not found: " + path, context)
        , path_(path) {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

class IOError : public KeyprobeException {
public:
    explicit IOError(ErrorCode code, const std::string& message, const std::string& context = "")
        : KeyprobeException(code, message, context) {}
};

#define KEYPROBE_CHECK_ARGUMENT(condition, message) \
    do { \
        if (!(condition)) { \
            throw keyprobe::InvalidArgumentError(message, __func__); \
        } \
    } while (0)

} // namespace keyprobe

#endif // KEYPROBE_ERROR_HPP
