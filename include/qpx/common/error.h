// =============================================================================
// qpx - Error Handling Framework
// =============================================================================
// Two channels carry failures through the decoder:
//
// - Structural problems in the archive stream (bad magic, bad markers,
//   truncation, directory records) end the run. They are thrown as a
//   QPXException subclass from the reader thread.
// - Work done on pool threads (block decompression, checksum checks,
//   positioned writes) reports a VoidResult. The pool keeps the failures and
//   hands them back when the file is drained.
//
// ErrorCode values double as process exit codes:
//   0 success (a size-limited partial extraction included)
//   1 usage      2 I/O          3 format       4 checksum
//   5 unsupported (directory records)           6 destination exists
//   7 decompression (codec rejected a packet)
// =============================================================================

#ifndef QPX_COMMON_ERROR_H
#define QPX_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

namespace qpx {

// =============================================================================
// Error Code Enumeration
// =============================================================================

enum class ErrorCode : std::uint8_t {
    kSuccess = 0,
    kUsageError = 1,
    /// @note Archive read failure or destination create/write failure.
    kIOError = 2,
    /// @note Bad magic, marker or tail bytes, malformed length-prefixed field,
    ///       archive ending inside a record.
    kFormatError = 3,
    kChecksumError = 4,
    /// @note Directory up/down records are parsed, then rejected.
    kUnsupportedFeature = 5,
    kAlreadyExists = 6,
    kDecompressionFailed = 7,
    /// @note Reported with the usage exit status by the CLI.
    kInvalidArgument = 8
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kChecksumError:
            return "checksum error";
        case ErrorCode::kUnsupportedFeature:
            return "unsupported feature";
        case ErrorCode::kAlreadyExists:
            return "already exists";
        case ErrorCode::kDecompressionFailed:
            return "decompression failed";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
    }
    return "unknown error";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Where in the archive an error happened. Every field is optional.
struct ErrorContext {
    /// @brief Member name, or a filesystem path for destination errors.
    std::string filePath;

    /// @brief Index of the data block within its file.
    std::optional<std::uint32_t> blockIndex;

    /// @brief Byte offset in the archive stream.
    std::optional<std::uint64_t> byteOffset;

    /// @brief Record being read, e.g. "archive header".
    std::string phase;

    ErrorContext() = default;

    explicit ErrorContext(std::string path) : filePath(std::move(path)) {}

    ErrorContext& withBlock(std::uint32_t index) {
        blockIndex = index;
        return *this;
    }

    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    ErrorContext& withPhase(std::string name) {
        phase = std::move(name);
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all qpx errors.
/// @note Provides error code, message, and optional context.
class QPXException : public std::exception {
public:
    QPXException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    QPXException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~QPXException() override = default;

    QPXException(const QPXException&) = default;
    QPXException(QPXException&&) noexcept = default;
    QPXException& operator=(const QPXException&) = default;
    QPXException& operator=(QPXException&&) noexcept = default;

    /// @brief Get the formatted message including code and context.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public QPXException {
public:
    explicit UsageError(std::string message)
        : QPXException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : QPXException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
/// @note Thrown for archive read failures and destination write failures.
class IOError : public QPXException {
public:
    explicit IOError(std::string message)
        : QPXException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : QPXException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : QPXException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Construct from system error code with context.
    IOError(std::string message, std::error_code ec, ErrorContext context)
        : QPXException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                       std::move(context)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for format errors (exit code 3).
/// @note Thrown for invalid magic, bad markers, malformed fields and
///       truncated records.
class FormatError : public QPXException {
public:
    explicit FormatError(std::string message)
        : QPXException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : QPXException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Exception for checksum verification failures (exit code 4).
class ChecksumError : public QPXException {
public:
    explicit ChecksumError(std::string message)
        : QPXException(ErrorCode::kChecksumError, std::move(message)) {}

    ChecksumError(std::string message, ErrorContext context)
        : QPXException(ErrorCode::kChecksumError, std::move(message), std::move(context)) {}

    /// @brief Construct with expected and actual checksum values.
    ChecksumError(std::uint32_t expected, std::uint32_t actual, ErrorContext context)
        : QPXException(ErrorCode::kChecksumError,
                       formatChecksumMismatch(expected, actual),
                       std::move(context)),
          expected_(expected),
          actual_(actual) {}

    [[nodiscard]] std::optional<std::uint32_t> expected() const noexcept { return expected_; }
    [[nodiscard]] std::optional<std::uint32_t> actual() const noexcept { return actual_; }

    /// @brief Build the mismatch message shared with Result-based callers.
    static std::string formatChecksumMismatch(std::uint32_t expected, std::uint32_t actual);

private:
    std::optional<std::uint32_t> expected_;
    std::optional<std::uint32_t> actual_;
};

/// @brief Exception for format features the decoder does not implement
///        (exit code 5).
/// @note Directory up/down records are parsed and then rejected with this
///       error, never with FormatError.
class UnsupportedFeatureError : public QPXException {
public:
    explicit UnsupportedFeatureError(std::string message)
        : QPXException(ErrorCode::kUnsupportedFeature, std::move(message)) {}

    UnsupportedFeatureError(std::string message, ErrorContext context)
        : QPXException(ErrorCode::kUnsupportedFeature, std::move(message), std::move(context)) {}
};

/// @brief Exception for an existing destination file (exit code 6).
class AlreadyExistsError : public QPXException {
public:
    explicit AlreadyExistsError(std::string message)
        : QPXException(ErrorCode::kAlreadyExists, std::move(message)) {}

    AlreadyExistsError(std::string message, ErrorContext context)
        : QPXException(ErrorCode::kAlreadyExists, std::move(message), std::move(context)) {}
};

/// @brief Exception for codec failures (exit code 7).
class DecompressionError : public QPXException {
public:
    explicit DecompressionError(std::string message)
        : QPXException(ErrorCode::kDecompressionFailed, std::move(message)) {}

    DecompressionError(std::string message, ErrorContext context)
        : QPXException(ErrorCode::kDecompressionFailed, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a QPXException, keeping its formatted context.
    explicit Error(const QPXException& ex) : code_(ex.code()), message_(ex.message()) {
        if (ex.hasContext()) {
            std::string contextStr = ex.context()->format();
            if (!contextStr.empty()) {
                message_ += " (" + contextStr + ")";
            }
        }
    }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception type matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Convert a Result to an exception if it contains an error.
/// @throws QPXException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Convert a VoidResult to an exception if it contains an error.
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

}  // namespace qpx

#endif  // QPX_COMMON_ERROR_H
