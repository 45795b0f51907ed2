// =============================================================================
// qpx - Error Handling Framework Implementation
// =============================================================================

#include "qpx/common/error.h"

#include <format>
#include <vector>

namespace qpx {

namespace {

std::string joinParts(const std::vector<std::string>& parts) {
    std::string joined;
    for (const auto& part : parts) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += part;
    }
    return joined;
}

}  // namespace

// Most specific location first: member, then block, then archive offset.
std::string ErrorContext::format() const {
    std::vector<std::string> parts;
    parts.reserve(4);

    if (!filePath.empty()) {
        parts.push_back(std::format("file: {}", filePath));
    }
    if (blockIndex.has_value()) {
        parts.push_back(std::format("block: {}", *blockIndex));
    }
    if (byteOffset.has_value()) {
        parts.push_back(std::format("offset: 0x{:x}", *byteOffset));
    }
    if (!phase.empty()) {
        parts.push_back(std::format("phase: {}", phase));
    }

    return joinParts(parts);
}

void QPXException::formatWhat() {
    what_ = std::format("[{}] {}", errorCodeToString(code_), message_);
    if (!context_.has_value()) {
        return;
    }
    if (const std::string where = context_->format(); !where.empty()) {
        what_ += std::format(" ({})", where);
    }
}

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return std::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string ChecksumError::formatChecksumMismatch(std::uint32_t expected, std::uint32_t actual) {
    return std::format("checksum mismatch: expected 0x{:08x}, got 0x{:08x}", expected, actual);
}

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kChecksumError:
            throw ChecksumError(message_);
        case ErrorCode::kUnsupportedFeature:
            throw UnsupportedFeatureError(message_);
        case ErrorCode::kAlreadyExists:
            throw AlreadyExistsError(message_);
        case ErrorCode::kDecompressionFailed:
            throw DecompressionError(message_);
        case ErrorCode::kUsageError:
        case ErrorCode::kInvalidArgument:
            throw UsageError(message_);
        case ErrorCode::kSuccess:
            break;
    }
    throw QPXException(code_, message_);
}

}  // namespace qpx
