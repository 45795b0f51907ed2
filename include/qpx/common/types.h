// =============================================================================
// qpx - Common Type Definitions
// =============================================================================
// Core type definitions shared by the qpx decoder modules.
//
// This module defines:
// - FileOffset, BlockIndex, ByteLimit: type aliases
// - ChecksumPolicy: what to do with the per-block checksum
// - Byte span aliases used across codec, reader and sink interfaces
// =============================================================================

#ifndef QPX_COMMON_TYPES_H
#define QPX_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace qpx {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Byte offset within a reconstructed (decompressed) file.
using FileOffset = std::uint64_t;

/// @brief Zero-based position of a data block within its file.
using BlockIndex = std::uint32_t;

/// @brief Partial-extraction limit in bytes. Values <= 0 mean unbounded.
using ByteLimit = std::int64_t;

/// @brief Owned byte buffer.
using ByteBuffer = std::vector<std::uint8_t>;

/// @brief Read-only byte view.
using ByteSpan = std::span<const std::uint8_t>;

/// @brief Writable byte view.
using MutableByteSpan = std::span<std::uint8_t>;

// =============================================================================
// Constants
// =============================================================================

/// @brief Size limit value meaning "no limit".
inline constexpr ByteLimit kUnboundedLimit = 0;

/// @brief Default number of decompression workers.
inline constexpr std::size_t kDefaultWorkerCount = 10;

/// @brief Default number of queued (not yet running) block tasks.
inline constexpr std::size_t kDefaultQueueCapacity = 40;

// =============================================================================
// Checksum Policy
// =============================================================================

/// @brief Handling of the Adler-32 checksum stored with every data block.
enum class ChecksumPolicy : std::uint8_t {
    /// @brief Do not compute the checksum.
    kIgnore = 0,

    /// @brief Compute it and log a warning on mismatch.
    kWarn = 1,

    /// @brief Compute it and fail the owning file on mismatch.
    kVerify = 2
};

[[nodiscard]] constexpr std::string_view checksumPolicyToString(ChecksumPolicy policy) noexcept {
    switch (policy) {
        case ChecksumPolicy::kIgnore:
            return "ignore";
        case ChecksumPolicy::kWarn:
            return "warn";
        case ChecksumPolicy::kVerify:
            return "verify";
    }
    return "ignore";
}

/// @brief Parse a checksum policy name.
/// @return Policy, or nullopt for an unknown name.
[[nodiscard]] constexpr std::optional<ChecksumPolicy> parseChecksumPolicy(
    std::string_view name) noexcept {
    if (name == "ignore") {
        return ChecksumPolicy::kIgnore;
    }
    if (name == "warn") {
        return ChecksumPolicy::kWarn;
    }
    if (name == "verify") {
        return ChecksumPolicy::kVerify;
    }
    return std::nullopt;
}

}  // namespace qpx

#endif  // QPX_COMMON_TYPES_H
