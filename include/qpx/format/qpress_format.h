// =============================================================================
// qpx - qpress Archive Format Definitions
// =============================================================================
// Binary format definitions for the qpress archive container.
//
// This module defines:
// - Archive magic and record marker constants
// - ArchiveHeader, Target (UpDirectory | DownDirectory | FileHeader)
// - DataBlock and FileTrailer records
//
// Archive Layout (all integers little-endian):
//
//   ARCHIVE        = ARCHIVE_HEADER (UP | DOWN | FILE)*
//   ARCHIVE_HEADER = "qpress10" chunkSize:u64
//   UP             = 'U'
//   DOWN           = 'D' nameLen:u32 name[nameLen] 0x00
//   FILE           = 'F' nameLen:u32 name[nameLen] 0x00 BLOCK* TRAILER
//   BLOCK          = "NEWBNEWB" recoveryInfo[8] adler32:u32 packet
//   TRAILER        = "ENDSENDS" recoveryInfo[8]
//
// The first byte of "NEWBNEWB" / "ENDSENDS" doubles as the record marker;
// the remaining seven bytes are the starter tail. A zero type byte or the
// end of the stream terminates the archive.
// =============================================================================

#ifndef QPX_FORMAT_QPRESS_FORMAT_H
#define QPX_FORMAT_QPRESS_FORMAT_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "qpx/common/types.h"

namespace qpx::format {

// =============================================================================
// Constants
// =============================================================================

/// @brief Archive magic "qpress10".
inline constexpr std::array<std::uint8_t, 8> kArchiveMagic = {
    'q', 'p', 'r', 'e', 's', 's', '1', '0'
};

/// @brief Starter tail following the 'N' block marker ("EWBNEWB").
inline constexpr std::array<std::uint8_t, 7> kBlockStarterTail = {
    'E', 'W', 'B', 'N', 'E', 'W', 'B'
};

/// @brief Starter tail following the 'E' trailer marker ("NDSENDS").
inline constexpr std::array<std::uint8_t, 7> kTrailerStarterTail = {
    'N', 'D', 'S', 'E', 'N', 'D', 'S'
};

/// @brief Terminator byte after every length-prefixed name.
inline constexpr std::uint8_t kNameTerminator = 0x00;

/// @brief Size of the opaque recovery-information field.
inline constexpr std::size_t kRecoveryInfoSize = 8;

/// @brief Upper bound accepted for a name length field.
inline constexpr std::uint32_t kMaxNameLength = 64 * 1024;

/// @brief Chunk size qpress writes when none is given.
inline constexpr std::uint64_t kDefaultChunkSize = 64 * 1024;

// =============================================================================
// Record Markers
// =============================================================================

/// @brief Target type byte at archive level.
enum class TargetType : std::uint8_t {
    kEnd = 0x00,
    kDownDirectory = 'D',
    kUpDirectory = 'U',
    kFile = 'F'
};

/// @brief Marker byte inside a file record.
enum class BlockMarker : std::uint8_t {
    kNewBlock = 'N',
    kEnd = 'E'
};

// =============================================================================
// Records
// =============================================================================

using RecoveryInfo = std::array<std::uint8_t, kRecoveryInfoSize>;

/// @brief ARCHIVE_HEADER record.
struct ArchiveHeader {
    /// @brief Magic bytes as read (validated against kArchiveMagic).
    std::array<std::uint8_t, 8> magic{};

    /// @brief Nominal decompressed chunk size used by the encoder.
    /// @note Informational; block sizes are not validated against it.
    std::uint64_t chunkSize = kDefaultChunkSize;
};

/// @brief UP record (no payload).
struct UpDirectory {};

/// @brief DOWN record.
struct DownDirectory {
    std::string name;
};

/// @brief Header of a FILE record; blocks and trailer follow in the stream.
struct FileHeader {
    std::string name;
};

/// @brief One archive-level record.
/// @note Directory variants are parsed fully so that the decoder can reject
///       them with a typed error rather than an unknown-marker error.
using Target = std::variant<UpDirectory, DownDirectory, FileHeader>;

/// @brief One compressed data block of a file.
struct DataBlock {
    /// @brief Position of the block within its file.
    BlockIndex index = 0;

    /// @brief Opaque recovery information.
    RecoveryInfo recoveryInfo{};

    /// @brief Adler-32 of the complete codec packet, as stored.
    std::uint32_t checksum = 0;

    /// @brief Complete codec packet (mini-header followed by payload).
    ByteBuffer packet;

    /// @brief Size of the codec mini-header at the front of packet.
    std::size_t headerSize = 0;

    /// @brief Decompressed size declared by the mini-header.
    std::uint64_t decompressedSize = 0;

    /// @brief Destination offset in the reconstructed file.
    /// @note Computed by the file decoder, not stored in the archive.
    FileOffset decompressedOffset = 0;

    [[nodiscard]] std::size_t compressedSize() const noexcept { return packet.size(); }

    /// @brief Payload bytes following the mini-header.
    [[nodiscard]] ByteSpan payload() const noexcept {
        return ByteSpan(packet).subspan(headerSize);
    }
};

/// @brief FILETRAILER record.
struct FileTrailer {
    RecoveryInfo recoveryInfo{};
};

// =============================================================================
// Helpers
// =============================================================================

[[nodiscard]] constexpr std::string_view targetTypeToString(TargetType type) noexcept {
    switch (type) {
        case TargetType::kEnd:
            return "end";
        case TargetType::kDownDirectory:
            return "directory-down";
        case TargetType::kUpDirectory:
            return "directory-up";
        case TargetType::kFile:
            return "file";
    }
    return "unknown";
}

/// @brief Check whether the magic bytes equal kArchiveMagic.
[[nodiscard]] constexpr bool validateMagic(const std::array<std::uint8_t, 8>& magic) noexcept {
    return magic == kArchiveMagic;
}

}  // namespace qpx::format

#endif  // QPX_FORMAT_QPRESS_FORMAT_H
