// =============================================================================
// qpx - QuickLZ Decoder
// =============================================================================
// Memory-safe decoder for QuickLZ 1.5.0 packets at compression level 1.
//
// Packet mini-header:
//   flags:u8  bit0 = compressed, bit1 = long header, bits2-3 = level,
//             bit6 = always set
//   short header (3 bytes): flags, compressed:u8, decompressed:u8
//   long header  (9 bytes): flags, compressed:u32, decompressed:u32
//
// The compressed size includes the mini-header. Uncompressed ("stored")
// packets carry their data verbatim after the header.
//
// Every read and write is bounds-checked; a malformed packet yields
// kDecompressionFailed instead of touching memory outside the buffers.
// =============================================================================

#ifndef QPX_CODEC_QUICKLZ_CODEC_H
#define QPX_CODEC_QUICKLZ_CODEC_H

#include <cstddef>
#include <cstdint>

#include "qpx/codec/block_codec.h"

namespace qpx::codec {

// =============================================================================
// QuickLZ Constants
// =============================================================================

namespace quicklz {

inline constexpr std::uint8_t kFlagCompressed = 0x01;
inline constexpr std::uint8_t kFlagLongHeader = 0x02;

inline constexpr std::size_t kShortHeaderSize = 3;
inline constexpr std::size_t kLongHeaderSize = 9;

/// @brief Only level the decoder implements.
inline constexpr int kSupportedLevel = 1;

inline constexpr std::size_t kControlWordSize = 4;
inline constexpr std::size_t kHashValues = 4096;
inline constexpr std::size_t kMinOffset = 2;
inline constexpr std::size_t kUnconditionalMatchLength = 6;
inline constexpr std::size_t kUncompressedEnd = 4;

/// @brief Most output one payload byte can produce: a 3-byte back-reference
///        copies at most 255 bytes.
inline constexpr std::size_t kMaxExpansion = 85;

[[nodiscard]] constexpr int levelOf(std::uint8_t flags) noexcept {
    return (flags >> 2) & 0x03;
}

[[nodiscard]] constexpr bool isCompressed(std::uint8_t flags) noexcept {
    return (flags & kFlagCompressed) != 0;
}

}  // namespace quicklz

class QuickLZCodec final : public BlockCodec {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "quicklz"; }

    [[nodiscard]] std::size_t headerSize(std::uint8_t flags) const noexcept override {
        return (flags & quicklz::kFlagLongHeader) != 0 ? quicklz::kLongHeaderSize
                                                       : quicklz::kShortHeaderSize;
    }

    [[nodiscard]] Result<CodecSizes> declaredSizes(ByteSpan header) const override;

    [[nodiscard]] Result<CodecSizes> validate(ByteSpan packet) const override;

    [[nodiscard]] Result<std::size_t> decompress(ByteSpan packet,
                                                 MutableByteSpan out) const override;

private:
    [[nodiscard]] static Result<std::size_t> decompressLevel1(ByteSpan src, MutableByteSpan dst);
};

}  // namespace qpx::codec

#endif  // QPX_CODEC_QUICKLZ_CODEC_H
