// =============================================================================
// qpx - Block Codec Interface
// =============================================================================
// Abstract interface for the compressor that produced the data blocks.
//
// Every block payload is one self-describing codec packet: a small
// mini-header (flags and sizes) followed by the compressed data. The
// container parser needs the header size and declared sizes to find the end
// of the packet in the stream; the workers need decompress().
//
// Implementations must be stateless between calls so that a single
// instance can be shared by all decompression workers.
// =============================================================================

#ifndef QPX_CODEC_BLOCK_CODEC_H
#define QPX_CODEC_BLOCK_CODEC_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include "qpx/common/error.h"
#include "qpx/common/types.h"

namespace qpx::codec {

/// @brief Sizes declared by a packet mini-header.
struct CodecSizes {
    /// @brief Size of the whole packet, mini-header included.
    std::size_t compressedSize = 0;

    /// @brief Size of the data after decompression.
    std::size_t decompressedSize = 0;
};

class BlockCodec {
public:
    virtual ~BlockCodec() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// @brief Length of the mini-header, derived from its first byte.
    [[nodiscard]] virtual std::size_t headerSize(std::uint8_t flags) const noexcept = 0;

    /// @brief Parse the declared sizes from a complete mini-header.
    /// @param header Exactly headerSize(header[0]) bytes.
    [[nodiscard]] virtual Result<CodecSizes> declaredSizes(ByteSpan header) const = 0;

    /// @brief Reject a packet whose header cannot describe its payload.
    /// @note Runs before the output buffer is allocated, so a forged
    ///       decompressed size never reaches an allocation.
    [[nodiscard]] virtual Result<CodecSizes> validate(ByteSpan packet) const = 0;

    /// @brief Decompress a complete packet.
    /// @param packet Mini-header and payload.
    /// @param out Buffer of exactly the declared decompressed size.
    /// @return Number of bytes produced, or kDecompressionFailed.
    [[nodiscard]] virtual Result<std::size_t> decompress(ByteSpan packet,
                                                         MutableByteSpan out) const = 0;
};

/// @brief Codec used by qpress archives (QuickLZ 1.5.0, level 1).
[[nodiscard]] std::shared_ptr<const BlockCodec> makeDefaultCodec();

}  // namespace qpx::codec

#endif  // QPX_CODEC_BLOCK_CODEC_H
