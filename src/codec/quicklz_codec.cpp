// =============================================================================
// qpx - QuickLZ Decoder Implementation
// =============================================================================
// Level-1 decompression loop of QuickLZ 1.5.0 (non-streaming mode).
//
// The source is a sequence of 32-bit control words, each followed by the
// items it describes. A control word is consumed LSB first; bit 1 means a
// back-reference, bit 0 a literal byte. The highest set bit is a sentinel:
// when only it remains (cword == 1) the next control word is loaded.
//
// Back-references do not carry an offset. Both sides keep a table mapping
// the hash of every 3-byte sequence to its last position in the output, and
// a reference names the hash slot instead.
// =============================================================================

#include "qpx/codec/quicklz_codec.h"

#include <algorithm>
#include <array>
#include <format>

#include "qpx/io/byte_reader.h"

namespace qpx::codec {

namespace {

using namespace quicklz;

constexpr std::array<std::uint32_t, 16> kLiteralRunLength = {
    4, 0, 1, 0, 2, 0, 1, 0, 3, 0, 1, 0, 2, 0, 1, 0
};

constexpr std::int64_t kUnsetPosition = -1;

/// @brief Load up to 4 bytes little-endian; bytes past the end read as zero.
std::uint32_t fetch32(ByteSpan src, std::size_t pos) noexcept {
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < 4 && pos + i < src.size(); ++i) {
        value |= static_cast<std::uint32_t>(src[pos + i]) << (8 * i);
    }
    return value;
}

std::uint32_t hashAt(ByteSpan out, std::size_t pos) noexcept {
    const std::uint32_t fetch = static_cast<std::uint32_t>(out[pos]) |
                                (static_cast<std::uint32_t>(out[pos + 1]) << 8) |
                                (static_cast<std::uint32_t>(out[pos + 2]) << 16);
    return ((fetch >> 12) ^ fetch) & (kHashValues - 1);
}

Result<std::size_t> corrupt(std::string_view what, std::size_t srcPos, std::size_t dstPos) {
    return makeError<std::size_t>(
        ErrorCode::kDecompressionFailed,
        std::format("corrupt quicklz packet: {} (source {}, output {})", what, srcPos, dstPos));
}

}  // namespace

// =============================================================================
// Header Parsing
// =============================================================================

Result<CodecSizes> QuickLZCodec::declaredSizes(ByteSpan header) const {
    if (header.empty()) {
        return makeError<CodecSizes>(ErrorCode::kFormatError, "empty quicklz header");
    }

    const std::size_t expected = headerSize(header[0]);
    if (header.size() < expected) {
        return makeError<CodecSizes>(
            ErrorCode::kFormatError,
            std::format("quicklz header needs {} bytes, got {}", expected, header.size()));
    }

    CodecSizes sizes;
    if (expected == kLongHeaderSize) {
        sizes.compressedSize = io::loadLE<std::uint32_t>(header.subspan(1, 4));
        sizes.decompressedSize = io::loadLE<std::uint32_t>(header.subspan(5, 4));
    } else {
        sizes.compressedSize = header[1];
        sizes.decompressedSize = header[2];
    }

    if (sizes.compressedSize < expected) {
        return makeError<CodecSizes>(
            ErrorCode::kFormatError,
            std::format("quicklz compressed size {} is smaller than its {}-byte header",
                        sizes.compressedSize, expected));
    }
    return sizes;
}

// =============================================================================
// Packet Validation
// =============================================================================

Result<CodecSizes> QuickLZCodec::validate(ByteSpan packet) const {
    auto sizes = declaredSizes(packet);
    if (!sizes) {
        return makeError<CodecSizes>(ErrorCode::kDecompressionFailed, sizes.error().message());
    }
    if (sizes->compressedSize != packet.size()) {
        return makeError<CodecSizes>(
            ErrorCode::kDecompressionFailed,
            std::format("quicklz packet is {} bytes but declares {}", packet.size(),
                        sizes->compressedSize));
    }

    const std::uint8_t flags = packet[0];
    const std::size_t payloadSize = packet.size() - headerSize(flags);

    if (!isCompressed(flags)) {
        if (payloadSize != sizes->decompressedSize) {
            return makeError<CodecSizes>(
                ErrorCode::kDecompressionFailed,
                std::format("stored quicklz packet carries {} bytes, declares {}", payloadSize,
                            sizes->decompressedSize));
        }
        return sizes;
    }

    const int level = levelOf(flags);
    if (level != kSupportedLevel) {
        return makeError<CodecSizes>(
            ErrorCode::kDecompressionFailed,
            std::format("quicklz compression level {} is not supported", level));
    }
    if (static_cast<std::uint64_t>(sizes->decompressedSize) >
        static_cast<std::uint64_t>(payloadSize) * kMaxExpansion) {
        return makeError<CodecSizes>(
            ErrorCode::kDecompressionFailed,
            std::format("quicklz payload of {} bytes cannot expand to {}", payloadSize,
                        sizes->decompressedSize));
    }
    return sizes;
}

// =============================================================================
// Decompression
// =============================================================================

Result<std::size_t> QuickLZCodec::decompress(ByteSpan packet, MutableByteSpan out) const {
    auto sizes = validate(packet);
    if (!sizes) {
        return std::unexpected(sizes.error());
    }
    if (sizes->decompressedSize != out.size()) {
        return makeError<std::size_t>(
            ErrorCode::kDecompressionFailed,
            std::format("output buffer is {} bytes but packet declares {}", out.size(),
                        sizes->decompressedSize));
    }

    const std::uint8_t flags = packet[0];
    const ByteSpan payload = packet.subspan(headerSize(flags));

    if (!isCompressed(flags)) {
        std::copy(payload.begin(), payload.end(), out.begin());
        return out.size();
    }
    return decompressLevel1(payload, out);
}

Result<std::size_t> QuickLZCodec::decompressLevel1(ByteSpan src, MutableByteSpan dst) {
    const std::size_t size = dst.size();
    if (size == 0) {
        return std::size_t{0};
    }

    std::array<std::int64_t, kHashValues> hashTable;
    hashTable.fill(kUnsetPosition);

    // Positions below lastMatchStart may start a literal run of up to four
    // bytes; the final bytes are always emitted one literal at a time.
    const std::int64_t lastMatchStart = static_cast<std::int64_t>(size) - 1 -
                                        static_cast<std::int64_t>(kUnconditionalMatchLength) -
                                        static_cast<std::int64_t>(kUncompressedEnd);

    std::size_t s = 0;
    std::size_t d = 0;
    std::int64_t lastHashed = -1;
    std::uint32_t cword = 1;

    auto hashUpTo = [&](std::int64_t limit) {
        while (lastHashed < limit) {
            ++lastHashed;
            const auto pos = static_cast<std::size_t>(lastHashed);
            hashTable[hashAt(dst, pos)] = lastHashed;
        }
    };

    for (;;) {
        if (cword == 1) {
            if (s + kControlWordSize > src.size()) {
                return corrupt("truncated control word", s, d);
            }
            cword = fetch32(src, s);
            s += kControlWordSize;
        }

        if (s >= src.size()) {
            return corrupt("truncated item", s, d);
        }
        const std::uint32_t fetch = fetch32(src, s);

        if ((cword & 1) == 1) {
            cword >>= 1;

            const std::uint32_t hash = (fetch >> 4) & 0xfff;
            std::size_t matchLength;
            if ((fetch & 0xf) != 0) {
                if (s + 2 > src.size()) {
                    return corrupt("truncated match", s, d);
                }
                matchLength = (fetch & 0xf) + 2;
                s += 2;
            } else {
                if (s + 3 > src.size()) {
                    return corrupt("truncated match length", s, d);
                }
                matchLength = src[s + 2];
                s += 3;
            }

            const std::int64_t from = hashTable[hash];
            if (from == kUnsetPosition) {
                return corrupt("reference to unset hash slot", s, d);
            }
            const auto offset = static_cast<std::size_t>(from);
            if (offset + kMinOffset >= d) {
                return corrupt("reference does not precede output position", s, d);
            }
            if (d + matchLength + kUncompressedEnd > size) {
                return corrupt("match runs into the literal tail", s, d);
            }

            // Source and destination may overlap; copy forward byte by byte.
            for (std::size_t i = 0; i < matchLength; ++i) {
                dst[d + i] = dst[offset + i];
            }
            d += matchLength;

            hashUpTo(static_cast<std::int64_t>(d - matchLength));
            lastHashed = static_cast<std::int64_t>(d) - 1;
        } else if (static_cast<std::int64_t>(d) < lastMatchStart) {
            const std::uint32_t n = kLiteralRunLength[cword & 0xf];
            if (s + n > src.size()) {
                return corrupt("truncated literal run", s, d);
            }
            if (n > size - d) {
                return corrupt("literal run past end of output", s, d);
            }
            std::copy_n(src.begin() + static_cast<std::ptrdiff_t>(s), n,
                        dst.begin() + static_cast<std::ptrdiff_t>(d));
            cword >>= n;
            d += n;
            s += n;
            hashUpTo(static_cast<std::int64_t>(d) - 3);
        } else {
            while (d < size) {
                if (cword == 1) {
                    s += kControlWordSize;
                    cword = 1U << 31;
                }
                if (s >= src.size()) {
                    return corrupt("truncated literal tail", s, d);
                }
                dst[d++] = src[s++];
                cword >>= 1;
            }
            return size;
        }
    }
}

}  // namespace qpx::codec
