// =============================================================================
// qpx - Block Record Decoder Implementation
// =============================================================================

#include "qpx/format/block_decoder.h"

#include <algorithm>
#include <format>

#include <zlib.h>

#include "qpx/common/logger.h"

namespace qpx::format {

namespace {

constexpr std::size_t kPayloadReadStep = 1U << 20;

}  // namespace

DataBlock readDataBlock(io::ByteReader& reader, const codec::BlockCodec& codec,
                        BlockIndex index) {
    const std::uint64_t recordStart = reader.position() - 1;

    auto context = [&](std::uint64_t offset) {
        ErrorContext ctx;
        ctx.withBlock(index).withOffset(offset);
        return ctx;
    };

    try {
        reader.expectBytes(kBlockStarterTail, "block starter");
    } catch (const FormatError& e) {
        throw FormatError(e.message(), context(recordStart));
    }

    DataBlock block;
    block.index = index;
    reader.readExact(block.recoveryInfo, "block recovery information");
    block.checksum = reader.readLE<std::uint32_t>("block checksum");

    // The codec header is variable-length: its size depends on the flags byte.
    const std::uint64_t packetStart = reader.position();
    const std::uint8_t flags = reader.readByte("codec header");
    block.headerSize = codec.headerSize(flags);

    block.packet.resize(block.headerSize);
    block.packet[0] = flags;
    reader.readExact(MutableByteSpan(block.packet).subspan(1), "codec header");

    auto sizes = codec.declaredSizes(block.packet);
    if (!sizes) {
        throw FormatError(sizes.error().message(), context(packetStart));
    }

    block.decompressedSize = sizes->decompressedSize;

    // The declared size is untrusted: grow the packet only as bytes arrive.
    std::size_t remaining = sizes->compressedSize - block.headerSize;
    while (remaining > 0) {
        const std::size_t step = std::min(remaining, kPayloadReadStep);
        const std::size_t filled = block.packet.size();
        block.packet.resize(filled + step);
        reader.readExact(MutableByteSpan(block.packet).subspan(filled), "block payload");
        remaining -= step;
    }

    QPX_LOG_TRACE("Block {} at 0x{:x}: {} -> {} bytes", index, recordStart,
                  block.compressedSize(), block.decompressedSize);
    return block;
}

FileTrailer readFileTrailer(io::ByteReader& reader) {
    const std::uint64_t recordStart = reader.position() - 1;
    try {
        reader.expectBytes(kTrailerStarterTail, "file trailer starter");
    } catch (const FormatError& e) {
        ErrorContext ctx;
        ctx.withOffset(recordStart);
        throw FormatError(e.message(), std::move(ctx));
    }

    FileTrailer trailer;
    reader.readExact(trailer.recoveryInfo, "file trailer recovery information");
    return trailer;
}

std::uint32_t computeChecksum(ByteSpan data) noexcept {
    uLong adler = ::adler32(0L, Z_NULL, 0);
    // zlib takes uInt lengths; feed large buffers in pieces.
    constexpr std::size_t kMaxChunk = 1U << 30;
    while (!data.empty()) {
        const std::size_t n = data.size() < kMaxChunk ? data.size() : kMaxChunk;
        adler = ::adler32(adler, data.data(), static_cast<uInt>(n));
        data = data.subspan(n);
    }
    return static_cast<std::uint32_t>(adler);
}

VoidResult verifyChecksum(const DataBlock& block) {
    const std::uint32_t actual = computeChecksum(block.packet);
    if (actual != block.checksum) {
        return makeVoidError(
            ErrorCode::kChecksumError,
            std::format("block {}: {}", block.index,
                        ChecksumError::formatChecksumMismatch(block.checksum, actual)));
    }
    return makeVoidSuccess();
}

}  // namespace qpx::format
