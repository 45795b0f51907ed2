// =============================================================================
// qpx - Block Decompression Task Implementation
// =============================================================================

#include "qpx/pipeline/block_task.h"

#include <fmt/format.h>

#include "qpx/common/logger.h"
#include "qpx/format/block_decoder.h"

namespace qpx::pipeline {

namespace {

Error annotate(const Error& error, const std::string& fileName, BlockIndex index) {
    return Error(error.code(),
                 fmt::format("{} (file: {}, block: {})", error.message(), fileName, index));
}

}  // namespace

VoidResult decompressBlock(const codec::BlockCodec& codec, const format::DataBlock& block,
                           ChecksumPolicy policy, const std::string& fileName, ByteBuffer& out) {
    if (policy != ChecksumPolicy::kIgnore) {
        auto verified = format::verifyChecksum(block);
        if (!verified) {
            if (policy == ChecksumPolicy::kVerify) {
                return std::unexpected(annotate(verified.error(), fileName, block.index));
            }
            QPX_LOG_WARNING("{} (file: {}, block: {})", verified.error().message(), fileName,
                            block.index);
        }
    }

    auto sizes = codec.validate(block.packet);
    if (!sizes) {
        return std::unexpected(annotate(sizes.error(), fileName, block.index));
    }
    if (sizes->decompressedSize != block.decompressedSize) {
        return std::unexpected(Error(
            ErrorCode::kDecompressionFailed,
            fmt::format("packet declares {} bytes, block header {} (file: {}, block: {})",
                        sizes->decompressedSize, block.decompressedSize, fileName, block.index)));
    }

    out.resize(sizes->decompressedSize);
    auto produced = codec.decompress(block.packet, out);
    if (!produced) {
        return std::unexpected(annotate(produced.error(), fileName, block.index));
    }
    if (*produced != out.size()) {
        return std::unexpected(Error(
            ErrorCode::kDecompressionFailed,
            fmt::format("block produced {} bytes, expected {} (file: {}, block: {})", *produced,
                        out.size(), fileName, block.index)));
    }
    return {};
}

VoidResult BlockTask::operator()() const {
    ByteBuffer data;
    auto decoded = decompressBlock(*codec, block, checksumPolicy, fileName, data);
    if (!decoded) {
        return decoded;
    }

    auto written = sink->writeAt(data, block.decompressedOffset);
    if (!written) {
        return std::unexpected(annotate(written.error(), fileName, block.index));
    }

    QPX_LOG_TRACE("Wrote block {} of {} at offset {}", block.index, fileName,
                  block.decompressedOffset);
    return {};
}

}  // namespace qpx::pipeline
