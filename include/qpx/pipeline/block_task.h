// =============================================================================
// qpx - Block Decompression Task
// =============================================================================
// Unit of work executed by the worker pool: check, decompress and write one
// data block at its precomputed offset in the destination file.
// =============================================================================

#ifndef QPX_PIPELINE_BLOCK_TASK_H
#define QPX_PIPELINE_BLOCK_TASK_H

#include <memory>
#include <string>

#include "qpx/codec/block_codec.h"
#include "qpx/common/error.h"
#include "qpx/common/types.h"
#include "qpx/format/qpress_format.h"
#include "qpx/io/output_sink.h"

namespace qpx::pipeline {

struct BlockTask {
    format::DataBlock block;
    std::shared_ptr<const codec::BlockCodec> codec;
    std::shared_ptr<io::PositionalSink> sink;
    ChecksumPolicy checksumPolicy = ChecksumPolicy::kIgnore;

    /// @brief Archive member name, for diagnostics.
    std::string fileName;

    /// @brief Run the task. Errors carry the member name and block index.
    [[nodiscard]] VoidResult operator()() const;
};

/// @brief Apply the checksum policy, then decompress a block into out.
/// @param out Resized to the block's declared decompressed size; existing
///        capacity is reused.
/// @note Shared by the concurrent and the streaming decoders.
[[nodiscard]] VoidResult decompressBlock(const codec::BlockCodec& codec,
                                         const format::DataBlock& block, ChecksumPolicy policy,
                                         const std::string& fileName, ByteBuffer& out);

}  // namespace qpx::pipeline

#endif  // QPX_PIPELINE_BLOCK_TASK_H
