// =============================================================================
// qpx - Decode Options and Session
// =============================================================================
// Explicit configuration threaded through one archive decode.
//
// Nothing here is global: every decode owns its DecodeOptions and builds a
// DecodeSession once the archive header has been read, so several archives
// can be decoded concurrently in the same process.
// =============================================================================

#ifndef QPX_FORMAT_DECODE_OPTIONS_H
#define QPX_FORMAT_DECODE_OPTIONS_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "qpx/codec/block_codec.h"
#include "qpx/common/error.h"
#include "qpx/common/types.h"
#include "qpx/format/qpress_format.h"
#include "qpx/pipeline/worker_pool.h"

namespace qpx::format {

/// @brief User-facing decode configuration.
struct DecodeOptions {
    /// @brief Stop a file before the block that would exceed this many
    ///        bytes. Values <= 0 mean unbounded.
    ByteLimit sizeLimit = kUnboundedLimit;

    ChecksumPolicy checksumPolicy = ChecksumPolicy::kIgnore;

    /// @brief Worker pool used by directory extraction.
    pipeline::WorkerPoolConfig pool;

    [[nodiscard]] bool hasLimit() const noexcept { return sizeLimit > 0; }

    /// @brief True if a file of `total` decompressed bytes exceeds the limit.
    /// @note Equality with the limit is not an excess.
    [[nodiscard]] bool exceedsLimit(std::uint64_t total) const noexcept {
        return hasLimit() && total > static_cast<std::uint64_t>(sizeLimit);
    }

    [[nodiscard]] VoidResult validate() const;
};

/// @brief State of one decode, created after the archive header is read.
struct DecodeSession {
    ArchiveHeader header;
    const DecodeOptions& options;
    std::shared_ptr<const codec::BlockCodec> codec;
};

/// @brief Outcome of one FILE target.
struct FileDecodeResult {
    /// @brief Member name as stored in the archive.
    std::string name;

    /// @brief Destination path; empty for the streaming variant.
    std::filesystem::path outputPath;

    /// @brief Blocks parsed (and submitted) before the trailer or the limit.
    std::uint32_t blocks = 0;

    /// @brief Decompressed bytes those blocks declare.
    std::uint64_t bytes = 0;

    /// @brief The size limit stopped this file early.
    bool limitReached = false;

    /// @brief First failed block task, if any.
    std::optional<Error> taskFailure;

    [[nodiscard]] bool failed() const noexcept { return taskFailure.has_value(); }
};

/// @brief Outcome of a whole archive decode.
struct DecodeResult {
    ArchiveHeader header;
    std::vector<FileDecodeResult> files;

    /// @brief Decoding stopped at the size limit.
    bool partial = false;

    /// @brief Decompressed bytes over all files.
    std::uint64_t totalBytes = 0;
};

}  // namespace qpx::format

#endif  // QPX_FORMAT_DECODE_OPTIONS_H
