// =============================================================================
// qpx - File Target Decoder
// =============================================================================
// Decoding of one FILE target after its header has been read: a scan of
// 'N' (data block) and 'E' (trailer) records.
//
// Directory variant:
// - The destination is created exclusively under the base directory.
// - Each block's destination offset is computed here, in stream order,
//   before the block is handed to the worker pool. Completion order of the
//   workers therefore never affects the file contents.
// - The file is complete only after the pool's drain barrier.
//
// Streaming variant:
// - Blocks are decompressed inline, one at a time, and appended to a
//   SequentialSink in archive order.
// =============================================================================

#ifndef QPX_FORMAT_FILE_DECODER_H
#define QPX_FORMAT_FILE_DECODER_H

#include <filesystem>
#include <string_view>

#include "qpx/format/decode_options.h"
#include "qpx/format/qpress_format.h"
#include "qpx/io/byte_reader.h"
#include "qpx/io/output_sink.h"
#include "qpx/pipeline/worker_pool.h"

namespace qpx::format {

/// @brief Reject member names that could escape the destination directory.
/// @throws FormatError for an empty or absolute name, a ".." component or
///         an embedded NUL byte.
void validateMemberName(std::string_view name);

/// @brief Destination path of a member under baseDir.
/// @throws FormatError if the name is unsafe.
[[nodiscard]] std::filesystem::path resolveMemberPath(const std::filesystem::path& baseDir,
                                                      std::string_view name);

/// @brief Decode a FILE target into a new file under baseDir.
///
/// Structural errors (bad markers, truncation) are thrown. Block task
/// failures do not throw: parsing continues to the trailer so the archive
/// stays aligned, and the failure is returned in taskFailure.
///
/// @throws AlreadyExistsError if the destination exists.
/// @throws FormatError, IOError on structural or read errors; the
///         incomplete destination is removed first.
[[nodiscard]] FileDecodeResult decodeFileToDirectory(io::ByteReader& reader,
                                                     const FileHeader& header,
                                                     const std::filesystem::path& baseDir,
                                                     const DecodeSession& session,
                                                     pipeline::WorkerPool& pool);

/// @brief Decode a FILE target into a sequential sink.
/// @throws On any failure, block failures included.
[[nodiscard]] FileDecodeResult decodeFileToSink(io::ByteReader& reader,
                                                const FileHeader& header,
                                                io::SequentialSink& sink,
                                                const DecodeSession& session);

}  // namespace qpx::format

#endif  // QPX_FORMAT_FILE_DECODER_H
