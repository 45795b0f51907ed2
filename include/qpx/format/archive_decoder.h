// =============================================================================
// qpx - Archive Decoder
// =============================================================================
// Top-level decode loop for qpress archives.
//
// After the archive header, one type byte is read per target:
// - 0x00 or end of stream: clean end of archive
// - 'F': file target, decoded by the file target decoder
// - 'D' / 'U': parsed completely, then rejected with UnsupportedFeatureError
// - anything else: FormatError
//
// A file stopped by the size limit ends the decode successfully with
// DecodeResult::partial set; no further targets are read.
//
// Usage:
// @code
// std::ifstream in("backup.qp", std::ios::binary);
// ArchiveDecoder decoder(DecodeOptions{});
// auto result = decoder.decodeToDirectory(in, "restore/");
// @endcode
// =============================================================================

#ifndef QPX_FORMAT_ARCHIVE_DECODER_H
#define QPX_FORMAT_ARCHIVE_DECODER_H

#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>

#include "qpx/codec/block_codec.h"
#include "qpx/format/decode_options.h"
#include "qpx/format/qpress_format.h"
#include "qpx/io/byte_reader.h"
#include "qpx/io/output_sink.h"

namespace qpx::format {

// =============================================================================
// Record Readers
// =============================================================================

/// @brief Read and validate the archive header.
/// @throws FormatError on bad magic or a short header.
[[nodiscard]] ArchiveHeader readArchiveHeader(io::ByteReader& reader);

/// @brief Read one archive-level target header.
/// @return nullopt at end of archive (zero type byte or end of stream).
/// @throws FormatError for an unknown type byte or malformed name field.
[[nodiscard]] std::optional<Target> readTarget(io::ByteReader& reader);

// =============================================================================
// ArchiveDecoder
// =============================================================================

class ArchiveDecoder {
public:
    /// @throws UsageError if the options are invalid.
    explicit ArchiveDecoder(DecodeOptions options,
                            std::shared_ptr<const codec::BlockCodec> codec = codec::makeDefaultCodec());

    /// @brief Extract every file target into baseDir, which must exist.
    ///
    /// Files whose block tasks fail are removed and decoding continues with
    /// the next target. If any file failed, the first failure is thrown at
    /// the end, after all other targets were processed.
    [[nodiscard]] DecodeResult decodeToDirectory(std::istream& input,
                                                 const std::filesystem::path& baseDir) const;

    /// @brief Stream every file target, in archive order, into sink.
    /// @note No concurrency; any block failure is thrown immediately.
    [[nodiscard]] DecodeResult decodeToSink(std::istream& input, io::SequentialSink& sink) const;

    [[nodiscard]] const DecodeOptions& options() const noexcept { return options_; }

private:
    DecodeOptions options_;
    std::shared_ptr<const codec::BlockCodec> codec_;
};

// =============================================================================
// Entry Points
// =============================================================================

/// @brief Extract an archive into a directory with default options.
/// @param sizeLimit Per-file byte limit; <= 0 means unbounded.
/// @return True if decoding stopped at the size limit.
[[nodiscard]] bool decodeToDirectory(std::istream& input, const std::filesystem::path& baseDir,
                                     ByteLimit sizeLimit);

/// @brief Stream an archive's file data to an output stream.
/// @return True if decoding stopped at the size limit.
[[nodiscard]] bool decodeToSink(std::istream& input, std::ostream& output, ByteLimit sizeLimit);

}  // namespace qpx::format

#endif  // QPX_FORMAT_ARCHIVE_DECODER_H
