// =============================================================================
// qpx - Block Record Decoder
// =============================================================================
// Parsing of the records found inside a FILE target: data blocks and the
// file trailer. The record marker byte ('N' / 'E') has already been
// consumed by the caller, which decides between the two.
//
// Checksums are Adler-32 (zlib) over the complete codec packet.
// =============================================================================

#ifndef QPX_FORMAT_BLOCK_DECODER_H
#define QPX_FORMAT_BLOCK_DECODER_H

#include <cstdint>

#include "qpx/codec/block_codec.h"
#include "qpx/common/error.h"
#include "qpx/common/types.h"
#include "qpx/format/qpress_format.h"
#include "qpx/io/byte_reader.h"

namespace qpx::format {

/// @brief Read the rest of a data block after its 'N' marker.
/// @param index Block position within the file, stored in the result.
/// @throws FormatError for a bad starter tail, malformed codec header or a
///         truncated packet; IOError on stream failure.
[[nodiscard]] DataBlock readDataBlock(io::ByteReader& reader, const codec::BlockCodec& codec,
                                      BlockIndex index);

/// @brief Read the rest of a file trailer after its 'E' marker.
/// @throws FormatError for a bad starter tail or truncated record.
[[nodiscard]] FileTrailer readFileTrailer(io::ByteReader& reader);

/// @brief Adler-32 of a buffer.
[[nodiscard]] std::uint32_t computeChecksum(ByteSpan data) noexcept;

/// @brief Compare the stored checksum with the packet's Adler-32.
/// @return kChecksumError on mismatch.
[[nodiscard]] VoidResult verifyChecksum(const DataBlock& block);

}  // namespace qpx::format

#endif  // QPX_FORMAT_BLOCK_DECODER_H
