// =============================================================================
// qpx - Archive Byte Reader
// =============================================================================
// Sequential little-endian reader over a non-seekable input stream.
//
// The qpress container is decoded in one forward pass, so the reader never
// seeks; it only tracks how many bytes have been consumed so that errors can
// report the archive offset they occurred at.
//
// Error mapping:
// - Stream failure (badbit)       -> IOError
// - Fewer bytes than required     -> FormatError ("unexpected end of archive")
// - Clean end before a record     -> reported as std::nullopt by tryReadByte()
// =============================================================================

#ifndef QPX_IO_BYTE_READER_H
#define QPX_IO_BYTE_READER_H

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

#include "qpx/common/error.h"
#include "qpx/common/types.h"

namespace qpx::io {

class ByteReader {
public:
    /// @brief Wrap an input stream. The stream must outlive the reader.
    explicit ByteReader(std::istream& stream) noexcept : stream_(stream) {}

    ByteReader(const ByteReader&) = delete;
    ByteReader& operator=(const ByteReader&) = delete;

    /// @brief Read one byte, or nullopt at a clean end of stream.
    /// @throws IOError on a stream failure.
    [[nodiscard]] std::optional<std::uint8_t> tryReadByte();

    /// @brief Read one byte.
    /// @param what Name of the field, used in error messages.
    /// @throws FormatError at end of stream, IOError on stream failure.
    [[nodiscard]] std::uint8_t readByte(std::string_view what);

    /// @brief Fill the buffer completely.
    /// @throws FormatError on a short read, IOError on stream failure.
    void readExact(MutableByteSpan buffer, std::string_view what);

    /// @brief Read a little-endian unsigned integer.
    template <typename T>
    [[nodiscard]] T readLE(std::string_view what);

    /// @brief Read bytes and compare them against an expected sequence.
    /// @throws FormatError if any byte differs.
    void expectBytes(ByteSpan expected, std::string_view what);

    /// @brief Read a u32 length, that many name bytes and the 0x00 terminator.
    /// @param maxLength Largest accepted length.
    /// @throws FormatError if the length exceeds maxLength or the terminator
    ///         is not zero.
    [[nodiscard]] std::string readLengthPrefixedName(std::uint32_t maxLength,
                                                     std::uint8_t terminator,
                                                     std::string_view what);

    /// @brief Number of bytes consumed so far.
    [[nodiscard]] std::uint64_t position() const noexcept { return position_; }

    /// @brief Context carrying the current archive offset.
    [[nodiscard]] ErrorContext contextHere() const {
        ErrorContext ctx;
        ctx.withOffset(position_);
        return ctx;
    }

private:
    std::istream& stream_;
    std::uint64_t position_ = 0;
};

template <typename T>
T ByteReader::readLE(std::string_view what) {
    static_assert(std::is_unsigned_v<T>, "readLE requires an unsigned integer type");

    std::uint8_t bytes[sizeof(T)];
    readExact(MutableByteSpan(bytes, sizeof(T)), what);

    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(static_cast<T>(bytes[i]) << (8 * i));
    }
    return value;
}

/// @brief Decode a little-endian unsigned integer from a byte span.
/// @note The span must hold at least sizeof(T) bytes.
template <typename T>
[[nodiscard]] constexpr T loadLE(ByteSpan bytes) noexcept {
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(static_cast<T>(bytes[i]) << (8 * i));
    }
    return value;
}

}  // namespace qpx::io

#endif  // QPX_IO_BYTE_READER_H
