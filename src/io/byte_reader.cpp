// =============================================================================
// qpx - Archive Byte Reader Implementation
// =============================================================================

#include "qpx/io/byte_reader.h"

#include <algorithm>
#include <format>

namespace qpx::io {

std::optional<std::uint8_t> ByteReader::tryReadByte() {
    const auto ch = stream_.get();
    if (ch == std::char_traits<char>::eof()) {
        if (stream_.bad()) {
            throw IOError("failed to read archive", contextHere());
        }
        return std::nullopt;
    }
    ++position_;
    return static_cast<std::uint8_t>(ch);
}

std::uint8_t ByteReader::readByte(std::string_view what) {
    auto byte = tryReadByte();
    if (!byte.has_value()) {
        throw FormatError(std::format("unexpected end of archive while reading {}", what),
                          contextHere());
    }
    return *byte;
}

void ByteReader::readExact(MutableByteSpan buffer, std::string_view what) {
    if (buffer.empty()) {
        return;
    }

    stream_.read(reinterpret_cast<char*>(buffer.data()),
                 static_cast<std::streamsize>(buffer.size()));
    const auto got = static_cast<std::size_t>(stream_.gcount());

    if (stream_.bad()) {
        throw IOError("failed to read archive", contextHere());
    }

    position_ += got;
    if (got != buffer.size()) {
        throw FormatError(std::format("unexpected end of archive while reading {} "
                                      "({} of {} bytes)",
                                      what, got, buffer.size()),
                          contextHere());
    }
}

void ByteReader::expectBytes(ByteSpan expected, std::string_view what) {
    const std::uint64_t start = position_;

    std::uint8_t actual[16];
    std::size_t done = 0;
    while (done < expected.size()) {
        const std::size_t n = std::min(expected.size() - done, sizeof(actual));
        readExact(MutableByteSpan(actual, n), what);
        if (!std::equal(actual, actual + n, expected.begin() + static_cast<std::ptrdiff_t>(done))) {
            ErrorContext ctx;
            ctx.withOffset(start);
            throw FormatError(std::format("bad {}", what), std::move(ctx));
        }
        done += n;
    }
}

std::string ByteReader::readLengthPrefixedName(std::uint32_t maxLength,
                                               std::uint8_t terminator,
                                               std::string_view what) {
    const std::uint64_t start = position_;
    const auto length = readLE<std::uint32_t>(what);
    if (length > maxLength) {
        ErrorContext ctx;
        ctx.withOffset(start);
        throw FormatError(std::format("{} length {} exceeds limit {}", what, length, maxLength),
                          std::move(ctx));
    }

    std::string name(length, '\0');
    readExact(MutableByteSpan(reinterpret_cast<std::uint8_t*>(name.data()), name.size()), what);

    const std::uint8_t end = readByte(what);
    if (end != terminator) {
        throw FormatError(std::format("{} is not terminated by 0x{:02x} (found 0x{:02x})", what,
                                      terminator, end),
                          contextHere());
    }
    return name;
}

}  // namespace qpx::io
