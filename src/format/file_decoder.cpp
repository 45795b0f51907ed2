// =============================================================================
// qpx - File Target Decoder Implementation
// =============================================================================

#include "qpx/format/file_decoder.h"

#include <algorithm>
#include <format>
#include <system_error>
#include <utility>

#include "qpx/common/logger.h"
#include "qpx/format/block_decoder.h"
#include "qpx/pipeline/block_task.h"

namespace qpx::format {

namespace {

/// @brief Largest buffer reserved up front from the archive's chunk size.
constexpr std::uint64_t kMaxReservedChunk = 64ULL * 1024 * 1024;

ErrorContext memberContext(const std::string& name, std::uint64_t offset) {
    ErrorContext ctx(name);
    ctx.withOffset(offset);
    return ctx;
}

void removeIncomplete(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        QPX_LOG_WARNING("Failed to remove incomplete file {}: {}", path.string(), ec.message());
    } else {
        QPX_LOG_INFO("Removed incomplete file {}", path.string());
    }
}

/// @brief Owns an output file while its blocks are in flight.
///
/// Unless commit() is reached, the destructor waits for the submitted tasks,
/// closes the descriptor and removes the incomplete file.
class PendingOutput {
public:
    PendingOutput(pipeline::WorkerPool& pool, std::shared_ptr<io::FileSink> sink)
        : pool_(pool), sink_(std::move(sink)) {}

    ~PendingOutput() {
        if (committed_) {
            return;
        }
        auto drained = pool_.drain();
        if (!drained) {
            QPX_LOG_DEBUG("Discarding task failure of aborted file: {}",
                          drained.error().message());
        }
        auto closed = sink_->close();
        if (!closed) {
            QPX_LOG_WARNING("{}", closed.error().message());
        }
        removeIncomplete(sink_->path());
    }

    PendingOutput(const PendingOutput&) = delete;
    PendingOutput& operator=(const PendingOutput&) = delete;

    /// @brief Drain the pool and close the file.
    /// @return The first task failure, else the close status.
    [[nodiscard]] VoidResult commit() {
        committed_ = true;
        auto drained = pool_.drain();
        auto closed = sink_->close();
        if (!drained) {
            return drained;
        }
        return closed;
    }

private:
    pipeline::WorkerPool& pool_;
    std::shared_ptr<io::FileSink> sink_;
    bool committed_ = false;
};

}  // namespace

// =============================================================================
// Member Names
// =============================================================================

void validateMemberName(std::string_view name) {
    if (name.empty()) {
        throw FormatError("file target has an empty name");
    }
    if (name.find('\0') != std::string_view::npos) {
        throw FormatError("file target name contains a NUL byte", ErrorContext(std::string(name)));
    }

    const std::filesystem::path path(name);
    if (path.is_absolute() || path.has_root_path()) {
        throw FormatError("file target name is an absolute path",
                          ErrorContext(std::string(name)));
    }
    for (const auto& part : path) {
        if (part == "..") {
            throw FormatError("file target name escapes the destination directory",
                              ErrorContext(std::string(name)));
        }
    }
}

std::filesystem::path resolveMemberPath(const std::filesystem::path& baseDir,
                                        std::string_view name) {
    validateMemberName(name);
    return baseDir / std::filesystem::path(name);
}

// =============================================================================
// Directory Variant
// =============================================================================

FileDecodeResult decodeFileToDirectory(io::ByteReader& reader, const FileHeader& header,
                                       const std::filesystem::path& baseDir,
                                       const DecodeSession& session,
                                       pipeline::WorkerPool& pool) {
    FileDecodeResult result;
    result.name = header.name;
    result.outputPath = resolveMemberPath(baseDir, header.name);

    auto sink = io::FileSink::create(result.outputPath);
    PendingOutput pending(pool, sink);

    QPX_LOG_DEBUG("Extracting {} to {}", header.name, result.outputPath.string());

    const DecodeOptions& options = session.options;
    FileOffset offset = 0;
    BlockIndex index = 0;

    for (;;) {
        const std::uint64_t markerOffset = reader.position();
        const std::uint8_t marker = reader.readByte("block marker");

        if (marker == static_cast<std::uint8_t>(BlockMarker::kNewBlock)) {
            DataBlock block = readDataBlock(reader, *session.codec, index);
            block.decompressedOffset = offset;
            const FileOffset next = offset + block.decompressedSize;

            if (options.exceedsLimit(next)) {
                result.limitReached = true;
                QPX_LOG_INFO("Size limit {} reached in {} before block {} ({} bytes written)",
                             options.sizeLimit, header.name, index, offset);
                break;
            }

            // After a failure the file is lost; keep parsing only to stay aligned.
            if (!pool.hasFailed()) {
                pool.submit(pipeline::BlockTask{std::move(block), session.codec, sink,
                                                options.checksumPolicy, header.name});
            }
            offset = next;
            ++index;
        } else if (marker == static_cast<std::uint8_t>(BlockMarker::kEnd)) {
            [[maybe_unused]] const FileTrailer trailer = readFileTrailer(reader);
            break;
        } else {
            throw FormatError(std::format("invalid block marker 0x{:02x}, expected 'N' or 'E'",
                                          marker),
                              memberContext(header.name, markerOffset));
        }
    }

    result.blocks = index;
    result.bytes = offset;

    auto status = pending.commit();
    if (!status) {
        QPX_LOG_ERROR("Failed to extract {}: {}", header.name, status.error().message());
        result.taskFailure = status.error();
        removeIncomplete(result.outputPath);
        return result;
    }

    QPX_LOG_INFO("Extracted {} ({} blocks, {} bytes){}", header.name, result.blocks,
                 result.bytes, result.limitReached ? " [partial]" : "");
    return result;
}

// =============================================================================
// Streaming Variant
// =============================================================================

FileDecodeResult decodeFileToSink(io::ByteReader& reader, const FileHeader& header,
                                  io::SequentialSink& sink, const DecodeSession& session) {
    validateMemberName(header.name);

    FileDecodeResult result;
    result.name = header.name;

    const DecodeOptions& options = session.options;
    ByteBuffer buffer;
    buffer.reserve(static_cast<std::size_t>(std::min(session.header.chunkSize, kMaxReservedChunk)));

    sink.beginFile(header.name);

    FileOffset offset = 0;
    BlockIndex index = 0;

    for (;;) {
        const std::uint64_t markerOffset = reader.position();
        const std::uint8_t marker = reader.readByte("block marker");

        if (marker == static_cast<std::uint8_t>(BlockMarker::kNewBlock)) {
            DataBlock block = readDataBlock(reader, *session.codec, index);
            block.decompressedOffset = offset;
            const FileOffset next = offset + block.decompressedSize;

            if (options.exceedsLimit(next)) {
                result.limitReached = true;
                QPX_LOG_INFO("Size limit {} reached in {} before block {}", options.sizeLimit,
                             header.name, index);
                break;
            }

            if (block.decompressedSize > session.header.chunkSize) {
                QPX_LOG_DEBUG("Block {} of {} exceeds chunk size ({} > {})", index, header.name,
                              block.decompressedSize, session.header.chunkSize);
            }

            auto decoded = pipeline::decompressBlock(*session.codec, block,
                                                     options.checksumPolicy, header.name, buffer);
            if (!decoded) {
                decoded.error().throwException();
            }
            sink.write(buffer);

            offset = next;
            ++index;
        } else if (marker == static_cast<std::uint8_t>(BlockMarker::kEnd)) {
            [[maybe_unused]] const FileTrailer trailer = readFileTrailer(reader);
            break;
        } else {
            throw FormatError(std::format("invalid block marker 0x{:02x}, expected 'N' or 'E'",
                                          marker),
                              memberContext(header.name, markerOffset));
        }
    }

    sink.endFile(header.name);

    result.blocks = index;
    result.bytes = offset;
    QPX_LOG_DEBUG("Streamed {} ({} blocks, {} bytes)", header.name, result.blocks, result.bytes);
    return result;
}

}  // namespace qpx::format
