// =============================================================================
// qpx - Archive Decoder Implementation
// =============================================================================

#include "qpx/format/archive_decoder.h"

#include <format>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "qpx/common/logger.h"
#include "qpx/format/file_decoder.h"
#include "qpx/pipeline/worker_pool.h"

namespace qpx::format {

namespace {

ErrorContext offsetContext(std::uint64_t offset, std::string phase) {
    ErrorContext ctx;
    ctx.withOffset(offset).withPhase(std::move(phase));
    return ctx;
}

/// @brief Throw for a directory record that has already been parsed.
[[noreturn]] void rejectDirectory(const Target& target, std::uint64_t offset) {
    std::visit(
        [offset](const auto& record) {
            using T = std::decay_t<decltype(record)>;
            if constexpr (std::is_same_v<T, DownDirectory>) {
                throw UnsupportedFeatureError(
                    std::format("directory traversal is not supported ({} '{}')",
                                targetTypeToString(TargetType::kDownDirectory), record.name),
                    offsetContext(offset, "directory record"));
            } else if constexpr (std::is_same_v<T, UpDirectory>) {
                throw UnsupportedFeatureError(
                    std::format("directory traversal is not supported ({})",
                                targetTypeToString(TargetType::kUpDirectory)),
                    offsetContext(offset, "directory record"));
            } else {
                throw FormatError(std::format("file target '{}' passed as a directory record",
                                              record.name),
                                  offsetContext(offset, "target"));
            }
        },
        target);
    throw FormatError("unreachable target variant");
}

/// @brief Throw the first task failure with every failed member named.
void throwFileFailures(const std::vector<FileDecodeResult>& files) {
    std::vector<const FileDecodeResult*> failed;
    for (const auto& file : files) {
        if (file.failed()) {
            failed.push_back(&file);
        }
    }
    if (failed.empty()) {
        return;
    }

    const Error& first = *failed.front()->taskFailure;
    if (failed.size() == 1) {
        first.throwException();
    }

    std::string names;
    for (const auto* file : failed) {
        if (!names.empty()) {
            names += ", ";
        }
        names += file->name;
    }
    Error(first.code(), std::format("{} files failed ({}); first failure: {}", failed.size(),
                                    names, first.message()))
        .throwException();
}

}  // namespace

// =============================================================================
// Record Readers
// =============================================================================

ArchiveHeader readArchiveHeader(io::ByteReader& reader) {
    ArchiveHeader header;
    try {
        reader.readExact(header.magic, "archive magic");
    } catch (const FormatError& e) {
        throw FormatError(e.message(), offsetContext(0, "archive header"));
    }

    if (!validateMagic(header.magic)) {
        throw FormatError("not a qpress archive (bad magic)", offsetContext(0, "archive header"));
    }

    header.chunkSize = reader.readLE<std::uint64_t>("archive chunk size");
    return header;
}

std::optional<Target> readTarget(io::ByteReader& reader) {
    const std::uint64_t offset = reader.position();
    const auto type = reader.tryReadByte();
    if (!type.has_value() || *type == static_cast<std::uint8_t>(TargetType::kEnd)) {
        return std::nullopt;
    }

    switch (static_cast<TargetType>(*type)) {
        case TargetType::kUpDirectory:
            return UpDirectory{};
        case TargetType::kDownDirectory:
            return DownDirectory{
                reader.readLengthPrefixedName(kMaxNameLength, kNameTerminator, "directory name")};
        case TargetType::kFile:
            return FileHeader{
                reader.readLengthPrefixedName(kMaxNameLength, kNameTerminator, "file name")};
        default:
            break;
    }
    throw FormatError(std::format("unknown target type 0x{:02x}", *type),
                      offsetContext(offset, "target"));
}

// =============================================================================
// ArchiveDecoder Implementation
// =============================================================================

ArchiveDecoder::ArchiveDecoder(DecodeOptions options,
                               std::shared_ptr<const codec::BlockCodec> codec)
    : options_(std::move(options)), codec_(std::move(codec)) {
    unwrapOrThrow(options_.validate());
    if (!codec_) {
        throw UsageError("archive decoder requires a codec");
    }
}

DecodeResult ArchiveDecoder::decodeToDirectory(std::istream& input,
                                               const std::filesystem::path& baseDir) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(baseDir, ec)) {
        throw IOError(std::format("destination '{}' is not a directory", baseDir.string()),
                      ErrorContext(baseDir.string()));
    }

    io::ByteReader reader(input);
    DecodeResult result;
    result.header = readArchiveHeader(reader);
    const DecodeSession session{result.header, options_, codec_};

    QPX_LOG_INFO("Archive chunk size {}, extracting to {}", result.header.chunkSize,
                 baseDir.string());

    pipeline::WorkerPool pool(options_.pool);

    for (;;) {
        const std::uint64_t offset = reader.position();
        auto target = readTarget(reader);
        if (!target.has_value()) {
            break;
        }

        const auto* file = std::get_if<FileHeader>(&*target);
        if (file == nullptr) {
            rejectDirectory(*target, offset);
        }

        FileDecodeResult fileResult = decodeFileToDirectory(reader, *file, baseDir, session, pool);
        if (!fileResult.failed()) {
            result.totalBytes += fileResult.bytes;
        }
        const bool limitReached = fileResult.limitReached;
        result.files.push_back(std::move(fileResult));

        if (limitReached) {
            result.partial = true;
            break;
        }
    }

    throwFileFailures(result.files);

    QPX_LOG_INFO("Extracted {} file(s), {} bytes{}", result.files.size(), result.totalBytes,
                 result.partial ? " (partial)" : "");
    return result;
}

DecodeResult ArchiveDecoder::decodeToSink(std::istream& input, io::SequentialSink& sink) const {
    io::ByteReader reader(input);
    DecodeResult result;
    result.header = readArchiveHeader(reader);
    const DecodeSession session{result.header, options_, codec_};

    QPX_LOG_DEBUG("Archive chunk size {}, streaming", result.header.chunkSize);

    for (;;) {
        const std::uint64_t offset = reader.position();
        auto target = readTarget(reader);
        if (!target.has_value()) {
            break;
        }

        const auto* file = std::get_if<FileHeader>(&*target);
        if (file == nullptr) {
            rejectDirectory(*target, offset);
        }

        FileDecodeResult fileResult = decodeFileToSink(reader, *file, sink, session);
        result.totalBytes += fileResult.bytes;
        const bool limitReached = fileResult.limitReached;
        result.files.push_back(std::move(fileResult));

        if (limitReached) {
            result.partial = true;
            break;
        }
    }

    sink.flush();
    return result;
}

// =============================================================================
// Entry Points
// =============================================================================

bool decodeToDirectory(std::istream& input, const std::filesystem::path& baseDir,
                       ByteLimit sizeLimit) {
    DecodeOptions options;
    options.sizeLimit = sizeLimit;
    const ArchiveDecoder decoder(options);
    return decoder.decodeToDirectory(input, baseDir).partial;
}

bool decodeToSink(std::istream& input, std::ostream& output, ByteLimit sizeLimit) {
    DecodeOptions options;
    options.sizeLimit = sizeLimit;
    const ArchiveDecoder decoder(options);
    io::StreamSink sink(output);
    return decoder.decodeToSink(input, sink).partial;
}

}  // namespace qpx::format
