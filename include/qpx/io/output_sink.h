// =============================================================================
// qpx - Output Sinks
// =============================================================================
// Destinations for decompressed file data.
//
// Two families:
// - PositionalSink: random-access writes at absolute offsets. Used by the
//   concurrent directory extractor, where blocks complete out of order.
// - SequentialSink: append-only writes in archive order. Used by the
//   streaming decoder (stdout, byte counting for verification).
//
// PositionalSink::writeAt() is called from worker threads and must be safe
// for concurrent calls on non-overlapping ranges.
// =============================================================================

#ifndef QPX_IO_OUTPUT_SINK_H
#define QPX_IO_OUTPUT_SINK_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string>

#include "qpx/common/error.h"
#include "qpx/common/types.h"

namespace qpx::io {

// =============================================================================
// PositionalSink
// =============================================================================

/// @brief Random-access destination for one reconstructed file.
class PositionalSink {
public:
    virtual ~PositionalSink() = default;

    /// @brief Write all of data starting at offset.
    /// @note Thread-safe for non-overlapping ranges.
    [[nodiscard]] virtual VoidResult writeAt(ByteSpan data, FileOffset offset) = 0;

    /// @brief Human-readable destination name for diagnostics.
    [[nodiscard]] virtual std::string describe() const = 0;
};

// =============================================================================
// FileSink
// =============================================================================

/// @brief PositionalSink over a newly created regular file.
///
/// The file is created exclusively: an existing path is never opened,
/// truncated or modified. Writes use pwrite(2), so concurrent workers do
/// not share a file position.
class FileSink final : public PositionalSink {
public:
    /// @brief Create the file.
    /// @throws AlreadyExistsError if the path exists.
    /// @throws IOError for any other creation failure.
    [[nodiscard]] static std::shared_ptr<FileSink> create(const std::filesystem::path& path);

    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    [[nodiscard]] VoidResult writeAt(ByteSpan data, FileOffset offset) override;

    [[nodiscard]] std::string describe() const override { return path_.string(); }

    /// @brief Close the descriptor, reporting a failed close(2).
    [[nodiscard]] VoidResult close();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// @brief Total bytes written so far.
    [[nodiscard]] std::uint64_t bytesWritten() const noexcept {
        return bytesWritten_.load(std::memory_order_relaxed);
    }

private:
    FileSink(std::filesystem::path path, int fd) noexcept : path_(std::move(path)), fd_(fd) {}

    std::filesystem::path path_;
    int fd_ = -1;
    std::atomic<std::uint64_t> bytesWritten_{0};
};

// =============================================================================
// SequentialSink
// =============================================================================

/// @brief Append-only destination receiving file data in archive order.
class SequentialSink {
public:
    virtual ~SequentialSink() = default;

    /// @brief Called before the first block of every file target.
    virtual void beginFile(const std::string& /*name*/) {}

    /// @brief Append data.
    /// @throws IOError on failure.
    virtual void write(ByteSpan data) = 0;

    /// @brief Called after the trailer of every file target.
    virtual void endFile(const std::string& /*name*/) {}

    virtual void flush() {}
};

/// @brief SequentialSink writing to a std::ostream (stdout for `cat`).
class StreamSink final : public SequentialSink {
public:
    explicit StreamSink(std::ostream& stream) noexcept : stream_(stream) {}

    void write(ByteSpan data) override;
    void flush() override;

private:
    std::ostream& stream_;
};

}  // namespace qpx::io

#endif  // QPX_IO_OUTPUT_SINK_H
