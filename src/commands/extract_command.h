// =============================================================================
// qpx - Extract Command
// =============================================================================
// Command handler for extracting a qpress archive into a directory.
//
// This module provides:
// - ExtractOptions: Configuration options for extraction
// - ExtractionStats: Summary of a finished extraction
// - ExtractCommand: Runs the concurrent archive decoder
// =============================================================================

#ifndef QPX_COMMANDS_EXTRACT_COMMAND_H
#define QPX_COMMANDS_EXTRACT_COMMAND_H

#include <cstdint>
#include <filesystem>

#include "qpx/common/types.h"
#include "qpx/pipeline/worker_pool.h"

namespace qpx::commands {

// =============================================================================
// Extraction Options
// =============================================================================

struct ExtractOptions {
    /// @brief Input archive path ("-" for stdin).
    std::filesystem::path inputPath;

    /// @brief Destination directory, created if missing.
    std::filesystem::path outputDir = ".";

    /// @brief Per-file size limit in bytes (<= 0 = unbounded).
    ByteLimit sizeLimit = kUnboundedLimit;

    ChecksumPolicy checksumPolicy = ChecksumPolicy::kIgnore;

    pipeline::WorkerPoolConfig pool;

    /// @brief Print the summary on completion.
    bool showSummary = true;
};

// =============================================================================
// Extraction Statistics
// =============================================================================

struct ExtractionStats {
    std::uint32_t filesExtracted = 0;
    std::uint32_t blocksProcessed = 0;

    /// @brief Decompressed bytes written.
    std::uint64_t outputBytes = 0;

    /// @brief Stopped at the size limit.
    bool partial = false;

    double elapsedSeconds = 0.0;

    /// @brief Throughput in MB/s.
    [[nodiscard]] double throughputMbps() const noexcept {
        return elapsedSeconds > 0
                   ? (static_cast<double>(outputBytes) / (1024 * 1024)) / elapsedSeconds
                   : 0.0;
    }
};

// =============================================================================
// ExtractCommand Class
// =============================================================================

class ExtractCommand {
public:
    explicit ExtractCommand(ExtractOptions options);

    /// @brief Run the extraction.
    /// @return Exit code (0 = success, including partial extraction).
    [[nodiscard]] int execute();

    [[nodiscard]] const ExtractionStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const ExtractOptions& options() const noexcept { return options_; }

private:
    void validateOptions();
    void runExtraction();
    void printSummary() const;

    ExtractOptions options_;
    ExtractionStats stats_;
};

}  // namespace qpx::commands

#endif  // QPX_COMMANDS_EXTRACT_COMMAND_H
