// =============================================================================
// qpx - Extract Command Implementation
// =============================================================================

#include "extract_command.h"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <system_error>

#include "archive_input.h"
#include "qpx/common/error.h"
#include "qpx/common/logger.h"
#include "qpx/format/archive_decoder.h"

namespace qpx::commands {

ExtractCommand::ExtractCommand(ExtractOptions options) : options_(std::move(options)) {}

int ExtractCommand::execute() {
    auto startTime = std::chrono::steady_clock::now();

    try {
        validateOptions();
        runExtraction();

        auto endTime = std::chrono::steady_clock::now();
        stats_.elapsedSeconds = std::chrono::duration<double>(endTime - startTime).count();

        if (options_.showSummary) {
            printSummary();
        }
        return 0;

    } catch (const QPXException& e) {
        QPX_LOG_ERROR("Extraction failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        QPX_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void ExtractCommand::validateOptions() {
    if (options_.inputPath.empty()) {
        throw UsageError("No input archive given");
    }

    std::error_code ec;
    if (std::filesystem::exists(options_.outputDir, ec)) {
        if (!std::filesystem::is_directory(options_.outputDir, ec)) {
            throw IOError("Output path is not a directory: " + options_.outputDir.string());
        }
        return;
    }

    std::filesystem::create_directories(options_.outputDir, ec);
    if (ec) {
        throw IOError("Failed to create output directory", ec,
                      ErrorContext(options_.outputDir.string()));
    }
    QPX_LOG_DEBUG("Created output directory {}", options_.outputDir.string());
}

void ExtractCommand::runExtraction() {
    format::DecodeOptions decodeOptions;
    decodeOptions.sizeLimit = options_.sizeLimit;
    decodeOptions.checksumPolicy = options_.checksumPolicy;
    decodeOptions.pool = options_.pool;

    const format::ArchiveDecoder decoder(decodeOptions);

    ArchiveInput input(options_.inputPath);
    QPX_LOG_INFO("Extracting {} to {} ({} workers, checksum {})",
                 input.isStdin() ? std::string("<stdin>") : options_.inputPath.string(),
                 options_.outputDir.string(), options_.pool.effectiveWorkers(),
                 checksumPolicyToString(options_.checksumPolicy));

    const format::DecodeResult result = decoder.decodeToDirectory(input.stream(), options_.outputDir);

    stats_.filesExtracted = static_cast<std::uint32_t>(result.files.size());
    for (const auto& file : result.files) {
        stats_.blocksProcessed += file.blocks;
    }
    stats_.outputBytes = result.totalBytes;
    stats_.partial = result.partial;
}

void ExtractCommand::printSummary() const {
    std::cout << "\n=== Extraction Summary ===" << std::endl;
    std::cout << "  Files extracted:   " << stats_.filesExtracted << std::endl;
    std::cout << "  Blocks processed:  " << stats_.blocksProcessed << std::endl;
    std::cout << "  Output size:       " << stats_.outputBytes << " bytes" << std::endl;
    if (stats_.partial) {
        std::cout << "  Partial:           yes (size limit " << options_.sizeLimit
                  << " bytes reached)" << std::endl;
    }
    std::cout << "  Elapsed time:      " << std::fixed << std::setprecision(2)
              << stats_.elapsedSeconds << " s" << std::endl;
    std::cout << "  Throughput:        " << std::fixed << std::setprecision(2)
              << stats_.throughputMbps() << " MB/s" << std::endl;
    std::cout << "==========================" << std::endl;
}

}  // namespace qpx::commands
