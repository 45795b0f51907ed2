// =============================================================================
// qpx - Verify Command Implementation
// =============================================================================

#include "verify_command.h"

#include <iostream>
#include <string>

#include "archive_input.h"
#include "qpx/common/error.h"
#include "qpx/common/logger.h"
#include "qpx/format/archive_decoder.h"
#include "qpx/io/output_sink.h"

namespace qpx::commands {

namespace {

/// @brief Counts bytes per file while discarding them.
class CountingSink final : public io::SequentialSink {
public:
    explicit CountingSink(bool verbose) : verbose_(verbose) {}

    void beginFile(const std::string& /*name*/) override { fileBytes_ = 0; }

    void write(ByteSpan data) override { fileBytes_ += data.size(); }

    void endFile(const std::string& name) override {
        if (verbose_) {
            std::cout << "[PASS] " << name << " (" << fileBytes_ << " bytes)" << std::endl;
        }
    }

private:
    bool verbose_;
    std::uint64_t fileBytes_ = 0;
};

}  // namespace

VerifyCommand::VerifyCommand(VerifyOptions options) : options_(std::move(options)) {}

int VerifyCommand::execute() {
    try {
        format::DecodeOptions decodeOptions;
        decodeOptions.checksumPolicy = ChecksumPolicy::kVerify;

        const format::ArchiveDecoder decoder(decodeOptions);
        ArchiveInput input(options_.inputPath);

        if (options_.verbose) {
            std::cout << "Verifying: " << options_.inputPath.string() << std::endl;
        }

        CountingSink sink(options_.verbose);
        const auto result = decoder.decodeToSink(input.stream(), sink);

        summary_.files = static_cast<std::uint32_t>(result.files.size());
        for (const auto& file : result.files) {
            summary_.blocks += file.blocks;
        }
        summary_.bytes = result.totalBytes;

        printSummary();
        return 0;

    } catch (const QPXException& e) {
        QPX_LOG_ERROR("Verification failed: {}", e.what());
        std::cout << "[FAIL] " << e.what() << std::endl;
        return e.exitCode();
    } catch (const std::exception& e) {
        QPX_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void VerifyCommand::printSummary() const {
    std::cout << "\n=== Verification Summary ===" << std::endl;
    std::cout << "  Files:   " << summary_.files << std::endl;
    std::cout << "  Blocks:  " << summary_.blocks << std::endl;
    std::cout << "  Bytes:   " << summary_.bytes << std::endl;
    std::cout << "  Status:  PASSED" << std::endl;
    std::cout << "============================" << std::endl;
}

}  // namespace qpx::commands
