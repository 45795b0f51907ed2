// =============================================================================
// qpx - Cat Command Implementation
// =============================================================================

#include "cat_command.h"

#include <iostream>

#include "archive_input.h"
#include "qpx/common/error.h"
#include "qpx/common/logger.h"
#include "qpx/format/archive_decoder.h"

namespace qpx::commands {

CatCommand::CatCommand(CatOptions options, std::ostream& output)
    : options_(std::move(options)), output_(output) {}

int CatCommand::execute() {
    try {
        format::DecodeOptions decodeOptions;
        decodeOptions.sizeLimit = options_.sizeLimit;
        decodeOptions.checksumPolicy = options_.checksumPolicy;

        const format::ArchiveDecoder decoder(decodeOptions);
        ArchiveInput input(options_.inputPath);
        io::StreamSink sink(output_);

        const auto result = decoder.decodeToSink(input.stream(), sink);
        QPX_LOG_DEBUG("Streamed {} file(s), {} bytes{}", result.files.size(), result.totalBytes,
                      result.partial ? " (partial)" : "");
        return 0;

    } catch (const QPXException& e) {
        QPX_LOG_ERROR("cat failed: {}", e.what());
        std::cerr << "qpx: " << e.what() << std::endl;
        return e.exitCode();
    } catch (const std::exception& e) {
        QPX_LOG_ERROR("Unexpected error: {}", e.what());
        std::cerr << "qpx: " << e.what() << std::endl;
        return toExitCode(ErrorCode::kIOError);
    }
}

}  // namespace qpx::commands
