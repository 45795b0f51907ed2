// =============================================================================
// qpx - Archive Input Implementation
// =============================================================================

#include "archive_input.h"

#include <iostream>

#include "qpx/common/error.h"

namespace qpx::commands {

ArchiveInput::ArchiveInput(const std::filesystem::path& path) {
    if (path == "-") {
        stream_ = &std::cin;
        return;
    }

    if (!std::filesystem::exists(path)) {
        throw IOError("Input file not found: " + path.string(), ErrorContext(path.string()));
    }

    file_ = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!file_->is_open()) {
        throw IOError("Failed to open input file: " + path.string(),
                      ErrorContext(path.string()));
    }
    stream_ = file_.get();
}

}  // namespace qpx::commands
