// =============================================================================
// qpx - Archive Input
// =============================================================================
// Opens the archive named on the command line, "-" meaning stdin.
// =============================================================================

#ifndef QPX_COMMANDS_ARCHIVE_INPUT_H
#define QPX_COMMANDS_ARCHIVE_INPUT_H

#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>

namespace qpx::commands {

class ArchiveInput {
public:
    /// @throws IOError if the file cannot be opened.
    explicit ArchiveInput(const std::filesystem::path& path);

    [[nodiscard]] std::istream& stream() noexcept { return *stream_; }

    [[nodiscard]] bool isStdin() const noexcept { return file_ == nullptr; }

private:
    std::unique_ptr<std::ifstream> file_;
    std::istream* stream_ = nullptr;
};

}  // namespace qpx::commands

#endif  // QPX_COMMANDS_ARCHIVE_INPUT_H
