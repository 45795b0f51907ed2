// =============================================================================
// qpx - Cat Command
// =============================================================================
// Streams the contents of every file in an archive to stdout, in archive
// order, without touching the filesystem. Decoding is sequential.
// =============================================================================

#ifndef QPX_COMMANDS_CAT_COMMAND_H
#define QPX_COMMANDS_CAT_COMMAND_H

#include <filesystem>
#include <ostream>

#include "qpx/common/types.h"

namespace qpx::commands {

struct CatOptions {
    /// @brief Input archive path ("-" for stdin).
    std::filesystem::path inputPath;

    /// @brief Per-file size limit in bytes (<= 0 = unbounded).
    ByteLimit sizeLimit = kUnboundedLimit;

    ChecksumPolicy checksumPolicy = ChecksumPolicy::kIgnore;
};

class CatCommand {
public:
    CatCommand(CatOptions options, std::ostream& output);

    /// @return Exit code. Errors are reported on stderr since stdout
    ///         carries file data.
    [[nodiscard]] int execute();

private:
    CatOptions options_;
    std::ostream& output_;
};

}  // namespace qpx::commands

#endif  // QPX_COMMANDS_CAT_COMMAND_H
