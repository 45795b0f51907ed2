// =============================================================================
// qpx - Verify Command
// =============================================================================
// Command handler for verifying archive integrity.
//
// Every block is checksummed and decompressed in memory; nothing is
// written. Directory records fail verification like any other unsupported
// construct.
// =============================================================================

#ifndef QPX_COMMANDS_VERIFY_COMMAND_H
#define QPX_COMMANDS_VERIFY_COMMAND_H

#include <cstdint>
#include <filesystem>

namespace qpx::commands {

struct VerifyOptions {
    /// @brief Input archive path ("-" for stdin).
    std::filesystem::path inputPath;

    /// @brief List every file as it is verified.
    bool verbose = false;
};

struct VerificationSummary {
    std::uint32_t files = 0;
    std::uint32_t blocks = 0;

    /// @brief Decompressed bytes checked.
    std::uint64_t bytes = 0;
};

class VerifyCommand {
public:
    explicit VerifyCommand(VerifyOptions options);

    /// @return Exit code (0 = archive verified).
    [[nodiscard]] int execute();

    [[nodiscard]] const VerificationSummary& summary() const noexcept { return summary_; }

private:
    void printSummary() const;

    VerifyOptions options_;
    VerificationSummary summary_;
};

}  // namespace qpx::commands

#endif  // QPX_COMMANDS_VERIFY_COMMAND_H
