// =============================================================================
// qpx - qpress Archive Extractor
// =============================================================================
// Main entry point for the qpx command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: extract, cat, verify
// - Global options: threads, queue depth, verbosity, log file
// - Process exit status equal to the ErrorCode of the failure
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "qpx/common/error.h"
#include "qpx/common/logger.h"
#include "qpx/common/types.h"
#include "qpx/pipeline/worker_pool.h"

#include "commands/cat_command.h"
#include "commands/extract_command.h"
#include "commands/verify_command.h"

namespace qpx::commands {
int runExtract(CLI::App* app);
int runCat(CLI::App* app);
int runVerify(CLI::App* app);
}  // namespace qpx::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "qpx: extractor for qpress (.qp) archives\n"
    "Decompresses QuickLZ data blocks on a bounded worker pool and writes each\n"
    "block at its precomputed offset, so output is identical to a sequential decode.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::size_t threads = qpx::kDefaultWorkerCount;      // 0 = hardware concurrency
    std::size_t queueDepth = qpx::kDefaultQueueCapacity;
    int verbosity = 0;  // 0 = normal, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Extract Command Options
// =============================================================================

struct CliExtractOptions {
    std::string input;
    std::string output = ".";
    std::int64_t limit = 0;
    std::string checksum = "ignore";
};

CliExtractOptions gExtractOpts;

// =============================================================================
// Cat Command Options
// =============================================================================

struct CliCatOptions {
    std::string input;
    std::int64_t limit = 0;
    std::string checksum = "ignore";
};

CliCatOptions gCatOpts;

// =============================================================================
// Verify Command Options
// =============================================================================

struct CliVerifyOptions {
    std::string input;
    bool verbose = false;
};

CliVerifyOptions gVerifyOpts;

const std::vector<std::string> kChecksumPolicies = {"ignore", "warn", "verify"};

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupExtractCommand(CLI::App& app) {
    auto* extract = app.add_subcommand("extract", "Extract a qpress archive into a directory");
    extract->alias("x");
    extract->alias("d");

    extract->add_option("-i,--input", gExtractOpts.input, "Input archive (or '-' for stdin)")
        ->required()
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    extract->add_option("-o,--output", gExtractOpts.output,
                        "Destination directory (created if missing)")
        ->default_val(".");

    extract->add_option("-l,--limit", gExtractOpts.limit,
                        "Stop a file before it exceeds this many bytes (0 = no limit)")
        ->default_val(0);

    extract->add_option("--checksum", gExtractOpts.checksum,
                        "Block checksum handling: ignore, warn, verify")
        ->default_val("ignore")
        ->check(CLI::IsMember(kChecksumPolicies));
}

void setupCatCommand(CLI::App& app) {
    auto* cat = app.add_subcommand("cat", "Write the archive's file contents to stdout");

    cat->add_option("-i,--input", gCatOpts.input, "Input archive (or '-' for stdin)")
        ->required()
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    cat->add_option("-l,--limit", gCatOpts.limit,
                    "Stop a file before it exceeds this many bytes (0 = no limit)")
        ->default_val(0);

    cat->add_option("--checksum", gCatOpts.checksum,
                    "Block checksum handling: ignore, warn, verify")
        ->default_val("ignore")
        ->check(CLI::IsMember(kChecksumPolicies));
}

void setupVerifyCommand(CLI::App& app) {
    auto* verify = app.add_subcommand("verify", "Verify block checksums and decompression");

    verify->add_option("-i,--input", gVerifyOpts.input, "Input archive (or '-' for stdin)")
        ->required()
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    verify->add_flag("--list", gVerifyOpts.verbose, "List every verified file");
}

[[nodiscard]] qpx::ChecksumPolicy toChecksumPolicy(const std::string& name) {
    auto policy = qpx::parseChecksumPolicy(name);
    if (!policy.has_value()) {
        throw qpx::UsageError("Unknown checksum policy: " + name);
    }
    return *policy;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_option("-t,--threads", gOptions.threads,
                   "Number of decompression workers (0 = hardware concurrency)")
        ->default_val(qpx::kDefaultWorkerCount)
        ->check(CLI::Range(std::size_t{0}, qpx::pipeline::kMaxPoolDimension));

    app.add_option("--queue-depth", gOptions.queueDepth,
                   "Blocks queued ahead of the workers before reading pauses")
        ->default_val(qpx::kDefaultQueueCapacity)
        ->check(CLI::Range(std::size_t{1}, qpx::pipeline::kMaxPoolDimension));

    app.add_flag("-v,--verbose", gOptions.verbosity,
                 "Increase verbosity (-v for debug, -vv for trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-file", gOptions.logFile, "Also write the log to this file");

    setupExtractCommand(app);
    setupCatCommand(app);
    setupVerifyCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        qpx::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        logConfig.level = qpx::log::Level::kInfo;
        if (gOptions.quiet) {
            logConfig.level = qpx::log::Level::kError;
        } else if (gOptions.verbosity >= 2) {
            logConfig.level = qpx::log::Level::kTrace;
        } else if (gOptions.verbosity >= 1) {
            logConfig.level = qpx::log::Level::kDebug;
        }
        // stdout carries file data for `cat`
        logConfig.enableConsole = !app.got_subcommand("cat");
        qpx::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return qpx::toExitCode(qpx::ErrorCode::kIOError);
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("extract")) {
            exitCode = qpx::commands::runExtract(app.get_subcommand("extract"));
        } else if (app.got_subcommand("cat")) {
            exitCode = qpx::commands::runCat(app.get_subcommand("cat"));
        } else if (app.got_subcommand("verify")) {
            exitCode = qpx::commands::runVerify(app.get_subcommand("verify"));
        }
    } catch (const qpx::QPXException& ex) {
        QPX_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        QPX_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = qpx::toExitCode(qpx::ErrorCode::kIOError);
    }

    qpx::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace qpx::commands {

int runExtract([[maybe_unused]] CLI::App* app) {
    ExtractOptions opts;
    opts.inputPath = gExtractOpts.input;
    opts.outputDir = gExtractOpts.output;
    opts.sizeLimit = gExtractOpts.limit;
    opts.checksumPolicy = toChecksumPolicy(gExtractOpts.checksum);
    opts.pool.workerCount = gOptions.threads;
    opts.pool.queueCapacity = gOptions.queueDepth;
    opts.showSummary = !gOptions.quiet;

    ExtractCommand cmd(std::move(opts));
    return cmd.execute();
}

int runCat([[maybe_unused]] CLI::App* app) {
    CatOptions opts;
    opts.inputPath = gCatOpts.input;
    opts.sizeLimit = gCatOpts.limit;
    opts.checksumPolicy = toChecksumPolicy(gCatOpts.checksum);

    CatCommand cmd(std::move(opts), std::cout);
    return cmd.execute();
}

int runVerify([[maybe_unused]] CLI::App* app) {
    VerifyOptions opts;
    opts.inputPath = gVerifyOpts.input;
    opts.verbose = gVerifyOpts.verbose;

    VerifyCommand cmd(std::move(opts));
    return cmd.execute();
}

}  // namespace qpx::commands
