// =============================================================================
// qpx - Logger Module
// =============================================================================
// Asynchronous logging through Quill, shared by the decoder, the worker pool
// and the command-line front end.
//
// Workers log from their own threads; Quill's backend thread does the
// formatting and I/O. Library code may log before init() is called, in which
// case messages go to a silent logger.
//
//   qpx::log::Config config;
//   config.logFile = "extract.log";
//   qpx::log::init(config);
//   QPX_LOG_INFO("Extracted {} blocks", 42);
// =============================================================================

#ifndef QPX_COMMON_LOGGER_H
#define QPX_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace qpx::log {

/// @brief Verbosity, ordered from most to least chatty.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical,
    kOff
};

struct Config {
    /// @brief Appended to when set; empty disables file logging.
    std::string logFile;

    Level level = Level::kInfo;

    /// @note Disabled by `cat`, whose stdout carries file data.
    bool enableConsole = true;

    std::string loggerName = "qpx";
};

/// @brief Create the process logger. Later calls are ignored.
/// @note Without any sink the logger is created with level kOff.
void init(const Config& config);

/// @brief The process logger, created silent on first use if init() has
///        not run.
[[nodiscard]] quill::Logger* logger() noexcept;

void flush();

/// @brief Flush pending messages and stop the backend thread.
void shutdown();

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace qpx::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define QPX_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(qpx::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define QPX_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(qpx::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define QPX_LOG_INFO(fmt, ...) \
    LOG_INFO(qpx::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define QPX_LOG_WARNING(fmt, ...) \
    LOG_WARNING(qpx::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define QPX_LOG_ERROR(fmt, ...) \
    LOG_ERROR(qpx::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define QPX_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(qpx::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // QPX_COMMON_LOGGER_H
