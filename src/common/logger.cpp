// =============================================================================
// qpx - Logger Module Implementation
// =============================================================================

#include "qpx/common/logger.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace qpx::log {

namespace {

constexpr const char* kBackendThreadName = "qpx-log";
constexpr const char* kConsoleSinkName = "qpx-console";

std::atomic<quill::Logger*> gLogger{nullptr};

std::atomic<bool> gBackendRunning{false};

std::mutex gInitMutex;

void startBackend() {
    if (gBackendRunning.load(std::memory_order_acquire)) {
        return;
    }
    quill::BackendOptions options;
    options.thread_name = kBackendThreadName;
    quill::Backend::start(options);
    gBackendRunning.store(true, std::memory_order_release);
}

std::vector<std::shared_ptr<quill::Sink>> makeSinks(const Config& config) {
    std::vector<std::shared_ptr<quill::Sink>> sinks;

    if (config.enableConsole) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>(kConsoleSinkName));
    }

    if (!config.logFile.empty()) {
        quill::FileSinkConfig fileConfig;
        // Consecutive extractions append to the same log.
        fileConfig.set_open_mode('a');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile, fileConfig, quill::FileEventNotifier{}));
    }

    return sinks;
}

/// @brief Create the logger; caller holds gInitMutex.
quill::Logger* createLogger(const Config& config) {
    startBackend();

    auto sinks = makeSinks(config);
    Level level = config.level;
    if (sinks.empty()) {
        // The macros need a logger even when nothing may be printed.
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>(kConsoleSinkName));
        level = Level::kOff;
    }

    quill::Logger* created =
        quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    created->set_log_level(toQuillLevel(level));
    return created;
}

}  // namespace

// =============================================================================
// Level Conversion
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
        case Level::kOff:
            return quill::LogLevel::None;
    }
    return quill::LogLevel::Info;
}

std::string_view levelToString(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return "trace";
        case Level::kDebug:
            return "debug";
        case Level::kInfo:
            return "info";
        case Level::kWarning:
            return "warning";
        case Level::kError:
            return "error";
        case Level::kCritical:
            return "critical";
        case Level::kOff:
            return "off";
    }
    return "info";
}

// =============================================================================
// Lifecycle
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Logger* created = createLogger(config);
    gLogger.store(created, std::memory_order_release);

    QPX_LOG_DEBUG("Logger ready (level {}, file '{}', console {})", levelToString(config.level),
                  config.logFile, config.enableConsole);
}

quill::Logger* logger() noexcept {
    quill::Logger* current = gLogger.load(std::memory_order_acquire);
    if (current != nullptr) {
        return current;
    }

    // Library use without init(): fall back to a silent logger.
    try {
        std::lock_guard<std::mutex> lock(gInitMutex);
        current = gLogger.load(std::memory_order_acquire);
        if (current == nullptr) {
            Config silent;
            silent.enableConsole = false;
            current = createLogger(silent);
            gLogger.store(current, std::memory_order_release);
        }
    } catch (const std::exception&) {
        return nullptr;
    }
    return current;
}

void flush() {
    if (quill::Logger* current = gLogger.load(std::memory_order_acquire); current != nullptr) {
        current->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (quill::Logger* current = gLogger.load(std::memory_order_acquire); current != nullptr) {
        current->flush_log();
    }
    if (gBackendRunning.load(std::memory_order_acquire)) {
        quill::Backend::stop();
        gBackendRunning.store(false, std::memory_order_release);
    }
    gLogger.store(nullptr, std::memory_order_release);
}

}  // namespace qpx::log
