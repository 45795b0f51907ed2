// =============================================================================
// qpx - Output Sinks Implementation
// =============================================================================

#include "qpx/io/output_sink.h"

#include <cerrno>
#include <format>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "qpx/common/logger.h"

namespace qpx::io {

namespace {

constexpr mode_t kCreateMode = 0640;

std::error_code lastSystemError() {
    return {errno, std::system_category()};
}

}  // namespace

// =============================================================================
// FileSink Implementation
// =============================================================================

std::shared_ptr<FileSink> FileSink::create(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, kCreateMode);
    if (fd < 0) {
        if (errno == EEXIST) {
            throw AlreadyExistsError(std::format("refusing to overwrite existing file '{}'",
                                                 path.string()),
                                     ErrorContext(path.string()));
        }
        throw IOError("failed to create output file", lastSystemError(),
                      ErrorContext(path.string()));
    }

    QPX_LOG_DEBUG("Created output file {}", path.string());
    return std::shared_ptr<FileSink>(new FileSink(path, fd));
}

FileSink::~FileSink() {
    if (fd_ >= 0) {
        if (::close(fd_) != 0) {
            QPX_LOG_WARNING("Failed to close {}: errno {}", path_.string(), errno);
        }
        fd_ = -1;
    }
}

VoidResult FileSink::writeAt(ByteSpan data, FileOffset offset) {
    if (fd_ < 0) {
        return makeVoidError(ErrorCode::kIOError,
                             std::format("write to closed file '{}'", path_.string()));
    }

    std::size_t done = 0;
    while (done < data.size()) {
        const ssize_t n = ::pwrite(fd_, data.data() + done, data.size() - done,
                                   static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return makeVoidError(
                ErrorCode::kIOError,
                std::format("failed to write {} bytes at offset {} to '{}': {}",
                            data.size() - done, offset + done, path_.string(),
                            lastSystemError().message()));
        }
        done += static_cast<std::size_t>(n);
    }

    bytesWritten_.fetch_add(done, std::memory_order_relaxed);
    return makeVoidSuccess();
}

VoidResult FileSink::close() {
    if (fd_ < 0) {
        return makeVoidSuccess();
    }
    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        return makeVoidError(ErrorCode::kIOError,
                             std::format("failed to close '{}': {}", path_.string(),
                                         lastSystemError().message()));
    }
    return makeVoidSuccess();
}

// =============================================================================
// StreamSink Implementation
// =============================================================================

void StreamSink::write(ByteSpan data) {
    stream_.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
    if (!stream_) {
        throw IOError("failed to write to output stream");
    }
}

void StreamSink::flush() {
    stream_.flush();
    if (!stream_) {
        throw IOError("failed to flush output stream");
    }
}

}  // namespace qpx::io
