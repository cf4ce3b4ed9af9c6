/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: buffered_writer.cc
 * Description: Implementation of BufferedWriter. Writes are appended to an
 *              in-memory buffer and drained to the descriptor once it fills;
 *              payloads larger than the buffer bypass it. EPIPE is reported
 *              as a broken pipe so callers can tell a closed reader apart
 *              from a real I/O failure.
 */

#include "secern/sinks/buffered_writer.h"
#include "secern/utils/error.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

namespace secern {
namespace sinks {

std::string IoStatus::message() const {
    switch (code) {
        case Code::kOk:
            return "ok";
        case Code::kBrokenPipe:
        case Code::kError:
            return std::strerror(error_number) + std::string(" (os error ") +
                   std::to_string(error_number) + ")";
    }
    return "unknown";
}

std::unique_ptr<BufferedWriter> BufferedWriter::create_file(const std::string& path,
                                                            size_t capacity) {
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw ResourceError("Unable to create directory '" + parent.string() +
                                "' due to error: " + ec.message());
        }
    }

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        int err = errno;
        throw ResourceError("Unable to create output file '" + path + "' due to error: " +
                            IoStatus::error(err).message());
    }
    return std::make_unique<BufferedWriter>(fd, path, capacity, true);
}

BufferedWriter::BufferedWriter(int fd, std::string description, size_t capacity, bool owns_fd)
    : fd_(fd), description_(std::move(description)), capacity_(capacity), owns_fd_(owns_fd) {
    buffer_.reserve(capacity_);
}

BufferedWriter::~BufferedWriter() {
    // Best effort; callers that care about the result flush explicitly
    flush();
    if (owns_fd_ && fd_ >= 0) {
        ::close(fd_);
    }
}

IoStatus BufferedWriter::write(const char* data, size_t size) {
    if (buffer_.size() + size > capacity_) {
        IoStatus status = flush();
        if (!status.is_ok()) {
            return status;
        }
        if (size >= capacity_) {
            return write_fully(data, size);
        }
    }
    buffer_.insert(buffer_.end(), data, data + size);
    return IoStatus::ok();
}

IoStatus BufferedWriter::flush() {
    if (buffer_.empty()) {
        return IoStatus::ok();
    }
    IoStatus status = write_fully(buffer_.data(), buffer_.size());
    // Bytes are gone either way; a failed destination is not retried
    buffer_.clear();
    return status;
}

IoStatus BufferedWriter::write_fully(const char* data, size_t size) {
    while (size > 0) {
        ssize_t n = ::write(fd_, data, size);
        if (n < 0) {
            int err = errno;
            if (err == EINTR) {
                continue;
            }
            if (err == EPIPE) {
                return IoStatus::broken_pipe(err);
            }
            return IoStatus::error(err);
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
    return IoStatus::ok();
}

} // namespace sinks
} // namespace secern
