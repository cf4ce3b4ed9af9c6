/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: buffered_writer.h
 * Description: Header for BufferedWriter, an OutputWriter that collects bytes
 *              in memory and writes them to a POSIX file descriptor when the
 *              buffer fills or on flush. Used for sink files and stdout.
 */

#pragma once

#include "secern/sinks/output_writer.h"
#include <memory>
#include <string>
#include <vector>

namespace secern {
namespace sinks {

class BufferedWriter : public OutputWriter {
public:
    static constexpr size_t FILE_BUFFER_SIZE = 64 * 1024;          // 64KB
    static constexpr size_t STDOUT_BUFFER_SIZE = 4096 * 1024;      // 4MB

    // Create (or truncate) path, creating missing parent directories.
    // Throws ResourceError naming the path on failure.
    static std::unique_ptr<BufferedWriter> create_file(const std::string& path,
                                                       size_t capacity = FILE_BUFFER_SIZE);

    // Wrap an existing descriptor. The descriptor is closed on destruction
    // only when owns_fd is true.
    BufferedWriter(int fd, std::string description, size_t capacity, bool owns_fd);
    ~BufferedWriter() override;

    BufferedWriter(const BufferedWriter&) = delete;
    BufferedWriter& operator=(const BufferedWriter&) = delete;

    IoStatus write(const char* data, size_t size) override;
    using OutputWriter::write;
    IoStatus flush() override;
    const std::string& describe() const override { return description_; }

    size_t buffered() const { return buffer_.size(); }
    size_t capacity() const { return capacity_; }

private:
    IoStatus write_fully(const char* data, size_t size);

    int fd_;
    std::string description_;
    size_t capacity_;
    bool owns_fd_;
    std::vector<char> buffer_;
};

} // namespace sinks
} // namespace secern
