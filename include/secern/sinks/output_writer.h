/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: output_writer.h
 * Description: Base interface for buffered output destinations (sink files
 *              and the default output) and the status value their write and
 *              flush operations return.
 */

#pragma once

#include <cstddef>
#include <string>

namespace secern {
namespace sinks {

struct IoStatus {
    enum class Code {
        kOk,
        kBrokenPipe, // reader on the other end has gone away
        kError
    };

    Code code = Code::kOk;
    int error_number = 0;

    static IoStatus ok() { return IoStatus{}; }
    static IoStatus broken_pipe(int err) { return IoStatus{Code::kBrokenPipe, err}; }
    static IoStatus error(int err) { return IoStatus{Code::kError, err}; }

    bool is_ok() const { return code == Code::kOk; }
    bool is_broken_pipe() const { return code == Code::kBrokenPipe; }

    std::string message() const;
};

// Base interface for output destinations
class OutputWriter {
public:
    virtual ~OutputWriter() = default;

    // Append bytes; may be held in a buffer until flush()
    virtual IoStatus write(const char* data, size_t size) = 0;

    IoStatus write(const std::string& data) { return write(data.data(), data.size()); }

    // Push all buffered bytes to the destination
    virtual IoStatus flush() = 0;

    // Path or stream name used in messages
    virtual const std::string& describe() const = 0;
};

} // namespace sinks
} // namespace secern
