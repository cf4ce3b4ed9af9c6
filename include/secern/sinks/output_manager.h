/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: output_manager.h
 * Description: Header for OutputManager, which performs every line write for
 *              the sinks of a registry and for the default output, and
 *              flushes all of them at shutdown.
 */

#pragma once

#include "secern/sinks/output_writer.h"
#include "secern/sinks/sink_registry.h"
#include <memory>
#include <string>

namespace secern {
namespace sinks {

class OutputManager {
public:
    // default_output may be null, which disables pass-through
    OutputManager(SinkRegistry& registry, std::unique_ptr<OutputWriter> default_output);

    bool pass_through_enabled() const { return default_output_ != nullptr; }

    // Write line and terminator to the sink's file, if it has one.
    // Throws OutputError naming the sink and file.
    void write_sink(Sink& sink, const std::string& line);

    // Write line and terminator to the default output. Returns a broken
    // pipe status when the reader has gone away; throws OutputError on any
    // other failure.
    IoStatus write_default(const std::string& line);

    // Flush every sink file, then the default output. All writers are
    // attempted; each failure is logged and the first one is rethrown as
    // OutputError. A closed reader on the default output is not a failure.
    void flush_all();

    // Flush sink files only (default output reader is known to be gone)
    void flush_sinks();

private:
    SinkRegistry& registry_;
    std::unique_ptr<OutputWriter> default_output_;
};

} // namespace sinks
} // namespace secern
