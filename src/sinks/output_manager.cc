/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: output_manager.cc
 * Description: Implementation of OutputManager. Each line is written as two
 *              calls (payload, then newline) to avoid per-line formatting.
 *              Sink write failures are fatal and name the sink; a closed
 *              reader on the default output is reported back to the caller.
 */

#include "secern/sinks/output_manager.h"
#include "secern/utils/error.h"
#include "secern/utils/log.h"
#include <optional>

namespace secern {
namespace sinks {

namespace {
    const char NEWLINE = '\n';

    std::string sink_failure(const Sink& sink, const char* action, const IoStatus& status) {
        return std::string("Unable to ") + action + " output file '" + sink.destination_name() +
               "' for sink named '" + sink.name() + "' due to error: " + status.message();
    }
}

OutputManager::OutputManager(SinkRegistry& registry, std::unique_ptr<OutputWriter> default_output)
    : registry_(registry), default_output_(std::move(default_output)) {
}

void OutputManager::write_sink(Sink& sink, const std::string& line) {
    OutputWriter* writer = sink.writer();
    if (writer == nullptr) {
        return;
    }

    IoStatus status = writer->write(line.data(), line.size());
    if (status.is_ok()) {
        status = writer->write(&NEWLINE, 1);
    }
    if (!status.is_ok()) {
        throw OutputError(sink_failure(sink, "write to", status));
    }
}

IoStatus OutputManager::write_default(const std::string& line) {
    if (!default_output_) {
        return IoStatus::ok();
    }

    IoStatus status = default_output_->write(line.data(), line.size());
    if (status.is_ok()) {
        status = default_output_->write(&NEWLINE, 1);
    }
    if (!status.is_ok() && !status.is_broken_pipe()) {
        throw OutputError("Unable to write data to " + default_output_->describe() +
                          " due to error: " + status.message());
    }
    return status;
}

void OutputManager::flush_sinks() {
    std::optional<std::string> first_failure;

    for (auto& sink : registry_) {
        OutputWriter* writer = sink.writer();
        if (writer == nullptr) {
            continue;
        }
        IoStatus status = writer->flush();
        if (!status.is_ok()) {
            std::string message = sink_failure(sink, "flush final data to", status);
            utils::log_error(message);
            if (!first_failure) {
                first_failure = message;
            }
        }
    }

    if (first_failure) {
        throw OutputError(*first_failure);
    }
}

void OutputManager::flush_all() {
    std::optional<OutputError> failure;
    try {
        flush_sinks();
    } catch (const OutputError& e) {
        // Already logged; the default output still gets its flush
        failure = e;
    }

    if (default_output_) {
        IoStatus status = default_output_->flush();
        if (!status.is_ok() && !status.is_broken_pipe()) {
            std::string message = "Unable to flush data to " + default_output_->describe() +
                                  " due to error: " + status.message();
            utils::log_error(message);
            if (!failure) {
                failure = OutputError(message);
            }
        }
    }

    if (failure) {
        throw *failure;
    }
}

} // namespace sinks
} // namespace secern
