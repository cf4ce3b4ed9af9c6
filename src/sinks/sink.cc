/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: sink.cc
 * Description: Implementation of Sink accessors over its destination variant.
 */

#include "secern/sinks/sink.h"
#include "secern/config/sink_config.h"

namespace secern {
namespace sinks {

Sink::Sink(std::string name, match::PatternSet matcher, SinkOutput output, bool invert)
    : name_(std::move(name)), matcher_(std::move(matcher)), output_(std::move(output)),
      invert_(invert) {
}

OutputWriter* Sink::writer() {
    if (auto* owned = std::get_if<std::unique_ptr<OutputWriter>>(&output_)) {
        return owned->get();
    }
    return nullptr;
}

std::string Sink::destination_name() const {
    if (const auto* unopened = std::get_if<UnopenedFile>(&output_)) {
        return unopened->path;
    }
    const auto* owned = std::get_if<std::unique_ptr<OutputWriter>>(&output_);
    if (owned && *owned) {
        return (*owned)->describe();
    }
    return config::DISCARD_SENTINEL;
}

} // namespace sinks
} // namespace secern
