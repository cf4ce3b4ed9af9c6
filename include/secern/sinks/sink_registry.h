/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: sink_registry.h
 * Description: Header for SinkRegistry, the ordered list of sinks built from
 *              the configuration. Declaration order is preserved and decides
 *              which sink claims a line first.
 */

#pragma once

#include "secern/config/sink_config.h"
#include "secern/sinks/sink.h"
#include <iosfwd>
#include <vector>

namespace secern {
namespace sinks {

class SinkRegistry {
public:
    enum class BuildMode {
        kCreateOutputs,
        kValidateOnly // compile patterns only, touch no files
    };

    // Compiles every declaration's patterns before creating any output file.
    // Pattern failures from all sinks are reported together in one
    // ConfigError; file or directory creation failures raise ResourceError.
    static SinkRegistry build(const std::vector<config::SinkDeclaration>& declarations,
                              BuildMode mode = BuildMode::kCreateOutputs);

    SinkRegistry() = default;
    explicit SinkRegistry(std::vector<Sink> sinks) : sinks_(std::move(sinks)) {}

    SinkRegistry(SinkRegistry&&) = default;
    SinkRegistry& operator=(SinkRegistry&&) = default;

    size_t size() const { return sinks_.size(); }
    bool empty() const { return sinks_.empty(); }

    Sink& operator[](size_t index) { return sinks_[index]; }
    const Sink& operator[](size_t index) const { return sinks_[index]; }

    std::vector<Sink>::iterator begin() { return sinks_.begin(); }
    std::vector<Sink>::iterator end() { return sinks_.end(); }
    std::vector<Sink>::const_iterator begin() const { return sinks_.begin(); }
    std::vector<Sink>::const_iterator end() const { return sinks_.end(); }

    // Human-readable listing used by --validate-only
    void summary(std::ostream& os) const;

private:
    std::vector<Sink> sinks_;
};

} // namespace sinks
} // namespace secern
