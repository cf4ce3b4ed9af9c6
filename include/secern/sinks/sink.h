/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: sink.h
 * Description: Header for Sink, a named pattern set bound to an output
 *              destination and an invert flag. A sink either discards what it
 *              claims, owns an open buffered writer, or (during dry
 *              validation) records a file it has not opened.
 */

#pragma once

#include "secern/match/pattern_set.h"
#include "secern/sinks/output_writer.h"
#include <memory>
#include <string>
#include <variant>

namespace secern {
namespace sinks {

// Claimed lines are consumed and never written
struct DiscardOutput {};

// File destination resolved but not opened (dry validation)
struct UnopenedFile {
    std::string path;
};

using SinkOutput = std::variant<DiscardOutput, UnopenedFile, std::unique_ptr<OutputWriter>>;

class Sink {
public:
    Sink(std::string name, match::PatternSet matcher, SinkOutput output, bool invert = false);

    Sink(Sink&&) = default;
    Sink& operator=(Sink&&) = default;

    const std::string& name() const { return name_; }
    bool invert() const { return invert_; }
    const match::PatternSet& matcher() const { return matcher_; }

    // Effective match: the pattern set result, negated when invert is set
    bool claims(const std::string& line) const {
        return matcher_.matches(line) != invert_;
    }

    bool is_discard() const { return std::holds_alternative<DiscardOutput>(output_); }

    // Open writer, or nullptr for discard and unopened destinations
    OutputWriter* writer();

    // "null" for discard sinks, otherwise the file path
    std::string destination_name() const;

private:
    std::string name_;
    match::PatternSet matcher_;
    SinkOutput output_;
    bool invert_;
};

} // namespace sinks
} // namespace secern
