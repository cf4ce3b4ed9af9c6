/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: sink_registry.cc
 * Description: Implementation of SinkRegistry construction. Runs a full
 *              validation pass over all pattern sets first, then resolves
 *              destinations and opens output files in declaration order.
 */

#include "secern/sinks/sink_registry.h"
#include "secern/sinks/buffered_writer.h"
#include "secern/utils/error.h"
#include "secern/utils/log.h"
#include <optional>
#include <ostream>

namespace secern {
namespace sinks {

SinkRegistry SinkRegistry::build(const std::vector<config::SinkDeclaration>& declarations,
                                 BuildMode mode) {
    // Pass 1: compile everything, collecting failures
    std::vector<std::optional<match::PatternSet>> compiled;
    std::vector<std::string> errors;
    compiled.reserve(declarations.size());

    for (const auto& decl : declarations) {
        try {
            compiled.emplace_back(match::PatternSet::compile(decl.patterns));
        } catch (const PatternError& e) {
            errors.push_back("Error parsing Regex pattern in sink named '" + decl.name +
                             "' due to error: " + e.what());
            compiled.emplace_back(std::nullopt);
        }
    }

    if (!errors.empty()) {
        throw ConfigError(std::to_string(errors.size()) + " sink(s) have invalid patterns",
                          std::move(errors));
    }

    // Pass 2: resolve destinations
    std::vector<Sink> sinks;
    sinks.reserve(declarations.size());

    for (size_t i = 0; i < declarations.size(); ++i) {
        const auto& decl = declarations[i];
        SinkOutput output;

        if (decl.destination.is_discard()) {
            output = DiscardOutput{};
        } else if (mode == BuildMode::kValidateOnly) {
            output = UnopenedFile{decl.destination.path};
        } else {
            try {
                output = std::unique_ptr<OutputWriter>(
                    BufferedWriter::create_file(decl.destination.path));
            } catch (const ResourceError& e) {
                throw ResourceError(std::string(e.what()) + " (sink named '" + decl.name + "')");
            }
            utils::log_debug("Opened output file '" + decl.destination.path +
                             "' for sink named '" + decl.name + "'");
        }

        sinks.emplace_back(decl.name, std::move(*compiled[i]), std::move(output), decl.invert);
    }

    return SinkRegistry(std::move(sinks));
}

void SinkRegistry::summary(std::ostream& os) const {
    os << "Sinks: " << sinks_.size() << "\n";
    for (size_t i = 0; i < sinks_.size(); ++i) {
        const auto& sink = sinks_[i];
        os << "  [" << (i + 1) << "] " << sink.name() << "\n";
        os << "      output:   " << sink.destination_name() << "\n";
        os << "      invert:   " << (sink.invert() ? "true" : "false") << "\n";
        os << "      patterns: " << sink.matcher().pattern_count() << "\n";
        for (const auto& pattern : sink.matcher().patterns()) {
            os << "        " << pattern << "\n";
        }
    }
}

} // namespace sinks
} // namespace secern
