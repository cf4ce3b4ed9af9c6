/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: line_router.h
 * Description: Header for LineRouter, which reads input lines one at a time
 *              and hands each to the first sink (in registry order) that
 *              claims it, or to the default output when none does.
 */

#pragma once

#include "secern/sinks/output_manager.h"
#include "secern/sinks/sink_registry.h"
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace secern {
namespace router {

struct RouteDecision {
    enum class Kind {
        kSink,        // claimed by sinks[sink_index]
        kPassThrough, // unclaimed, goes to the default output
        kDrop         // unclaimed and pass-through is disabled
    };

    Kind kind = Kind::kDrop;
    size_t sink_index = 0;
};

struct RouteStats {
    uint64_t lines_read = 0;
    std::vector<uint64_t> sink_matches; // indexed like the registry
    uint64_t passed_through = 0;
    uint64_t dropped = 0;
};

enum class RunOutcome {
    kInputExhausted,
    kDownstreamClosed // default output reader went away
};

class LineRouter {
public:
    LineRouter(sinks::SinkRegistry& registry, sinks::OutputManager& outputs);

    // First-match-wins decision for one line; performs no output
    RouteDecision route(const std::string& line) const;

    // Route and write one line. Returns false if the default output's
    // reader has gone away. Throws OutputError on sink write failure.
    bool dispatch(const std::string& line);

    // Dispatch every line of input until it is exhausted or the default
    // output closes. Trailing '\r' is stripped. Throws InputError on a read
    // failure or a line that is not valid UTF-8.
    RunOutcome run(std::istream& input);

    // run() followed by the shutdown flush. Sink files are always flushed;
    // the default output too unless its reader has gone away. When run()
    // fails, every buffer is still flushed before the error is rethrown.
    RunOutcome run_and_flush(std::istream& input);

    const RouteStats& stats() const { return stats_; }

private:
    sinks::SinkRegistry& registry_;
    sinks::OutputManager& outputs_;
    RouteStats stats_;
};

} // namespace router
} // namespace secern
