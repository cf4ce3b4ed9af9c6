/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: line_router.cc
 * Description: Implementation of LineRouter. Sinks are evaluated in order and
 *              evaluation stops at the first one that claims the line, so a
 *              line reaches at most one destination.
 */

#include "secern/router/line_router.h"
#include "secern/utils/error.h"
#include "secern/utils/log.h"
#include "secern/utils/utf8.h"
#include <istream>

namespace secern {
namespace router {

LineRouter::LineRouter(sinks::SinkRegistry& registry, sinks::OutputManager& outputs)
    : registry_(registry), outputs_(outputs) {
    stats_.sink_matches.assign(registry_.size(), 0);
}

RouteDecision LineRouter::route(const std::string& line) const {
    RouteDecision decision;
    for (size_t i = 0; i < registry_.size(); ++i) {
        if (registry_[i].claims(line)) {
            decision.kind = RouteDecision::Kind::kSink;
            decision.sink_index = i;
            return decision;
        }
    }
    decision.kind = outputs_.pass_through_enabled()
        ? RouteDecision::Kind::kPassThrough
        : RouteDecision::Kind::kDrop;
    return decision;
}

bool LineRouter::dispatch(const std::string& line) {
    ++stats_.lines_read;
    RouteDecision decision = route(line);

    switch (decision.kind) {
        case RouteDecision::Kind::kSink:
            outputs_.write_sink(registry_[decision.sink_index], line);
            ++stats_.sink_matches[decision.sink_index];
            break;
        case RouteDecision::Kind::kPassThrough:
            if (outputs_.write_default(line).is_broken_pipe()) {
                return false;
            }
            ++stats_.passed_through;
            break;
        case RouteDecision::Kind::kDrop:
            ++stats_.dropped;
            break;
    }
    return true;
}

RunOutcome LineRouter::run(std::istream& input) {
    std::string line;
    uint64_t line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!utils::is_valid_utf8(line)) {
            throw InputError("Input line " + std::to_string(line_number) +
                             " is not valid UTF-8");
        }
        if (!dispatch(line)) {
            return RunOutcome::kDownstreamClosed;
        }
    }

    if (input.bad()) {
        throw InputError("Unable to read input after line " + std::to_string(line_number));
    }
    return RunOutcome::kInputExhausted;
}

RunOutcome LineRouter::run_and_flush(std::istream& input) {
    RunOutcome outcome;
    try {
        outcome = run(input);
    } catch (const Error&) {
        // Keep whatever the other destinations already hold
        try {
            outputs_.flush_all();
        } catch (const OutputError& flush_error) {
            utils::log_error(std::string("Final flush also failed: ") + flush_error.what());
        }
        throw;
    }

    if (outcome == RunOutcome::kDownstreamClosed) {
        outputs_.flush_sinks();
    } else {
        outputs_.flush_all();
    }
    return outcome;
}

} // namespace router
} // namespace secern
