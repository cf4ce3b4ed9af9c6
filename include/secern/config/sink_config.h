/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: sink_config.h
 * Description: Parsed configuration model. One SinkDeclaration per record of
 *              the configuration document, kept in declaration order.
 */

#pragma once

#include <string>
#include <vector>

namespace secern {
namespace config {

// Value of file_name that means "consume matches without writing them"
constexpr const char* DISCARD_SENTINEL = "null";

struct SinkDestination {
    enum class Kind {
        kDiscard,
        kFile
    };

    Kind kind = Kind::kDiscard;
    std::string path; // empty for kDiscard

    static SinkDestination discard() { return SinkDestination{}; }
    static SinkDestination file(const std::string& path) {
        SinkDestination dest;
        dest.kind = Kind::kFile;
        dest.path = path;
        return dest;
    }

    // Maps the configuration value to a destination; the sentinel selects discard
    static SinkDestination from_file_name(const std::string& file_name) {
        return file_name == DISCARD_SENTINEL ? discard() : file(file_name);
    }

    bool is_discard() const { return kind == Kind::kDiscard; }

    // Configuration spelling of this destination
    std::string file_name() const { return is_discard() ? DISCARD_SENTINEL : path; }
};

struct SinkDeclaration {
    std::string name;
    SinkDestination destination;
    std::vector<std::string> patterns;
    bool invert = false;
};

} // namespace config
} // namespace secern
