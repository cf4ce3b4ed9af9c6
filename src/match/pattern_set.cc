/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: pattern_set.cc
 * Description: Implementation of PatternSet. Builds a block-mode Hyperscan
 *              database from all patterns at once, allocates its scratch
 *              space, and terminates each scan at the first reported match.
 */

#include "secern/match/pattern_set.h"
#include "secern/utils/error.h"
#include <climits>
#include <utility>

namespace secern {
namespace match {

namespace {
    // Patterns and lines are UTF-8, patterns may match the empty line, and
    // each only needs to report once per scan. No HS_FLAG_UCP: it rejects
    // \b and \B, so \w, \d, \s and \b keep their ASCII meaning.
    constexpr unsigned int PATTERN_FLAGS =
        HS_FLAG_SINGLEMATCH | HS_FLAG_ALLOWEMPTY | HS_FLAG_UTF8;

    int on_match(unsigned int /*id*/, unsigned long long /*from*/,
                 unsigned long long /*to*/, unsigned int /*flags*/, void* context) {
        *static_cast<bool*>(context) = true;
        return 1; // stop scanning
    }
}

PatternSet PatternSet::compile(const std::vector<std::string>& patterns) {
    if (patterns.empty()) {
        throw PatternError("pattern list is empty", -1, "");
    }

    std::vector<const char*> expressions;
    std::vector<unsigned int> flags;
    std::vector<unsigned int> ids;
    expressions.reserve(patterns.size());
    flags.reserve(patterns.size());
    ids.reserve(patterns.size());

    for (size_t i = 0; i < patterns.size(); ++i) {
        if (patterns[i].find('\0') != std::string::npos) {
            throw PatternError("pattern contains a NUL byte", static_cast<int>(i), patterns[i]);
        }
        expressions.push_back(patterns[i].c_str());
        flags.push_back(PATTERN_FLAGS);
        ids.push_back(static_cast<unsigned int>(i));
    }

    PatternSet set;
    set.patterns_ = patterns;

    hs_compile_error_t* compile_err = nullptr;
    hs_error_t rc = hs_compile_multi(expressions.data(), flags.data(), ids.data(),
                                     static_cast<unsigned int>(expressions.size()),
                                     HS_MODE_BLOCK, nullptr, &set.db_, &compile_err);
    if (rc != HS_SUCCESS) {
        std::string message = compile_err && compile_err->message
            ? compile_err->message : "unknown compile error";
        int index = compile_err ? compile_err->expression : -1;
        hs_free_compile_error(compile_err);

        std::string pattern;
        if (index >= 0 && static_cast<size_t>(index) < patterns.size()) {
            pattern = patterns[index];
            message = "pattern #" + std::to_string(index + 1) + " '" + pattern + "': " + message;
        }
        throw PatternError(message, index, pattern);
    }

    rc = hs_alloc_scratch(set.db_, &set.scratch_);
    if (rc != HS_SUCCESS) {
        throw PatternError("unable to allocate matcher scratch space (error " +
                           std::to_string(rc) + ")", -1, "");
    }

    return set;
}

PatternSet::~PatternSet() {
    release();
}

PatternSet::PatternSet(PatternSet&& other) noexcept
    : patterns_(std::move(other.patterns_)), db_(other.db_), scratch_(other.scratch_) {
    other.db_ = nullptr;
    other.scratch_ = nullptr;
}

PatternSet& PatternSet::operator=(PatternSet&& other) noexcept {
    if (this != &other) {
        release();
        patterns_ = std::move(other.patterns_);
        db_ = other.db_;
        scratch_ = other.scratch_;
        other.db_ = nullptr;
        other.scratch_ = nullptr;
    }
    return *this;
}

void PatternSet::release() noexcept {
    if (scratch_) {
        hs_free_scratch(scratch_);
        scratch_ = nullptr;
    }
    if (db_) {
        hs_free_database(db_);
        db_ = nullptr;
    }
}

bool PatternSet::matches(const std::string& text) const {
    if (text.size() > UINT_MAX) {
        throw Error("line too long for matcher (" + std::to_string(text.size()) + " bytes)");
    }

    bool matched = false;
    hs_error_t rc = hs_scan(db_, text.data(), static_cast<unsigned int>(text.size()), 0,
                            scratch_, on_match, &matched);
    if (rc != HS_SUCCESS && rc != HS_SCAN_TERMINATED) {
        throw Error("matcher scan failed (error " + std::to_string(rc) + ")");
    }
    return matched;
}

} // namespace match
} // namespace secern
