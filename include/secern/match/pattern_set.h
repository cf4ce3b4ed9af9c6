/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: pattern_set.h
 * Description: Header for PatternSet, a group of regular expressions compiled
 *              into a single Hyperscan database and queried as one "does any
 *              pattern match this line" predicate in a single scan.
 */

#pragma once

#include <string>
#include <vector>
#include <hs/hs.h>

namespace secern {
namespace match {

class PatternSet {
public:
    // Compile patterns into one database. Throws PatternError when the list
    // is empty or any pattern is rejected by the matcher.
    static PatternSet compile(const std::vector<std::string>& patterns);

    ~PatternSet();

    PatternSet(PatternSet&& other) noexcept;
    PatternSet& operator=(PatternSet&& other) noexcept;
    PatternSet(const PatternSet&) = delete;
    PatternSet& operator=(const PatternSet&) = delete;

    // True if at least one pattern matches somewhere in text.
    // text must be valid UTF-8.
    bool matches(const std::string& text) const;

    size_t pattern_count() const { return patterns_.size(); }
    const std::vector<std::string>& patterns() const { return patterns_; }

private:
    PatternSet() = default;

    void release() noexcept;

    std::vector<std::string> patterns_;
    hs_database_t* db_{nullptr};
    // One scratch region is enough: scans never run concurrently
    hs_scratch_t* scratch_{nullptr};
};

} // namespace match
} // namespace secern
