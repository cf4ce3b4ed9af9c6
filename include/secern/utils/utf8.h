/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: utf8.h
 * Description: UTF-8 well-formedness check for input lines. The matcher
 *              runs in UTF-8 mode and must only ever see valid UTF-8.
 */

#pragma once

#include <cstddef>
#include <string>

namespace secern {
namespace utils {

// Returns true if data[0, size) is well-formed UTF-8 (no overlongs, no
// surrogates, nothing above U+10FFFF)
bool is_valid_utf8(const char* data, size_t size);

inline bool is_valid_utf8(const std::string& text) {
    return is_valid_utf8(text.data(), text.size());
}

} // namespace utils
} // namespace secern
