/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: utf8.cc
 * Description: Implementation of the UTF-8 validator. ASCII runs take a
 *              fast path; multi-byte sequences are checked against the
 *              well-formed byte ranges of the Unicode standard.
 */

#include "secern/utils/utf8.h"
#include <cstdint>

namespace secern {
namespace utils {

bool is_valid_utf8(const char* data, size_t size) {
    const auto* p = reinterpret_cast<const uint8_t*>(data);
    size_t i = 0;

    while (i < size) {
        uint8_t c = p[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len;
        uint8_t lo = 0x80;
        uint8_t hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;       // overlong
            else if (c == 0xED) hi = 0x9F;  // surrogates
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;       // overlong
            else if (c == 0xF4) hi = 0x8F;  // > U+10FFFF
        } else {
            return false;
        }

        if (size - i < len) {
            return false;
        }
        if (p[i + 1] < lo || p[i + 1] > hi) {
            return false;
        }
        for (size_t k = 2; k < len; ++k) {
            if ((p[i + k] & 0xC0) != 0x80) {
                return false;
            }
        }
        i += len;
    }
    return true;
}

} // namespace utils
} // namespace secern
