#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace CommonUtils {

/**
 * @brief Byte length of the whitespace character starting at pos, or 0.
 * @details Matches the set Python's str.isspace() accepts, UTF-8 encoded:
 *          \t \n \v \f \r, \x1c-\x1f, space, U+0085, U+00A0, U+1680,
 *          U+2000-U+200A, U+2028, U+2029, U+202F, U+205F and U+3000.
 */
inline size_t whitespaceLengthAt(std::string_view s, size_t pos) {
    const auto byte = [&](size_t i) { return static_cast<unsigned char>(s[i]); };
    const size_t left = s.size() - pos;
    const unsigned char b0 = byte(pos);

    if ((b0 >= 0x09 && b0 <= 0x0D) || (b0 >= 0x1C && b0 <= 0x20)) return 1;
    if (b0 == 0xC2 && left >= 2) {
        const unsigned char b1 = byte(pos + 1);
        return (b1 == 0x85 || b1 == 0xA0) ? 2 : 0;
    }
    if (left < 3) return 0;
    const unsigned char b1 = byte(pos + 1);
    const unsigned char b2 = byte(pos + 2);
    if (b0 == 0xE1) return (b1 == 0x9A && b2 == 0x80) ? 3 : 0;
    if (b0 == 0xE3) return (b1 == 0x80 && b2 == 0x80) ? 3 : 0;
    if (b0 == 0xE2) {
        if (b1 == 0x80 && ((b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF)) return 3;
        if (b1 == 0x81 && b2 == 0x9F) return 3;
    }
    return 0;
}

inline std::string trim(std::string_view s) {
    size_t b = 0;
    while (b < s.size()) {
        const size_t n = whitespaceLengthAt(s, b);
        if (n == 0) break;
        b += n;
    }

    size_t e = s.size();
    while (e > b) {
        size_t n = 0;
        for (size_t len = 1; len <= 3 && len <= e - b; ++len) {
            if (whitespaceLengthAt(s, e - len) == len) {
                n = len;
                break;
            }
        }
        if (n == 0) break;
        e -= n;
    }
    return std::string(s.substr(b, e - b));
}

inline std::string joinNames(const std::vector<std::string>& names, std::string_view sep = ", ") {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out.append(sep);
        out.append(names[i]);
    }
    return out;
}

} // namespace CommonUtils
