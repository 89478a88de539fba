#pragma once

#include <string>
#include <string_view>

namespace beacon::common {

/**
 * @brief Length of the well-formed UTF-8 sequence starting at @p pos
 *
 * Overlong forms, surrogates and code points above U+10FFFF are malformed.
 *
 * @return 1-4, or 0 when the bytes at @p pos do not start a valid sequence
 */
inline size_t utf8SequenceLength(std::string_view s, size_t pos) {
    const auto byte = [&s](size_t i) { return static_cast<unsigned char>(s[i]); };
    const size_t left = s.size() - pos;
    const unsigned char lead = byte(pos);

    if (lead < 0x80) {
        return 1;
    }

    size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) {
            lo = 0xA0;
        } else if (lead == 0xED) {
            hi = 0x9F;
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) {
            lo = 0x90;
        } else if (lead == 0xF4) {
            hi = 0x8F;
        }
    } else {
        return 0;
    }

    if (left < len) {
        return 0;
    }
    const unsigned char second = byte(pos + 1);
    if (second < lo || second > hi) {
        return 0;
    }
    for (size_t k = 2; k < len; ++k) {
        if ((byte(pos + k) & 0xC0) != 0x80) {
            return 0;
        }
    }
    return len;
}

// Queries and snippets reach logs and JSON output; both need valid UTF-8.
inline std::string sanitizeUtf8(std::string_view input, char replacement = '?') {
    std::string out;
    out.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        const size_t len = utf8SequenceLength(input, i);
        if (len == 0) {
            out.push_back(replacement);
            ++i;
            continue;
        }
        out.append(input.substr(i, len));
        i += len;
    }
    return out;
}

// Cut to at most maxBytes without splitting a multi-byte sequence.
inline std::string truncateUtf8(std::string_view input, size_t maxBytes) {
    if (input.size() <= maxBytes) {
        return std::string(input);
    }
    size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(input[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return std::string(input.substr(0, cut));
}

} // namespace beacon::common
