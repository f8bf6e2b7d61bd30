#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace modelflux::common {

// Length of the well-formed UTF-8 sequence starting at data[i], or 0 if malformed
inline std::size_t utf8SequenceLength(const unsigned char* data, std::size_t i, std::size_t n) {
    const unsigned char c = data[i];
    std::size_t len = 0;
    if (c < 0x80)
        return 1;
    if (c >= 0xC2 && c <= 0xDF)
        len = 2;
    else if (c >= 0xE0 && c <= 0xEF)
        len = 3;
    else if (c >= 0xF0 && c <= 0xF4)
        len = 4;
    else
        return 0;
    if (i + len > n)
        return 0;
    for (std::size_t k = 1; k < len; ++k) {
        if ((data[i + k] & 0xC0) != 0x80)
            return 0;
    }
    return len;
}

// Replace malformed UTF-8 bytes with '?' so every later offset lands on a code point
inline std::string sanitizeUtf8(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    const std::size_t n = input.size();
    std::size_t i = 0;
    while (i < n) {
        const auto len = utf8SequenceLength(data, i, n);
        if (len == 0) {
            out.push_back('?');
            ++i;
            continue;
        }
        out.append(input.substr(i, len));
        i += len;
    }
    return out;
}

/**
 * Byte offset of every code point in well-formed UTF-8 text, plus a trailing entry equal
 * to text.size(). Result size is codePointCount + 1.
 */
inline std::vector<std::size_t> codePointOffsets(std::string_view text) {
    std::vector<std::size_t> offsets;
    offsets.reserve(text.size() + 1);
    const auto* data = reinterpret_cast<const unsigned char*>(text.data());
    const std::size_t n = text.size();
    std::size_t i = 0;
    while (i < n) {
        offsets.push_back(i);
        const auto len = utf8SequenceLength(data, i, n);
        i += len == 0 ? 1 : len;
    }
    offsets.push_back(n);
    return offsets;
}

inline bool isBlank(std::string_view text) {
    for (char c : text) {
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r' && c != '\f' && c != '\v')
            return false;
    }
    return true;
}

} // namespace modelflux::common
