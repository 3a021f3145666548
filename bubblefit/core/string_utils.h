#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace bubblefit {

// =============================================================================
// UTF-8 Decoding
// =============================================================================

/**
 * Decode the code point starting at `pos`. Malformed sequences decode as
 * U+FFFD with byteLen 1 so callers always make progress.
 */
inline std::uint32_t decodeUtf8Codepoint(std::string_view content, std::size_t pos, std::uint32_t& byteLen) {
    const std::size_t n = content.size();
    byteLen = 0;
    if (pos >= n) {
        return 0;
    }

    const unsigned char lead = static_cast<unsigned char>(content[pos]);
    std::uint32_t need = 0;
    std::uint32_t cp = 0;
    if ((lead & 0x80) == 0) {
        byteLen = 1;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        need = 1;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        need = 2;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        need = 3;
        cp = lead & 0x07;
    } else {
        byteLen = 1;
        return 0xFFFD;
    }

    if (pos + need >= n) {
        byteLen = 1;
        return 0xFFFD;
    }
    for (std::uint32_t i = 1; i <= need; ++i) {
        const unsigned char c = static_cast<unsigned char>(content[pos + i]);
        if ((c & 0xC0) != 0x80) {
            byteLen = 1;
            return 0xFFFD;
        }
        cp = (cp << 6) | (c & 0x3F);
    }
    byteLen = need + 1;
    return cp;
}

/**
 * Split UTF-8 content into one view per code point.
 */
inline std::vector<std::string_view> splitCodepoints(std::string_view content) {
    std::vector<std::string_view> out;
    out.reserve(content.size());
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::uint32_t byteLen = 0;
        decodeUtf8Codepoint(content, pos, byteLen);
        if (byteLen == 0) break;
        out.push_back(content.substr(pos, byteLen));
        pos += byteLen;
    }
    return out;
}

/**
 * Code points that take a full em and may break anywhere: CJK ideographs,
 * kana, CJK punctuation, Hangul syllables and full-width forms.
 */
inline bool isWideCodepoint(std::uint32_t cp) {
    return (cp >= 0x1100 && cp <= 0x115F) ||
           (cp >= 0x2E80 && cp <= 0x303E) ||
           (cp >= 0x3040 && cp <= 0x33FF) ||
           (cp >= 0x3400 && cp <= 0x4DBF) ||
           (cp >= 0x4E00 && cp <= 0x9FFF) ||
           (cp >= 0xAC00 && cp <= 0xD7A3) ||
           (cp >= 0xF900 && cp <= 0xFAFF) ||
           (cp >= 0xFE30 && cp <= 0xFE4F) ||
           (cp >= 0xFF00 && cp <= 0xFF60) ||
           (cp >= 0xFFE0 && cp <= 0xFFE6) ||
           (cp >= 0x20000 && cp <= 0x2FFFD);
}

// =============================================================================
// Hash/Digest (FNV-1a)
// =============================================================================

constexpr std::uint64_t kDigestOffset = 14695981039346656037ull;
constexpr std::uint64_t kDigestPrime = 1099511628211ull;

inline std::uint64_t hashU32(std::uint64_t h, std::uint32_t v) {
    h ^= v;
    return h * kDigestPrime;
}

inline std::uint64_t hashBytes(std::uint64_t h, const std::uint8_t* data, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
        h ^= data[i];
        h *= kDigestPrime;
    }
    return h;
}

} // namespace bubblefit
