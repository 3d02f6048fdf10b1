#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace editcore {

// =============================================================================
// UTF-8 Decoding
// =============================================================================

inline bool isContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

/**
 * Decode the code point starting at pos.
 * Malformed sequences decode as U+FFFD with byteLen = 1.
 * @param byteLen Receives the sequence length (0 when pos is past the end)
 */
inline char32_t decodeUtf8(std::string_view content, std::size_t pos, std::size_t& byteLen) {
    const std::size_t n = content.size();
    if (pos >= n) {
        byteLen = 0;
        return 0;
    }

    const unsigned char c0 = static_cast<unsigned char>(content[pos]);
    if ((c0 & 0x80) == 0) {
        byteLen = 1;
        return c0;
    }

    std::size_t len = 0;
    char32_t cp = 0;
    if ((c0 & 0xE0) == 0xC0) {
        len = 2;
        cp = c0 & 0x1F;
    } else if ((c0 & 0xF0) == 0xE0) {
        len = 3;
        cp = c0 & 0x0F;
    } else if ((c0 & 0xF8) == 0xF0) {
        len = 4;
        cp = c0 & 0x07;
    } else {
        byteLen = 1;
        return 0xFFFD;
    }

    if (pos + len > n) {
        byteLen = 1;
        return 0xFFFD;
    }
    for (std::size_t i = 1; i < len; ++i) {
        const unsigned char c = static_cast<unsigned char>(content[pos + i]);
        if (!isContinuationByte(c)) {
            byteLen = 1;
            return 0xFFFD;
        }
        cp = (cp << 6) | (c & 0x3F);
    }
    byteLen = len;
    return cp;
}

/**
 * Strict validation: rejects truncated sequences, overlong forms,
 * surrogates and code points above U+10FFFF.
 */
inline bool isValidUtf8(std::string_view content) {
    std::size_t pos = 0;
    const std::size_t n = content.size();
    while (pos < n) {
        const unsigned char c0 = static_cast<unsigned char>(content[pos]);
        if (c0 < 0x80) {
            ++pos;
            continue;
        }
        std::size_t len = 0;
        if ((c0 & 0xE0) == 0xC0) len = 2;
        else if ((c0 & 0xF0) == 0xE0) len = 3;
        else if ((c0 & 0xF8) == 0xF0) len = 4;
        else return false;

        std::size_t byteLen = 0;
        const char32_t cp = decodeUtf8(content, pos, byteLen);
        if (byteLen != len) return false;
        if (len == 2 && cp < 0x80) return false;
        if (len == 3 && (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF))) return false;
        if (len == 4 && (cp < 0x10000 || cp > 0x10FFFF)) return false;
        pos += len;
    }
    return true;
}

// =============================================================================
// UTF-8 Encoding
// =============================================================================

inline void appendUtf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

inline std::string encodeUtf8(char32_t cp) {
    std::string out;
    appendUtf8(out, cp);
    return out;
}

inline std::u32string decodeUtf8String(std::string_view content) {
    std::u32string out;
    out.reserve(content.size());
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::size_t byteLen = 0;
        out.push_back(decodeUtf8(content, pos, byteLen));
        pos += byteLen;
    }
    return out;
}

inline std::string encodeUtf8String(std::u32string_view chars) {
    std::string out;
    out.reserve(chars.size());
    for (char32_t cp : chars) appendUtf8(out, cp);
    return out;
}

// =============================================================================
// Counting
// =============================================================================

/** Number of code points (lead bytes) in a UTF-8 string. */
inline std::size_t countChars(std::string_view content) {
    std::size_t count = 0;
    for (char c : content) {
        if (!isContinuationByte(static_cast<unsigned char>(c))) ++count;
    }
    return count;
}

inline std::size_t countNewlines(std::string_view content) {
    std::size_t count = 0;
    for (char c : content) {
        if (c == '\n') ++count;
    }
    return count;
}

/** Byte offset of the charIndex-th code point, clamped to content.size(). */
inline std::size_t charToByteIn(std::string_view content, std::size_t charIndex) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < content.size(); ++i) {
        if (isContinuationByte(static_cast<unsigned char>(content[i]))) continue;
        if (seen == charIndex) return i;
        ++seen;
    }
    return content.size();
}

inline bool isCharBoundaryIn(std::string_view content, std::size_t byteIndex) {
    if (byteIndex == 0 || byteIndex >= content.size()) return byteIndex <= content.size();
    return !isContinuationByte(static_cast<unsigned char>(content[byteIndex]));
}

// =============================================================================
// Character Properties
// =============================================================================

/** Unicode White_Space property. */
inline bool isUnicodeWhitespace(char32_t cp) {
    switch (cp) {
        case 0x0009: case 0x000A: case 0x000B: case 0x000C: case 0x000D:
        case 0x0020: case 0x0085: case 0x00A0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

} // namespace editcore
