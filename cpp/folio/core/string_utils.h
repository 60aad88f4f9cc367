#pragma once

#include <cstdint>
#include <cstring>
#include <algorithm>
#include <string>
#include <string_view>

namespace folio {

// =============================================================================
// UTF-8 Decoding
// =============================================================================

inline bool isUtf8Continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

inline std::uint32_t decodeUtf8Codepoint(std::string_view content, std::size_t pos, std::uint32_t& byteLen) {
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

    if ((c0 & 0xE0) == 0xC0 && pos + 1 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        if (!isUtf8Continuation(c1)) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 2;
        return ((c0 & 0x1F) << 6) | (c1 & 0x3F);
    }

    if ((c0 & 0xF0) == 0xE0 && pos + 2 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        const unsigned char c2 = static_cast<unsigned char>(content[pos + 2]);
        if (!isUtf8Continuation(c1) || !isUtf8Continuation(c2)) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 3;
        return ((c0 & 0x0F) << 12) | ((c1 & 0x3F) << 6) | (c2 & 0x3F);
    }

    if ((c0 & 0xF8) == 0xF0 && pos + 3 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        const unsigned char c2 = static_cast<unsigned char>(content[pos + 2]);
        const unsigned char c3 = static_cast<unsigned char>(content[pos + 3]);
        if (!isUtf8Continuation(c1) || !isUtf8Continuation(c2) || !isUtf8Continuation(c3)) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 4;
        return ((c0 & 0x07) << 18) | ((c1 & 0x3F) << 12) | ((c2 & 0x3F) << 6) | (c3 & 0x3F);
    }

    byteLen = 1;
    return 0xFFFD;
}

/**
 * Number of UTF-16 code units a code point occupies.
 */
inline std::uint32_t utf16Units(std::uint32_t cp) {
    return cp > 0xFFFF ? 2u : 1u;
}

inline void appendUtf8(std::string& out, std::uint32_t cp) {
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

// =============================================================================
// UTF-8 Index Conversion
// =============================================================================

/**
 * Map logical index (UTF-16 code unit count) to UTF-8 byte offset.
 * An index that lands inside a surrogate pair resolves to the start of that code point.
 */
inline std::uint32_t logicalToByteIndex(std::string_view content, std::uint32_t logicalIndex) {
    std::uint32_t bytePos = 0;
    std::uint32_t logicalCount = 0;
    const std::size_t n = content.size();
    while (bytePos < n && logicalCount < logicalIndex) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(content, bytePos, byteLen);
        if (byteLen == 0) break;
        const std::uint32_t units = utf16Units(cp);
        if (logicalCount + units > logicalIndex) break;
        logicalCount += units;
        bytePos += byteLen;
    }
    return static_cast<std::uint32_t>(bytePos);
}

/**
 * Map UTF-8 byte index to logical index (UTF-16 code unit count).
 */
inline std::uint32_t byteToLogicalIndex(std::string_view content, std::uint32_t byteIndex) {
    std::uint32_t logicalCount = 0;
    const std::size_t n = content.size();
    const std::size_t limit = std::min<std::size_t>(n, byteIndex);
    std::size_t pos = 0;
    while (pos < limit) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(content, pos, byteLen);
        if (byteLen == 0 || pos + byteLen > limit) break;
        logicalCount += utf16Units(cp);
        pos += byteLen;
    }
    return logicalCount;
}

inline std::uint32_t logicalLength(std::string_view content) {
    return byteToLogicalIndex(content, static_cast<std::uint32_t>(content.size()));
}

/**
 * Move a byte index back to the first byte of the code point containing it.
 */
inline std::size_t floorToCodepoint(std::string_view content, std::size_t byteIndex) {
    byteIndex = std::min(byteIndex, content.size());
    while (byteIndex > 0 && byteIndex < content.size()
           && isUtf8Continuation(static_cast<unsigned char>(content[byteIndex]))) {
        --byteIndex;
    }
    return byteIndex;
}

inline std::uint32_t countChar(std::string_view content, char ch) {
    return static_cast<std::uint32_t>(std::count(content.begin(), content.end(), ch));
}

} // namespace folio
