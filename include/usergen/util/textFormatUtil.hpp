#pragma once
/// @file textFormatUtil.hpp
/// @brief String helpers for the colon-delimited record format

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace UserGen::util {

/// Field delimiter of both the input and the output record format.
constexpr char kFieldSeparator = ':';

/// @brief Whitespace as far as trimming is concerned
/// @details The Unicode White_Space property (ASCII blanks, U+0085, U+00A0,
///          U+2000..U+200A, U+3000, ...) plus the C0 separators U+001C..U+001F.
inline bool isTrimSpace(UChar32 c) { return (c >= 0x1C && c <= 0x1F) || u_isUWhiteSpace(c); }

/// @brief Strips leading and trailing whitespace code points
/// @details Ill-formed UTF-8 is never whitespace and stops the scan.
inline std::string trim(const std::string& s) {
    const auto* p = reinterpret_cast<const uint8_t*>(s.data());
    const int32_t len = static_cast<int32_t>(s.size());

    int32_t begin = 0;
    while (begin < len) {
        int32_t next = begin;
        UChar32 c;
        U8_NEXT(p, next, len, c);
        if (c < 0 || !isTrimSpace(c))
            break;
        begin = next;
    }

    int32_t end = len;
    while (end > begin) {
        int32_t prev = end;
        UChar32 c;
        U8_PREV(p, begin, prev, c);
        if (c < 0 || !isTrimSpace(c))
            break;
        end = prev;
    }
    return s.substr(static_cast<size_t>(begin), static_cast<size_t>(end - begin));
}

/// @brief Splits on every separator (no limit) and trims each piece
/// @details "a::b" yields {"a", "", "b"}; an empty input yields {""}.
inline std::vector<std::string> splitFields(const std::string& line,
                                            char sep = kFieldSeparator) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        auto pos = line.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(trim(line.substr(start)));
            break;
        }
        parts.push_back(trim(line.substr(start, pos - start)));
        start = pos + 1;
    }
    return parts;
}

/// @brief Joins parts[first..] with the separator
inline std::string joinFields(const std::vector<std::string>& parts, size_t first,
                              char sep = kFieldSeparator) {
    std::string out;
    for (size_t i = first; i < parts.size(); ++i) {
        if (i > first)
            out.push_back(sep);
        out += parts[i];
    }
    return out;
}

/// @brief true if @p s is non-empty and made of ASCII digits only
/// @note No numeric range is implied; "000123456789012345678901" is accepted.
inline bool isAllDigits(const std::string& s) {
    if (s.empty())
        return false;
    for (char c : s) {
        if (c < '0' || c > '9')
            return false;
    }
    return true;
}

/// @brief Simple (one code point to one code point) lowercase mapping
/// @details Default Unicode case mapping: U+0160 becomes U+0161 just as
///          "A" becomes "a". Ill-formed bytes are copied unchanged.
inline std::string toLowerUtf8(const std::string& s) {
    const auto* p = reinterpret_cast<const uint8_t*>(s.data());
    const int32_t len = static_cast<int32_t>(s.size());

    std::string out;
    out.reserve(s.size());
    int32_t i = 0;
    while (i < len) {
        const int32_t start = i;
        UChar32 c;
        U8_NEXT(p, i, len, c);
        if (c < 0) {
            out.append(s, static_cast<size_t>(start), static_cast<size_t>(i - start));
            continue;
        }
        uint8_t buf[U8_MAX_LENGTH];
        int32_t n = 0;
        U8_APPEND_UNSAFE(buf, n, u_tolower(c));
        out.append(reinterpret_cast<const char*>(buf), static_cast<size_t>(n));
    }
    return out;
}

/// @brief Byte length of the UTF-8 sequence introduced by @p lead
/// @details Stray continuation bytes and invalid leads count as one byte.
inline size_t utf8SequenceLength(unsigned char lead) {
    if (lead < 0x80)
        return 1;
    if (lead >= 0xC2 && lead <= 0xDF)
        return 2;
    if (lead >= 0xE0 && lead <= 0xEF)
        return 3;
    if (lead >= 0xF0 && lead <= 0xF4)
        return 4;
    return 1;
}

/// @brief Longest prefix of @p s holding at most @p count code points
inline std::string utf8Prefix(const std::string& s, size_t count) {
    size_t pos = 0;
    for (size_t n = 0; n < count && pos < s.size(); ++n) {
        size_t len = utf8SequenceLength((unsigned char)s[pos]);
        pos += len;
        if (pos > s.size())
            pos = s.size();
    }
    return s.substr(0, pos);
}

/// @brief Number of code points in @p s
inline size_t utf8Length(const std::string& s) {
    size_t n = 0;
    for (size_t pos = 0; pos < s.size(); ++n)
        pos += utf8SequenceLength((unsigned char)s[pos]);
    return n;
}

/// @brief Strict UTF-8 check (no overlongs, no surrogates, nothing above U+10FFFF)
/// @param data Bytes to check
/// @param size Byte count
/// @param badOffset Offset of the first offending byte when the check fails
inline bool isValidUtf8(const char* data, size_t size, size_t& badOffset) {
    const auto* s = reinterpret_cast<const unsigned char*>(data);
    size_t i = 0;
    while (i < size) {
        unsigned char c = s[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c == 0xE0) {
            len = 3;
            lo = 0xA0;
        } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
            len = 3;
        } else if (c == 0xED) {
            len = 3;
            hi = 0x9F;
        } else if (c == 0xF0) {
            len = 4;
            lo = 0x90;
        } else if (c >= 0xF1 && c <= 0xF3) {
            len = 4;
        } else if (c == 0xF4) {
            len = 4;
            hi = 0x8F;
        } else {
            badOffset = i;
            return false;
        }

        if (i + len > size) {
            badOffset = i;
            return false;
        }
        // only the second byte has a narrowed range
        if (s[i + 1] < lo || s[i + 1] > hi) {
            badOffset = i;
            return false;
        }
        for (size_t k = 2; k < len; ++k) {
            if (s[i + k] < 0x80 || s[i + k] > 0xBF) {
                badOffset = i;
                return false;
            }
        }
        i += len;
    }
    return true;
}

/// @brief Splits text into lines on "\n", "\r\n" or a lone "\r"
/// @details Terminators are dropped. A trailing terminator does not produce an
///          extra empty line.
inline std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string::size_type start = 0;
    std::string::size_type i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c == '\n' || c == '\r') {
            lines.push_back(text.substr(start, i - start));
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            start = i + 1;
        }
        ++i;
    }
    if (start < text.size())
        lines.push_back(text.substr(start));
    return lines;
}

} // namespace UserGen::util
