#pragma once

#include <string>
#include <vector>
#include <cstdint>

#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

namespace Seed {

/**
 * @brief Thread-safe UTF-8 to UTF-32 conversion.
 *
 * Invalid start bytes are skipped.
 */
inline std::u32string utf8_to_utf32(const std::string& s) {
    std::u32string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ) {
        uint8_t c = static_cast<uint8_t>(s[i]);
        char32_t cp = 0;
        size_t len = 0;

        if (c < 0x80) { cp = c; len = 1; }
        else if ((c >> 5) == 0x6) { cp = c & 0x1F; len = 2; }
        else if ((c >> 4) == 0xE) { cp = c & 0x0F; len = 3; }
        else if ((c >> 3) == 0x1E) { cp = c & 0x07; len = 4; }
        else { ++i; continue; } // Invalid start byte

        for (size_t j = 1; j < len; ++j) {
            if (i + j >= s.size()) { len = j; break; }
            uint8_t cc = static_cast<uint8_t>(s[i + j]);
            if ((cc >> 6) != 0x2) { len = j; break; } // Truncated sequence
            cp = (cp << 6) | (cc & 0x3F);
        }

        out.push_back(cp);
        i += len;
    }
    return out;
}

inline std::string utf32_to_utf8(const std::u32string& s) {
    std::string out;
    out.reserve(s.size() * 3 / 2);
    for (char32_t cp : s) {
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
    return out;
}

inline bool is_space(char32_t cp) {
    switch (cp) {
        case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D: case 0x20:
        case 0x1C: case 0x1D: case 0x1E: case 0x1F: case 0x85: case 0xA0:
        case 0x1680: case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

/**
 * @brief Simple (one-to-one) lower-case mapping of a single codepoint.
 */
inline char32_t to_lower(char32_t cp) {
    return static_cast<char32_t>(u_tolower(static_cast<UChar32>(cp)));
}

/**
 * @brief Letters, digits and other numerics (general categories L* and N*)
 *        plus '_': the characters a regex word boundary sees as word characters.
 */
inline bool is_word_char(char32_t cp) {
    if (cp == U'_') return true;
    return (U_GET_GC_MASK(static_cast<UChar32>(cp)) & (U_GC_L_MASK | U_GC_N_MASK)) != 0;
}

/**
 * @brief Strip leading/trailing Unicode whitespace.
 */
inline std::string trim(const std::string& s) {
    std::u32string u = utf8_to_utf32(s);
    size_t first = 0;
    while (first < u.size() && is_space(u[first])) ++first;
    size_t last = u.size();
    while (last > first && is_space(u[last - 1])) --last;
    if (first == 0 && last == u.size()) return s;
    return utf32_to_utf8(u.substr(first, last - first));
}

/**
 * @brief Full Unicode lower-casing (root locale), e.g. "Ấn Độ" -> "ấn độ".
 */
inline std::string to_lower(const std::string& s) {
    std::string out;
    icu::UnicodeString::fromUTF8(s).toLower(icu::Locale::getRoot()).toUTF8String(out);
    return out;
}

/**
 * @brief Normalized form used for headword keys and translation fields.
 */
inline std::string trim_lower(const std::string& s) {
    return to_lower(trim(s));
}

/**
 * @brief True for codepoints that separate words: ASCII/Latin-1 punctuation,
 *        whitespace and the General Punctuation block.
 */
inline bool is_word_separator(char32_t cp) {
    if (is_space(cp)) return true;
    if (cp < 0x80) {
        return !((cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z') ||
                 (cp >= U'0' && cp <= U'9') || cp == U'\'' || cp == U'-');
    }
    if (cp >= 0xA1 && cp <= 0xBF) return true;
    if (cp == 0xD7 || cp == 0xF7) return true;
    return cp >= 0x2010 && cp <= 0x206F;
}

/**
 * @brief Lower-cased word tokens of a UTF-8 string.
 */
inline std::vector<std::u32string> words(const std::string& s) {
    std::vector<std::u32string> out;
    std::u32string current;
    for (char32_t cp : utf8_to_utf32(s)) {
        if (is_word_separator(cp)) {
            if (!current.empty()) out.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(to_lower(cp));
        }
    }
    if (!current.empty()) out.push_back(std::move(current));
    return out;
}

} // namespace Seed
