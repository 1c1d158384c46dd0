#pragma once

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>
#include <unicode/utypes.h>
#include <string>

namespace cifra {
namespace unicode {

/**
 * Convert std::string (assumed UTF-8) to ICU UnicodeString
 */
inline icu::UnicodeString to_unicode_string(const std::string& utf8_str) {
    return icu::UnicodeString::fromUTF8(icu::StringPiece(utf8_str.c_str(), static_cast<int32_t>(utf8_str.length())));
}

/**
 * Convert ICU UnicodeString to std::string (UTF-8)
 */
inline std::string from_unicode_string(const icu::UnicodeString& ustr) {
    std::string result;
    ustr.toUTF8String(result);
    return result;
}

/**
 * Count Unicode characters (code points) in a UTF-8 string
 */
inline size_t char_count(const std::string& utf8_str) {
    if (utf8_str.empty()) {
        return 0;
    }
    return static_cast<size_t>(to_unicode_string(utf8_str).countChar32());
}

/**
 * Canonical decomposition (NFD) followed by removal of every nonspacing
 * combining mark: "veintitrés" -> "veintitres", "año" -> "ano".
 * Returns the input unchanged if ICU cannot provide the NFD instance.
 */
inline icu::UnicodeString strip_diacritics(const icu::UnicodeString& ustr) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfd = icu::Normalizer2::getNFDInstance(status);
    if (U_FAILURE(status) || nfd == nullptr) {
        return ustr;
    }
    icu::UnicodeString decomposed = nfd->normalize(ustr, status);
    if (U_FAILURE(status)) {
        return ustr;
    }
    icu::UnicodeString result;
    for (int32_t i = 0; i < decomposed.length();) {
        UChar32 c = decomposed.char32At(i);
        if (u_charType(c) != U_NON_SPACING_MARK) {
            result.append(c);
        }
        i += U16_LENGTH(c);
    }
    return result;
}

/**
 * Per-class code point counts of a UTF-8 string (whitespace excluded from
 * visible).
 */
struct CharClassCounts {
    size_t visible = 0;
    size_t digits = 0;
    size_t alphabetic = 0;
};

inline CharClassCounts classify_chars(const std::string& utf8_str) {
    CharClassCounts counts;
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    for (int32_t i = 0; i < ustr.length();) {
        UChar32 c = ustr.char32At(i);
        i += U16_LENGTH(c);
        if (u_isUWhiteSpace(c)) {
            continue;
        }
        ++counts.visible;
        if (u_isdigit(c)) {
            ++counts.digits;
        } else if (u_isUAlphabetic(c)) {
            ++counts.alphabetic;
        }
    }
    return counts;
}

/**
 * Trim Unicode whitespace from both ends
 */
inline std::string trim(const std::string& utf8_str) {
    if (utf8_str.empty()) {
        return utf8_str;
    }
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    int32_t start = 0;
    int32_t end = ustr.length();
    while (start < end && u_isUWhiteSpace(ustr.char32At(start))) {
        start += U16_LENGTH(ustr.char32At(start));
    }
    while (end > start) {
        int32_t prev = ustr.moveIndex32(end, -1);
        if (!u_isUWhiteSpace(ustr.char32At(prev))) {
            break;
        }
        end = prev;
    }
    return from_unicode_string(ustr.tempSubStringBetween(start, end));
}

}  // namespace unicode
}  // namespace cifra
