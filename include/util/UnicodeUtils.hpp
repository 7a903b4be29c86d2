#pragma once

#include <memory>
#include <string>
#include <unicode/normlzr.h>
#include <unicode/translit.h>
#include <unicode/unistr.h>

namespace coda::util {

/// Fold text for diacritic- and case-insensitive matching
/// (Björk → bjork, Sigur Rós → sigur ros)
inline std::string normalize_for_search(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);

    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::Transliterator> trans(
        icu::Transliterator::createInstance(
            "NFD; [:Nonspacing Mark:] Remove; NFC; Latin-ASCII",
            UTRANS_FORWARD,
            status
        )
    );

    if (U_SUCCESS(status) && trans) {
        trans->transliterate(unicode_text);
    }

    std::string result;
    unicode_text.foldCase().toUTF8String(result);
    return result;
}

/// Case-insensitive three-way comparison (ICU case folding, like strcasecmp)
inline int case_insensitive_compare(const std::string& a, const std::string& b) {
    icu::UnicodeString ua = icu::UnicodeString::fromUTF8(a);
    icu::UnicodeString ub = icu::UnicodeString::fromUTF8(b);
    ua.foldCase();
    ub.foldCase();
    return ua.compare(ub);
}

/// Strict weak ordering: case-insensitive first, raw bytes on a fold tie so
/// "abba" and "ABBA" still have a fixed relative order
inline bool case_insensitive_less(const std::string& a, const std::string& b) {
    int cmp = case_insensitive_compare(a, b);
    if (cmp != 0) return cmp < 0;
    return a < b;
}

/// Substring match after normalize_for_search on both sides
inline bool matches_search(const std::string& haystack, const std::string& normalized_query) {
    if (normalized_query.empty()) return true;
    return normalize_for_search(haystack).find(normalized_query) != std::string::npos;
}

}  // namespace coda::util
