#pragma once

#include <memory>
#include <string>
#include <unicode/unistr.h>
#include <unicode/translit.h>
#include <unicode/normalizer2.h>

namespace strata::util {

/// Normalize text for Unicode-aware case-insensitive matching.
/// Transliterates diacritics to ASCII equivalents (Björk -> bjork) and lowercases.
inline std::string normalize_for_search(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);

    // Transliterators are not thread-safe to share; one per thread, built lazily
    thread_local std::unique_ptr<icu::Transliterator> trans;
    thread_local bool trans_failed = false;
    if (!trans && !trans_failed) {
        UErrorCode status = U_ZERO_ERROR;
        trans.reset(icu::Transliterator::createInstance(
            "NFD; [:Nonspacing Mark:] Remove; NFC; Latin-ASCII",
            UTRANS_FORWARD,
            status
        ));
        if (U_FAILURE(status)) {
            trans.reset();
            trans_failed = true;
        }
    }

    if (trans) {
        trans->transliterate(unicode_text);
    }

    std::string result;
    unicode_text.foldCase().toUTF8String(result);
    return result;
}

/// Canonical composition (NFC), so that decomposed paths written by other
/// tools compare equal to the paths read from the file system.
inline std::string to_nfc(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status) || !nfc) {
        return text;
    }

    icu::UnicodeString normalized = nfc->normalize(icu::UnicodeString::fromUTF8(text), status);
    if (U_FAILURE(status)) {
        return text;
    }

    std::string result;
    normalized.toUTF8String(result);
    return result;
}

}  // namespace strata::util
