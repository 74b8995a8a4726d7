#pragma once

#include <string>
#include <unicode/unistr.h>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>

namespace tankobon::util {

/// Trim Unicode whitespace (including U+3000 ideographic space) from both ends
inline std::string trim_unicode(const std::string& text) {
    icu::UnicodeString u = icu::UnicodeString::fromUTF8(text);

    int32_t start = 0;
    int32_t end = u.length();
    while (start < end) {
        UChar32 c = u.char32At(start);
        if (!u_isUWhiteSpace(c)) break;
        start += U16_LENGTH(c);
    }
    while (end > start) {
        UChar32 c = u.char32At(end - 1);
        if (!u_isUWhiteSpace(c)) break;
        end -= U16_LENGTH(c);
    }

    std::string result;
    u.tempSubStringBetween(start, end).toUTF8String(result);
    return result;
}

/// Turn a display name into a single safe path component.
/// NFC-normalizes (so the same title always maps to the same directory),
/// replaces separators, reserved characters and controls with '_',
/// and trims surrounding whitespace and dots.
inline std::string sanitize_path_component(const std::string& name) {
    icu::UnicodeString u = icu::UnicodeString::fromUTF8(name);

    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
    if (U_SUCCESS(status) && nfc) {
        icu::UnicodeString normalized = nfc->normalize(u, status);
        if (U_SUCCESS(status)) {
            u = normalized;
        }
    }

    icu::UnicodeString cleaned;
    for (int32_t i = 0; i < u.length();) {
        UChar32 c = u.char32At(i);
        i += U16_LENGTH(c);

        bool reserved = c == '/' || c == '\\' || c == ':' || c == '*' || c == '?' ||
                        c == '"' || c == '<' || c == '>' || c == '|';
        if (reserved || u_iscntrl(c)) {
            cleaned.append(static_cast<UChar32>('_'));
        } else {
            cleaned.append(c);
        }
    }

    std::string result;
    cleaned.toUTF8String(result);
    result = trim_unicode(result);

    while (!result.empty() && (result.back() == '.' || result.back() == ' ')) {
        result.pop_back();
    }
    while (!result.empty() && result.front() == '.') {
        result.erase(result.begin());
    }

    return result.empty() ? "_" : result;
}

} // namespace tankobon::util
