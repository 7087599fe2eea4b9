#include "text/Utf8.h"

#include <cstddef>
#include <optional>
#include <string_view>
#include <unicode/uchar.h>
#include <unicode/umachine.h>

namespace wordcount::text {

std::optional<char32_t> DecodeUtf8(std::string_view s, size_t& pos) {
    if (pos >= s.size()) {
        return std::nullopt;
    }

    auto lead = static_cast<unsigned char>(s[pos]);
    if (lead < 0x80) {
        ++pos;
        return static_cast<char32_t>(lead);
    }

    // Allowed range of the second byte, which is narrower than 80..BF after
    // E0, ED, F0 and F4 (rules out overlongs, surrogates and > U+10FFFF)
    unsigned char low = 0x80;
    unsigned char high = 0xBF;
    size_t length;
    char32_t codePoint;

    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
        codePoint = lead & 0x1F;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        codePoint = lead & 0x0F;
        if (lead == 0xE0) {
            low = 0xA0;
        } else if (lead == 0xED) {
            high = 0x9F;
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        codePoint = lead & 0x07;
        if (lead == 0xF0) {
            low = 0x90;
        } else if (lead == 0xF4) {
            high = 0x8F;
        }
    } else {
        // Continuation byte, C0, C1 or F5..FF
        return std::nullopt;
    }

    if (s.size() - pos < length) {
        return std::nullopt;
    }

    for (size_t i = 1; i < length; ++i) {
        auto c = static_cast<unsigned char>(s[pos + i]);
        if (c < low || c > high) {
            return std::nullopt;
        }
        low = 0x80;
        high = 0xBF;
        codePoint = (codePoint << 6) | (c & 0x3F);
    }

    pos += length;
    return codePoint;
}

size_t FindInvalidUtf8(std::string_view s) {
    size_t pos = 0;
    while (pos < s.size()) {
        // ASCII runs are the common case
        if (static_cast<unsigned char>(s[pos]) < 0x80) {
            ++pos;
            continue;
        }
        if (!DecodeUtf8(s, pos)) {
            return pos;
        }
    }
    return std::string_view::npos;
}

bool IsWordCharacter(char32_t cp) {
    if (cp < 0x80) {
        return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z') || (cp >= '0' && cp <= '9') || cp == '_';
    }

    auto c = static_cast<UChar32>(cp);
    if (u_hasBinaryProperty(c, UCHAR_ALPHABETIC) || u_hasBinaryProperty(c, UCHAR_JOIN_CONTROL)) {
        return true;
    }

    switch (u_charType(c)) {
    case U_NON_SPACING_MARK:
    case U_ENCLOSING_MARK:
    case U_COMBINING_SPACING_MARK:
    case U_DECIMAL_DIGIT_NUMBER:
    case U_CONNECTOR_PUNCTUATION:
        return true;
    default:
        return false;
    }
}

}  // namespace wordcount::text
