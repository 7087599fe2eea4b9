#ifndef COMMON_TEXT_UTF8_H
#define COMMON_TEXT_UTF8_H

#include <cstddef>
#include <optional>
#include <string_view>

namespace wordcount::text {

/**
 * @brief Decodes the code point starting at s[pos].
 *
 * Only well-formed sequences are accepted: overlong forms, surrogates, values
 * above U+10FFFF, stray continuation bytes and truncated sequences are all
 * rejected.
 *
 * @param s Text to decode from
 * @param pos Byte position of the sequence. Advanced past it on success, left
 * untouched on failure.
 * @return The code point, or std::nullopt if the bytes at pos are not valid UTF-8.
 */
std::optional<char32_t> DecodeUtf8(std::string_view s, size_t& pos);

/**
 * @brief Returns the byte offset of the first invalid sequence in s, or
 * std::string_view::npos if s is entirely valid UTF-8.
 */
size_t FindInvalidUtf8(std::string_view s);

/**
 * @brief Whether cp belongs to the Unicode word class (what \w matches):
 * alphabetic, marks, decimal digits, connector punctuation and join controls.
 */
bool IsWordCharacter(char32_t cp);

}  // namespace wordcount::text

#endif
