#pragma once

#include <initializer_list>
#include <span>
#include <string>
#include <string_view>

namespace collate {

using StringViewPair = std::pair<std::string_view, std::string_view>;
using StringPair = std::pair<std::string, std::string>;

// Helper function to create a literal span
template <typename T>
std::span<T> span(std::initializer_list<T> contiguous)
{
    return std::span((T*)contiguous.begin(), contiguous.size());
}

// Replace every occurrence of each needle with its replacement.
// The returned view is valid until the next call on the same thread.
std::string_view replaced(
    std::string_view haystack,
    std::span<StringViewPair const> replacements
);

// Unicode helpers; text is UTF-8 throughout
std::u32string decode_utf8(std::string_view text);
void encode_utf8(char32_t cp, std::string & out);

/*
 * Whitespace as matched by \s.
 */
bool is_space(char32_t cp);

/*
 * Word characters as matched by \w: letters, digits, underscore.
 */
bool is_word(char32_t cp);

/*
 * Simple lower-case mapping, one code point to one code point.
 * Code points that lower to several (U+0130) are returned unchanged.
 */
char32_t fold_case(char32_t cp);

std::string_view trim(std::string_view text);

}
