#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace collate {

/*
 * Split a sentence into word-like tokens and single punctuation tokens.
 *
 * A word-like token is a run of word characters and periods that starts
 * and ends with a word character, so "3.14" and "e.g" stay whole.
 * Every other non-space code point is a token on its own.
 * Whitespace only separates.
 */
std::vector<std::string> tokenize(std::string_view sentence);

} // namespace collate
