#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace collate {

enum class TokenClass {
    Equal,
    CaseDiff,
    DecimalDiff,
    Diff,
    Missing,
    Extra,
};

// css class / json name; Equal has none
std::string_view class_name(TokenClass cls);

struct Span
{
    std::string text;
    TokenClass cls;

    bool operator==(Span const&) const = default;
};

using Spans = std::vector<Span>;

struct TokenDiff
{
    Spans left;
    Spans right;
};

/*
 * Classify a single aligned token pair.
 */
TokenClass classify(std::string_view left, std::string_view right);

/*
 * Compare two token runs position by position.
 * Positions past the end of the shorter run become Missing or Extra
 * on the side that has them; nothing is emitted on the other side.
 */
TokenDiff diff_tokens(std::vector<std::string> const& left, std::vector<std::string> const& right);

/*
 * Tokenize both sentences and compare them.
 */
TokenDiff diff_sentences(std::string_view left, std::string_view right);

} // namespace collate
