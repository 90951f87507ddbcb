#include <collate/token_diff.hpp>
#include <collate/common.hpp>
#include <collate/number.hpp>
#include <collate/tokenize.hpp>

#include <algorithm>

namespace collate {

std::string_view class_name(TokenClass cls)
{
    switch (cls) {
    case TokenClass::Equal: return "";
    case TokenClass::CaseDiff: return "case-diff";
    case TokenClass::DecimalDiff: return "decimal-diff";
    case TokenClass::Diff: return "diff";
    case TokenClass::Missing: return "missing";
    case TokenClass::Extra: return "extra";
    }
    return "diff";
}

static bool equal_folded(std::string_view a, std::string_view b)
{
    std::u32string cps_a = decode_utf8(a), cps_b = decode_utf8(b);
    return std::equal(
        cps_a.begin(), cps_a.end(), cps_b.begin(), cps_b.end(),
        [](char32_t x, char32_t y) { return fold_case(x) == fold_case(y); }
    );
}

TokenClass classify(std::string_view left, std::string_view right)
{
    if (left == right) {
        return TokenClass::Equal;
    }
    if (equal_folded(left, right)) {
        return TokenClass::CaseDiff;
    }
    if (numerically_equal(left, right)) {
        return TokenClass::DecimalDiff;
    }
    return TokenClass::Diff;
}

TokenDiff diff_tokens(std::vector<std::string> const& left, std::vector<std::string> const& right)
{
    TokenDiff result;
    size_t count = std::max(left.size(), right.size());
    result.left.reserve(left.size());
    result.right.reserve(right.size());

    for (size_t i = 0; i < count; ++ i) {
        if (i >= left.size()) {
            result.right.push_back({right[i], TokenClass::Extra});
        } else if (i >= right.size()) {
            result.left.push_back({left[i], TokenClass::Missing});
        } else {
            TokenClass cls = classify(left[i], right[i]);
            result.left.push_back({left[i], cls});
            result.right.push_back({right[i], cls});
        }
    }

    return result;
}

TokenDiff diff_sentences(std::string_view left, std::string_view right)
{
    return diff_tokens(tokenize(left), tokenize(right));
}

} // namespace collate
