#define BOOST_TEST_MODULE TokenDiffTest
#include <boost/test/unit_test.hpp>

#include <collate/token_diff.hpp>

#include <algorithm>
#include <ostream>

using namespace collate;

namespace collate {
std::ostream & operator<<(std::ostream & out, Span const& span)
{
    std::string_view name = class_name(span.cls);
    return out << '{' << span.text << ", " << (name.empty() ? "equal" : name) << '}';
}
}

static void check_spans(Spans const& actual, Spans const& expected)
{
    BOOST_CHECK_EQUAL_COLLECTIONS(actual.begin(), actual.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(classify_pairs)
{
    BOOST_TEST((classify("cat", "cat") == TokenClass::Equal));
    BOOST_TEST((classify("Cat", "cat") == TokenClass::CaseDiff));
    BOOST_TEST((classify("ÉTÉ", "été") == TokenClass::CaseDiff));
    BOOST_TEST((classify("ПРИВЕТ", "привет") == TokenClass::CaseDiff));
    BOOST_TEST((classify("3.0", "3.00") == TokenClass::DecimalDiff));
    BOOST_TEST((classify("5", "5.0") == TokenClass::DecimalDiff));
    BOOST_TEST((classify("3.0", "3.1") == TokenClass::Diff));
    BOOST_TEST((classify("cat", "dog") == TokenClass::Diff));
    BOOST_TEST((classify(".", "!") == TokenClass::Diff));
}

BOOST_AUTO_TEST_CASE(case_is_checked_before_numbers)
{
    // both fold to "1e5", so the difference is reported as case
    BOOST_TEST((classify("1E5", "1e5") == TokenClass::CaseDiff));
    BOOST_TEST((classify("INF", "infinity") == TokenClass::DecimalDiff));
}

BOOST_AUTO_TEST_CASE(nan_is_never_numerically_equal)
{
    BOOST_TEST((classify("nan", "NaN") == TokenClass::CaseDiff));
    BOOST_TEST((classify("nan", "nan") == TokenClass::Equal));
}

BOOST_AUTO_TEST_CASE(case_folding_beyond_european_blocks)
{
    BOOST_TEST((classify("ＡＢＣ", "ａｂｃ") == TokenClass::CaseDiff));
    BOOST_TEST((classify("ǅ", "ǆ") == TokenClass::CaseDiff));
    BOOST_TEST((classify("Ǆ", "ǅ") == TokenClass::CaseDiff));
    BOOST_TEST((classify("Ա", "ա") == TokenClass::CaseDiff));
    BOOST_TEST((classify("Ⴀ", "ⴀ") == TokenClass::CaseDiff));
    BOOST_TEST((classify("Ḁ", "ḁ") == TokenClass::CaseDiff));
    BOOST_TEST((classify("ẞ", "ß") == TokenClass::CaseDiff));
    BOOST_TEST((classify("Ω", "ω") == TokenClass::CaseDiff));
    // lower case of U+0130 is two code points
    BOOST_TEST((classify("İ", "i") == TokenClass::Diff));
    BOOST_TEST((classify("ǅ", "Ա") == TokenClass::Diff));
}

BOOST_AUTO_TEST_CASE(non_ascii_digits_compare_as_numbers)
{
    BOOST_TEST((classify("３.０", "3.0") == TokenClass::DecimalDiff));
    BOOST_TEST((classify("٣", "3.00") == TokenClass::DecimalDiff));
    BOOST_TEST((classify("३.५", "3.6") == TokenClass::Diff));
}

BOOST_AUTO_TEST_CASE(equal_length_runs)
{
    TokenDiff diff = diff_sentences("Revenue was 3.0 million.", "Revenue was 3.00 million.");
    check_spans(diff.left, {
        {"Revenue", TokenClass::Equal},
        {"was", TokenClass::Equal},
        {"3.0", TokenClass::DecimalDiff},
        {"million", TokenClass::Equal},
        {".", TokenClass::Equal},
    });
    check_spans(diff.right, {
        {"Revenue", TokenClass::Equal},
        {"was", TokenClass::Equal},
        {"3.00", TokenClass::DecimalDiff},
        {"million", TokenClass::Equal},
        {".", TokenClass::Equal},
    });
}

BOOST_AUTO_TEST_CASE(left_longer_marks_missing)
{
    TokenDiff diff = diff_sentences("one two three", "one two");
    check_spans(diff.left, {
        {"one", TokenClass::Equal},
        {"two", TokenClass::Equal},
        {"three", TokenClass::Missing},
    });
    check_spans(diff.right, {
        {"one", TokenClass::Equal},
        {"two", TokenClass::Equal},
    });
}

BOOST_AUTO_TEST_CASE(right_longer_marks_extra)
{
    TokenDiff diff = diff_sentences("one two", "one two three four");
    BOOST_TEST(diff.left.size() == 2u);
    check_spans(diff.right, {
        {"one", TokenClass::Equal},
        {"two", TokenClass::Equal},
        {"three", TokenClass::Extra},
        {"four", TokenClass::Extra},
    });
}

BOOST_AUTO_TEST_CASE(alignment_is_positional)
{
    // an inserted word shifts every later position
    TokenDiff diff = diff_sentences("a b c", "a x b c");
    check_spans(diff.left, {
        {"a", TokenClass::Equal},
        {"b", TokenClass::Diff},
        {"c", TokenClass::Diff},
    });
    check_spans(diff.right, {
        {"a", TokenClass::Equal},
        {"x", TokenClass::Diff},
        {"b", TokenClass::Diff},
        {"c", TokenClass::Extra},
    });
}

BOOST_AUTO_TEST_CASE(every_position_has_one_class)
{
    TokenDiff diff = diff_sentences("Sales rose 5 percent in Q3, said Bob.", "sales rose 5.0 percent in q3 said Bob!");
    size_t paired = std::min(diff.left.size(), diff.right.size());
    for (size_t i = 0; i < paired; ++ i) {
        BOOST_TEST((diff.left[i].cls == diff.right[i].cls));
        BOOST_TEST((diff.left[i].cls != TokenClass::Missing && diff.left[i].cls != TokenClass::Extra));
    }
    for (size_t i = paired; i < diff.left.size(); ++ i) {
        BOOST_TEST((diff.left[i].cls == TokenClass::Missing));
    }
    for (size_t i = paired; i < diff.right.size(); ++ i) {
        BOOST_TEST((diff.right[i].cls == TokenClass::Extra));
    }
}

BOOST_AUTO_TEST_CASE(empty_sentences)
{
    TokenDiff diff = diff_sentences("", "");
    BOOST_TEST(diff.left.empty());
    BOOST_TEST(diff.right.empty());
}
