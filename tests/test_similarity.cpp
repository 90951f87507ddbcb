#define BOOST_TEST_MODULE SimilarityTest
#include <boost/test/unit_test.hpp>

#include <collate/similarity.hpp>

#include <string>

using namespace collate;

namespace tt = boost::test_tools;

BOOST_AUTO_TEST_CASE(identical_and_empty)
{
    BOOST_TEST(similarity("The cat sat.", "The cat sat.") == 1.0);
    BOOST_TEST(similarity("", "") == 1.0);
    BOOST_TEST(similarity("a", "") == 0.0);
    BOOST_TEST(similarity("", "a") == 0.0);
    BOOST_TEST(similarity("xyz", "qqq") == 0.0);
}

BOOST_AUTO_TEST_CASE(ratio_of_matching_characters)
{
    BOOST_TEST(similarity("abcd", "bcde") == 0.75, tt::tolerance(1e-12));
    BOOST_TEST(similarity("abc", "abd") == 2.0 / 3.0, tt::tolerance(1e-12));
    BOOST_TEST(similarity("Revenue was 3.0 million.", "Revenue was 3.00 million.") == 48.0 / 49.0, tt::tolerance(1e-12));
    BOOST_TEST(similarity("Hello World", "hello world") == 18.0 / 22.0, tt::tolerance(1e-12));
    BOOST_TEST(similarity("Closing remarks here.", "An unexpected banner.") == 1.0 / 3.0, tt::tolerance(1e-12));
}

BOOST_AUTO_TEST_CASE(argument_order_matters)
{
    BOOST_TEST(similarity("Totally unrelated sentence one.", "Completely different text two.") == 26.0 / 61.0, tt::tolerance(1e-12));
    BOOST_TEST(similarity("Completely different text two.", "Totally unrelated sentence one.") == 24.0 / 61.0, tt::tolerance(1e-12));
}

BOOST_AUTO_TEST_CASE(blocks_left_to_right)
{
    std::u32string a = U"abxcd", b = U"abcd";
    auto blocks = matching_blocks(a, b);
    BOOST_REQUIRE_EQUAL(blocks.size(), 2u);
    BOOST_TEST((blocks[0] == MatchingBlock{0, 0, 2}));
    BOOST_TEST((blocks[1] == MatchingBlock{3, 2, 2}));
}

BOOST_AUTO_TEST_CASE(longest_block_first)
{
    // the longer "bcd" wins over the earlier "a"
    std::u32string a = U"abcd", b = U"xbcda";
    auto blocks = matching_blocks(a, b);
    BOOST_REQUIRE_EQUAL(blocks.size(), 1u);
    BOOST_TEST((blocks[0] == MatchingBlock{1, 1, 3}));
}

BOOST_AUTO_TEST_CASE(popular_characters_in_long_right_side)
{
    // 'a' fills more than 1% of a 200 character right side and cannot seed a match
    std::string a = "aaaa";
    std::string b = "c" + std::string(199, 'a');
    BOOST_TEST(similarity(a, b) == 0.0);
    // below 200 characters every character counts
    BOOST_TEST(similarity(b, a) == 8.0 / 204.0, tt::tolerance(1e-12));
    std::string short_b = "c" + std::string(198, 'a');
    BOOST_TEST(similarity(a, short_b) == 8.0 / 203.0, tt::tolerance(1e-12));
}

BOOST_AUTO_TEST_CASE(code_points_not_bytes)
{
    // each of these is one code point but two bytes
    BOOST_TEST(similarity("é", "è") == 0.0);
    BOOST_TEST(similarity("café", "cafe") == 0.75, tt::tolerance(1e-12));
}
