#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace collate {

struct MatchingBlock
{
    size_t a;
    size_t b;
    size_t size;

    bool operator==(MatchingBlock const&) const = default;
};

/*
 * Longest-common-block decomposition of two code point sequences.
 *
 * The longest matching block is found first, then the regions on
 * either side of it are decomposed the same way. Blocks are returned
 * in increasing order of position. When b has 200 or more elements,
 * elements occurring in more than 1% of it do not seed matches but
 * may still extend them.
 */
std::vector<MatchingBlock> matching_blocks(std::u32string_view a, std::u32string_view b);

/*
 * 2*M / (|a| + |b|), where M is the number of code points covered by
 * matching_blocks(). Two empty strings are identical (1.0).
 */
double similarity(std::string_view a, std::string_view b);

} // namespace collate
