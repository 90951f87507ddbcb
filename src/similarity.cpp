#include <collate/similarity.hpp>
#include <collate/common.hpp>

#include <algorithm>
#include <tuple>
#include <unordered_map>

namespace collate {

namespace {

constexpr size_t AUTOJUNK_MIN_SIZE = 200;

struct BlockMatcher
{
    BlockMatcher(std::u32string_view a, std::u32string_view b)
    : a(a), b(b)
    {
        for (size_t j = 0; j < b.size(); ++ j) {
            b2j[b[j]].push_back(j);
        }
        if (b.size() >= AUTOJUNK_MIN_SIZE) {
            size_t ntest = b.size() / 100 + 1;
            for (auto it = b2j.begin(); it != b2j.end();) {
                if (it->second.size() > ntest) {
                    it = b2j.erase(it);
                } else {
                    ++ it;
                }
            }
        }
    }

    MatchingBlock longest(size_t alo, size_t ahi, size_t blo, size_t bhi)
    {
        size_t besti = alo, bestj = blo, bestsize = 0;

        // j2len[j] is the length of the match ending at a[i-1], b[j]
        std::unordered_map<size_t, size_t> j2len, newj2len;
        for (size_t i = alo; i < ahi; ++ i) {
            newj2len.clear();
            auto found = b2j.find(a[i]);
            if (found != b2j.end()) {
                for (size_t j : found->second) {
                    if (j < blo) {
                        continue;
                    }
                    if (j >= bhi) {
                        break;
                    }
                    size_t k = 1;
                    if (j > 0) {
                        auto prev = j2len.find(j - 1);
                        if (prev != j2len.end()) {
                            k += prev->second;
                        }
                    }
                    newj2len[j] = k;
                    if (k > bestsize) {
                        besti = i + 1 - k;
                        bestj = j + 1 - k;
                        bestsize = k;
                    }
                }
            }
            std::swap(j2len, newj2len);
        }

        // popular elements never seed a match but may extend one
        while (besti > alo && bestj > blo && a[besti - 1] == b[bestj - 1]) {
            -- besti;
            -- bestj;
            ++ bestsize;
        }
        while (besti + bestsize < ahi && bestj + bestsize < bhi && a[besti + bestsize] == b[bestj + bestsize]) {
            ++ bestsize;
        }

        return {besti, bestj, bestsize};
    }

    std::vector<MatchingBlock> blocks()
    {
        std::vector<MatchingBlock> result;
        std::vector<std::tuple<size_t, size_t, size_t, size_t>> queue;
        queue.emplace_back(0, a.size(), 0, b.size());
        while (!queue.empty()) {
            auto [alo, ahi, blo, bhi] = queue.back();
            queue.pop_back();
            MatchingBlock block = longest(alo, ahi, blo, bhi);
            if (block.size) {
                result.push_back(block);
                if (alo < block.a && blo < block.b) {
                    queue.emplace_back(alo, block.a, blo, block.b);
                }
                if (block.a + block.size < ahi && block.b + block.size < bhi) {
                    queue.emplace_back(block.a + block.size, ahi, block.b + block.size, bhi);
                }
            }
        }
        std::sort(result.begin(), result.end(), [](MatchingBlock const& x, MatchingBlock const& y) {
            return std::tie(x.a, x.b, x.size) < std::tie(y.a, y.b, y.size);
        });
        return result;
    }

    std::u32string_view a;
    std::u32string_view b;
    std::unordered_map<char32_t, std::vector<size_t>> b2j;
};

} // namespace

std::vector<MatchingBlock> matching_blocks(std::u32string_view a, std::u32string_view b)
{
    return BlockMatcher(a, b).blocks();
}

double similarity(std::string_view a, std::string_view b)
{
    std::u32string cps_a = decode_utf8(a), cps_b = decode_utf8(b);
    size_t total = cps_a.size() + cps_b.size();
    if (total == 0) {
        return 1.0;
    }
    size_t matches = 0;
    for (auto & block : matching_blocks(cps_a, cps_b)) {
        matches += block.size;
    }
    return 2.0 * (double)matches / (double)total;
}

} // namespace collate
