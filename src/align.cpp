#include <collate/align.hpp>
#include <collate/similarity.hpp>

#include <sstream>

namespace collate {

void check_threshold(double threshold)
{
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        std::stringstream ss;
        ss << "match threshold must be within [0, 1], got " << threshold;
        throw InvalidConfiguration(ss.str());
    }
}

Alignment align(
    std::span<std::string const> left,
    std::span<std::string const> right,
    double threshold
)
{
    check_threshold(threshold);

    Alignment rows;
    rows.reserve(left.size() + right.size());
    std::vector<bool> consumed(right.size(), false);

    for (auto & sentence : left) {
        double best_score = 0;
        size_t best_index = right.size();
        for (size_t i = 0; i < right.size(); ++ i) {
            if (consumed[i]) {
                continue;
            }
            double score = similarity(sentence, right[i]);
            if (score > best_score) {
                best_score = score;
                best_index = i;
            }
        }

        if (best_index != right.size() && best_score >= threshold) {
            consumed[best_index] = true;
            TokenDiff diff = diff_sentences(sentence, right[best_index]);
            rows.push_back({std::move(diff.left), std::move(diff.right), false});
        } else {
            rows.push_back({{{sentence, TokenClass::Missing}}, {}, true});
        }
    }

    for (size_t i = 0; i < right.size(); ++ i) {
        if (!consumed[i]) {
            rows.push_back({{}, {{right[i], TokenClass::Extra}}, false});
        }
    }

    return rows;
}

} // namespace collate
