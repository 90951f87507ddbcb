#pragma once

#include <collate/token_diff.hpp>

#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace collate {

class InvalidConfiguration : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

constexpr double DEFAULT_THRESHOLD = 0.3;

/*
 * One row of a comparison: an aligned sentence pair, a source sentence
 * with no counterpart (left only, unmatched_left set), or a rendered
 * sentence with no counterpart (right only).
 */
struct Row
{
    Spans left;
    Spans right;
    bool unmatched_left;
};

using Alignment = std::vector<Row>;

/*
 * Greedily pair each left sentence, in order, with the most similar
 * right sentence not yet taken. A pair is accepted when its similarity
 * is at least threshold. Rows for left sentences come first in left
 * order, followed by the leftover right sentences in right order.
 *
 * Throws InvalidConfiguration if threshold is not within [0, 1].
 * Safe to call concurrently.
 */
Alignment align(
    std::span<std::string const> left,
    std::span<std::string const> right,
    double threshold = DEFAULT_THRESHOLD
);

/*
 * Throws InvalidConfiguration unless 0 <= threshold <= 1.
 */
void check_threshold(double threshold);

} // namespace collate
