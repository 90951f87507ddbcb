#pragma once

#include <optional>
#include <string_view>

namespace collate {

/*
 * Interpret a token as a decimal floating-point literal.
 *
 * Accepts digits of any script with an optional fraction and exponent, underscores
 * between digits, and inf/infinity/nan in any case. Out-of-range
 * literals saturate to infinity or zero. Anything else has no value.
 */
std::optional<double> normalize_number(std::string_view token);

/*
 * True only when both tokens have a value and the values compare equal.
 */
bool numerically_equal(std::string_view a, std::string_view b);

} // namespace collate
