#include <collate/number.hpp>
#include <collate/common.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <string>

namespace collate {

namespace {

bool is_digit(char c)
{
    return c >= '0' && c <= '9';
}

bool iequals(std::string_view a, std::string_view b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++ i) {
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) {
            return false;
        }
    }
    return true;
}

// Zero of every Unicode decimal digit block; each block runs zero to nine.
constexpr char32_t digit_zeros[] = {
    0x0030, 0x0660, 0x06F0, 0x07C0, 0x0966, 0x09E6, 0x0A66, 0x0AE6,
    0x0B66, 0x0BE6, 0x0C66, 0x0CE6, 0x0D66, 0x0DE6, 0x0E50, 0x0ED0,
    0x0F20, 0x1040, 0x1090, 0x17E0, 0x1810, 0x1946, 0x19D0, 0x1A80,
    0x1A90, 0x1B50, 0x1BB0, 0x1C40, 0x1C50, 0xA620, 0xA8D0, 0xA900,
    0xA9D0, 0xA9F0, 0xAA50, 0xABF0, 0xFF10, 0x104A0, 0x10D30, 0x11066,
    0x110F0, 0x11136, 0x111D0, 0x112F0, 0x11450, 0x114D0, 0x11650, 0x116C0,
    0x11730, 0x118E0, 0x11950, 0x11C50, 0x11D50, 0x11DA0, 0x16A60, 0x16AC0,
    0x16B50, 0x1D7CE, 0x1D7D8, 0x1D7E2, 0x1D7EC, 0x1D7F6, 0x1E140, 0x1E2F0,
    0x1E950, 0x1FBF0,
};

// Map decimal digits of any script to ASCII, leaving other code points.
std::string_view ascii_digits(std::string_view token, std::string & out)
{
    if (std::all_of(token.begin(), token.end(), [](char c) { return (unsigned char)c < 0x80; })) {
        return token;
    }
    out.clear();
    for (char32_t cp : decode_utf8(token)) {
        auto it = std::upper_bound(std::begin(digit_zeros), std::end(digit_zeros), cp);
        if (it != std::begin(digit_zeros) && cp - *(it - 1) < 10) {
            out.push_back((char)('0' + (cp - *(it - 1))));
        } else {
            encode_utf8(cp, out);
        }
    }
    return out;
}

// Checks the literal grammar and strips underscores.
// Returns false when the text is not a decimal literal.
bool canonical_literal(std::string_view text, std::string & out)
{
    out.clear();
    size_t i = 0;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
        if (text[i] == '-') {
            out.push_back('-');
        }
        ++ i;
    }

    auto digits = [&]() -> size_t {
        size_t count = 0;
        while (i < text.size()) {
            if (is_digit(text[i])) {
                out.push_back(text[i]);
                ++ count;
                ++ i;
            } else if (text[i] == '_' && count > 0 && i + 1 < text.size() && is_digit(text[i + 1])) {
                ++ i;
            } else {
                break;
            }
        }
        return count;
    };

    size_t mantissa = digits();
    if (i < text.size() && text[i] == '.') {
        out.push_back('.');
        ++ i;
        size_t fraction = digits();
        if (fraction == 0) {
            out.pop_back();
        }
        mantissa += fraction;
    }
    if (mantissa == 0) {
        return false;
    }
    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
        out.push_back('e');
        ++ i;
        if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
            out.push_back(text[i ++]);
        }
        if (digits() == 0) {
            return false;
        }
    }
    return i == text.size();
}

// Decide which way an out-of-range literal saturates.
double saturated(std::string_view literal)
{
    bool negative = literal[0] == '-';
    if (negative) {
        literal.remove_prefix(1);
    }
    size_t e = literal.find('e');
    std::string_view mantissa = literal.substr(0, e);

    long exponent = 0;
    if (e != std::string_view::npos) {
        std::string_view exp_text = literal.substr(e + 1);
        bool exp_negative = exp_text[0] == '-';
        if (exp_text[0] == '+' || exp_text[0] == '-') {
            exp_text.remove_prefix(1);
        }
        auto [ptr, ec] = std::from_chars(exp_text.data(), exp_text.data() + exp_text.size(), exponent);
        if (ec == std::errc::result_out_of_range) {
            exponent = std::numeric_limits<long>::max() / 2;
        }
        if (exp_negative) {
            exponent = -exponent;
        }
    }

    // decimal magnitude of the leading significant digit
    long int_digits = 0, first_nonzero = -1, index = 0;
    bool seen_point = false;
    for (char c : mantissa) {
        if (c == '.') {
            seen_point = true;
            continue;
        }
        if (!seen_point) {
            ++ int_digits;
        }
        if (c != '0' && first_nonzero < 0) {
            first_nonzero = index;
        }
        ++ index;
    }

    double value = 0.0;
    if (first_nonzero >= 0 && int_digits - first_nonzero + exponent > 0) {
        value = std::numeric_limits<double>::infinity();
    }
    return negative ? -value : value;
}

} // namespace

std::optional<double> normalize_number(std::string_view token)
{
    for (std::string_view special : {"inf", "infinity"}) {
        if (iequals(token, special)) {
            return std::numeric_limits<double>::infinity();
        }
    }
    if (iequals(token, "nan")) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    static thread_local std::string digits, literal;
    if (!canonical_literal(ascii_digits(token, digits), literal)) {
        return std::nullopt;
    }

    double value = 0;
    auto [ptr, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return saturated(literal);
    }
    if (ec != std::errc() || ptr != literal.data() + literal.size()) {
        return std::nullopt;
    }
    return value;
}

bool numerically_equal(std::string_view a, std::string_view b)
{
    auto num_a = normalize_number(a);
    auto num_b = normalize_number(b);
    return num_a && num_b && *num_a == *num_b;
}

} // namespace collate
