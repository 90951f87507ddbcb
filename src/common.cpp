#include <collate/common.hpp>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <vector>

namespace {
struct SubstringFinder
{

    void reset(std::string_view haystack)
    {
        this->haystack = haystack;
        needles.clear();
        off_needle_pairs.clear();
    }

    void add_needle(std::string_view needle)
    {
        size_t i = needles.size();
        needles.emplace_back(needle);
        off_needle_pairs.emplace_back(needle.empty() ? std::string_view::npos : haystack.find(needle), i);
    }

    void begin()
    {
        std::sort(off_needle_pairs.begin(), off_needle_pairs.end());
    }

    bool has_more()
    {
        return !off_needle_pairs.empty() && off_needle_pairs.front().first != std::string_view::npos;
    }

    std::pair<size_t, size_t> find_next()
    {
        auto updated = off_needle_pairs.front();
        auto result = updated;
        auto & [off, idx] = updated;
        auto & needle = needles[idx];
        off += needle.size();
        off = haystack.find(needle, off);
        auto sort = std::lower_bound(off_needle_pairs.begin(), off_needle_pairs.end(), updated);
        if (sort > off_needle_pairs.begin()) {
            std::copy(off_needle_pairs.begin()+1, sort, off_needle_pairs.begin());
            -- sort;
        }
        *sort = updated;
        return result;
    }

    std::string_view haystack;
    std::vector<std::string_view> needles;
    std::vector<std::pair<size_t, size_t>> off_needle_pairs;
};

SubstringFinder & substring_finder() {
    static thread_local SubstringFinder substring_finder;
    return substring_finder;
}

// decode one code point starting at text[off], advancing off
char32_t next_code_point(std::string_view text, size_t & off)
{
    unsigned char lead = (unsigned char)text[off];
    size_t len;
    char32_t cp;
    if (lead < 0x80) {
        ++ off;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        len = 2; cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3; cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4; cp = lead & 0x07;
    } else {
        ++ off;
        return 0xFFFD;
    }
    if (off + len > text.size()) {
        ++ off;
        return 0xFFFD;
    }
    for (size_t i = 1; i < len; ++ i) {
        unsigned char cont = (unsigned char)text[off + i];
        if ((cont & 0xC0) != 0x80) {
            ++ off;
            return 0xFFFD;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    static constexpr char32_t min_for_len[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < min_for_len[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        ++ off;
        return 0xFFFD;
    }
    off += len;
    return cp;
}
}

namespace collate {

std::string_view replaced(
    std::string_view haystack,
    std::span<StringViewPair const> replacements
)
{
    static thread_local std::string replaced;

    substring_finder().reset(haystack);
    for (auto [needle, repl] : replacements) {
        substring_finder().add_needle(needle);
    }
    substring_finder().begin();

    replaced.clear();
    size_t off_old = 0;
    while (substring_finder().has_more()) {
        auto [ off, idx ] = substring_finder().find_next();
        if (off < off_old) {
            // overlaps a needle that was already replaced
            continue;
        }
        auto & [ needle, repl ] = replacements[idx];
        replaced.append(haystack.substr(off_old, off - off_old));
        replaced.append(repl);
        off_old = off + needle.size();
    }
    replaced.append(haystack.substr(off_old));

    return replaced;
}

std::u32string decode_utf8(std::string_view text)
{
    std::u32string result;
    result.reserve(text.size());
    for (size_t off = 0; off < text.size();) {
        result.push_back(next_code_point(text, off));
    }
    return result;
}

void encode_utf8(char32_t cp, std::string & out)
{
    if (cp < 0x80) {
        out.push_back((char)cp);
    } else if (cp < 0x800) {
        out.push_back((char)(0xC0 | (cp >> 6)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back((char)(0xE0 | (cp >> 12)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        out.push_back((char)(0xF0 | (cp >> 18)));
        out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
}

bool is_space(char32_t cp)
{
    return (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x20)
        || cp == 0x85 || cp == 0xA0 || cp == 0x1680
        || (cp >= 0x2000 && cp <= 0x200A)
        || cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F
        || cp == 0x3000;
}

bool is_word(char32_t cp)
{
    if (cp < 0x80) {
        return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z')
            || (cp >= '0' && cp <= '9') || cp == '_';
    }
    if (cp < 0xC0) {
        // latin-1 punctuation and symbols, except the letter-like ones
        switch (cp) {
        case 0xAA: case 0xB2: case 0xB3: case 0xB5:
        case 0xB9: case 0xBA: case 0xBC: case 0xBD: case 0xBE:
            return true;
        default:
            return false;
        }
    }
    static constexpr std::pair<char32_t, char32_t> non_word[] = {
        {0xD7, 0xD7}, {0xF7, 0xF7},
        {0x300, 0x36F},     // combining diacritics
        {0x1680, 0x1680},
        {0x2000, 0x206F},   // general punctuation
        {0x20A0, 0x20CF},   // currency
        {0x2190, 0x245F},   // arrows, maths, technical
        {0x2500, 0x2BFF},   // box drawing, shapes, symbols, dingbats
        {0x2E00, 0x2E7F},
        {0x3000, 0x3004}, {0x3008, 0x303F},
        {0xFE30, 0xFE6F},
        {0xFF00, 0xFF0F}, {0xFF1A, 0xFF20}, {0xFF3B, 0xFF40}, {0xFF5B, 0xFF65},
        {0xFFF0, 0xFFFF},
        {0x1F000, 0x1FAFF}, // emoji and pictographs
    };
    for (auto [lo, hi] : non_word) {
        if (cp < lo) {
            break;
        }
        if (cp <= hi) {
            return false;
        }
    }
    return true;
}

char32_t fold_case(char32_t cp)
{
    if (cp < 0x80) {
        return (cp >= 'A' && cp <= 'Z') ? cp + 0x20 : cp;
    }
    // {first, last, delta, step}: every step-th code point in
    // [first, last] lowers to cp + delta
    struct Run
    {
        char32_t first;
        char32_t last;
        int32_t delta;
        uint32_t step;
    };
    static constexpr Run runs[] = {
        {0x0041, 0x005A, 32, 1}, {0x00C0, 0x00D6, 32, 1}, {0x00D8, 0x00DE, 32, 1},
        {0x0100, 0x012E, 1, 2}, {0x0132, 0x0136, 1, 2}, {0x0139, 0x0147, 1, 2},
        {0x014A, 0x0176, 1, 2}, {0x0178, 0x0178, -121, 1}, {0x0179, 0x017D, 1, 2},
        {0x0181, 0x0181, 210, 1}, {0x0182, 0x0184, 1, 2}, {0x0186, 0x0186, 206, 1},
        {0x0187, 0x0187, 1, 1}, {0x0189, 0x018A, 205, 1}, {0x018B, 0x018B, 1, 1},
        {0x018E, 0x018E, 79, 1}, {0x018F, 0x018F, 202, 1}, {0x0190, 0x0190, 203, 1},
        {0x0191, 0x0191, 1, 1}, {0x0193, 0x0193, 205, 1}, {0x0194, 0x0194, 207, 1},
        {0x0196, 0x0196, 211, 1}, {0x0197, 0x0197, 209, 1}, {0x0198, 0x0198, 1, 1},
        {0x019C, 0x019C, 211, 1}, {0x019D, 0x019D, 213, 1}, {0x019F, 0x019F, 214, 1},
        {0x01A0, 0x01A4, 1, 2}, {0x01A6, 0x01A6, 218, 1}, {0x01A7, 0x01A7, 1, 1},
        {0x01A9, 0x01A9, 218, 1}, {0x01AC, 0x01AC, 1, 1}, {0x01AE, 0x01AE, 218, 1},
        {0x01AF, 0x01AF, 1, 1}, {0x01B1, 0x01B2, 217, 1}, {0x01B3, 0x01B5, 1, 2},
        {0x01B7, 0x01B7, 219, 1}, {0x01B8, 0x01B8, 1, 1}, {0x01BC, 0x01BC, 1, 1},
        {0x01C4, 0x01C4, 2, 1}, {0x01C5, 0x01C5, 1, 1}, {0x01C7, 0x01C7, 2, 1},
        {0x01C8, 0x01C8, 1, 1}, {0x01CA, 0x01CA, 2, 1}, {0x01CB, 0x01DB, 1, 2},
        {0x01DE, 0x01EE, 1, 2}, {0x01F1, 0x01F1, 2, 1}, {0x01F2, 0x01F4, 1, 2},
        {0x01F6, 0x01F6, -97, 1}, {0x01F7, 0x01F7, -56, 1}, {0x01F8, 0x021E, 1, 2},
        {0x0220, 0x0220, -130, 1}, {0x0222, 0x0232, 1, 2}, {0x023A, 0x023A, 10795, 1},
        {0x023B, 0x023B, 1, 1}, {0x023D, 0x023D, -163, 1}, {0x023E, 0x023E, 10792, 1},
        {0x0241, 0x0241, 1, 1}, {0x0243, 0x0243, -195, 1}, {0x0244, 0x0244, 69, 1},
        {0x0245, 0x0245, 71, 1}, {0x0246, 0x024E, 1, 2}, {0x0370, 0x0372, 1, 2},
        {0x0376, 0x0376, 1, 1}, {0x037F, 0x037F, 116, 1}, {0x0386, 0x0386, 38, 1},
        {0x0388, 0x038A, 37, 1}, {0x038C, 0x038C, 64, 1}, {0x038E, 0x038F, 63, 1},
        {0x0391, 0x03A1, 32, 1}, {0x03A3, 0x03AB, 32, 1}, {0x03CF, 0x03CF, 8, 1},
        {0x03D8, 0x03EE, 1, 2}, {0x03F4, 0x03F4, -60, 1}, {0x03F7, 0x03F7, 1, 1},
        {0x03F9, 0x03F9, -7, 1}, {0x03FA, 0x03FA, 1, 1}, {0x03FD, 0x03FF, -130, 1},
        {0x0400, 0x040F, 80, 1}, {0x0410, 0x042F, 32, 1}, {0x0460, 0x0480, 1, 2},
        {0x048A, 0x04BE, 1, 2}, {0x04C0, 0x04C0, 15, 1}, {0x04C1, 0x04CD, 1, 2},
        {0x04D0, 0x052E, 1, 2}, {0x0531, 0x0556, 48, 1}, {0x10A0, 0x10C5, 7264, 1},
        {0x10C7, 0x10C7, 7264, 1}, {0x10CD, 0x10CD, 7264, 1}, {0x13A0, 0x13EF, 38864, 1},
        {0x13F0, 0x13F5, 8, 1}, {0x1C90, 0x1CBA, -3008, 1}, {0x1CBD, 0x1CBF, -3008, 1},
        {0x1E00, 0x1E94, 1, 2}, {0x1E9E, 0x1E9E, -7615, 1}, {0x1EA0, 0x1EFE, 1, 2},
        {0x1F08, 0x1F0F, -8, 1}, {0x1F18, 0x1F1D, -8, 1}, {0x1F28, 0x1F2F, -8, 1},
        {0x1F38, 0x1F3F, -8, 1}, {0x1F48, 0x1F4D, -8, 1}, {0x1F59, 0x1F5F, -8, 2},
        {0x1F68, 0x1F6F, -8, 1}, {0x1F88, 0x1F8F, -8, 1}, {0x1F98, 0x1F9F, -8, 1},
        {0x1FA8, 0x1FAF, -8, 1}, {0x1FB8, 0x1FB9, -8, 1}, {0x1FBA, 0x1FBB, -74, 1},
        {0x1FBC, 0x1FBC, -9, 1}, {0x1FC8, 0x1FCB, -86, 1}, {0x1FCC, 0x1FCC, -9, 1},
        {0x1FD8, 0x1FD9, -8, 1}, {0x1FDA, 0x1FDB, -100, 1}, {0x1FE8, 0x1FE9, -8, 1},
        {0x1FEA, 0x1FEB, -112, 1}, {0x1FEC, 0x1FEC, -7, 1}, {0x1FF8, 0x1FF9, -128, 1},
        {0x1FFA, 0x1FFB, -126, 1}, {0x1FFC, 0x1FFC, -9, 1}, {0x2126, 0x2126, -7517, 1},
        {0x212A, 0x212A, -8383, 1}, {0x212B, 0x212B, -8262, 1}, {0x2132, 0x2132, 28, 1},
        {0x2160, 0x216F, 16, 1}, {0x2183, 0x2183, 1, 1}, {0x24B6, 0x24CF, 26, 1},
        {0x2C00, 0x2C2F, 48, 1}, {0x2C60, 0x2C60, 1, 1}, {0x2C62, 0x2C62, -10743, 1},
        {0x2C63, 0x2C63, -3814, 1}, {0x2C64, 0x2C64, -10727, 1}, {0x2C67, 0x2C6B, 1, 2},
        {0x2C6D, 0x2C6D, -10780, 1}, {0x2C6E, 0x2C6E, -10749, 1}, {0x2C6F, 0x2C6F, -10783, 1},
        {0x2C70, 0x2C70, -10782, 1}, {0x2C72, 0x2C72, 1, 1}, {0x2C75, 0x2C75, 1, 1},
        {0x2C7E, 0x2C7F, -10815, 1}, {0x2C80, 0x2CE2, 1, 2}, {0x2CEB, 0x2CED, 1, 2},
        {0x2CF2, 0x2CF2, 1, 1}, {0xA640, 0xA66C, 1, 2}, {0xA680, 0xA69A, 1, 2},
        {0xA722, 0xA72E, 1, 2}, {0xA732, 0xA76E, 1, 2}, {0xA779, 0xA77B, 1, 2},
        {0xA77D, 0xA77D, -35332, 1}, {0xA77E, 0xA786, 1, 2}, {0xA78B, 0xA78B, 1, 1},
        {0xA78D, 0xA78D, -42280, 1}, {0xA790, 0xA792, 1, 2}, {0xA796, 0xA7A8, 1, 2},
        {0xA7AA, 0xA7AA, -42308, 1}, {0xA7AB, 0xA7AB, -42319, 1}, {0xA7AC, 0xA7AC, -42315, 1},
        {0xA7AD, 0xA7AD, -42305, 1}, {0xA7AE, 0xA7AE, -42308, 1}, {0xA7B0, 0xA7B0, -42258, 1},
        {0xA7B1, 0xA7B1, -42282, 1}, {0xA7B2, 0xA7B2, -42261, 1}, {0xA7B3, 0xA7B3, 928, 1},
        {0xA7B4, 0xA7C2, 1, 2}, {0xA7C4, 0xA7C4, -48, 1}, {0xA7C5, 0xA7C5, -42307, 1},
        {0xA7C6, 0xA7C6, -35384, 1}, {0xA7C7, 0xA7C9, 1, 2}, {0xA7D0, 0xA7D0, 1, 1},
        {0xA7D6, 0xA7D8, 1, 2}, {0xA7F5, 0xA7F5, 1, 1}, {0xFF21, 0xFF3A, 32, 1},
        {0x10400, 0x10427, 40, 1}, {0x104B0, 0x104D3, 40, 1}, {0x10570, 0x1057A, 39, 1},
        {0x1057C, 0x1058A, 39, 1}, {0x1058C, 0x10592, 39, 1}, {0x10594, 0x10595, 39, 1},
        {0x10C80, 0x10CB2, 64, 1}, {0x118A0, 0x118BF, 32, 1}, {0x16E40, 0x16E5F, 32, 1},
        {0x1E900, 0x1E921, 34, 1},
    };
    auto it = std::upper_bound(std::begin(runs), std::end(runs), cp, [](char32_t c, Run const& run) {
        return c < run.first;
    });
    if (it == std::begin(runs)) {
        return cp;
    }
    -- it;
    if (cp > it->last || (cp - it->first) % it->step != 0) {
        return cp;
    }
    return (char32_t)((int32_t)cp + it->delta);
}

std::string_view trim(std::string_view str)
{
    size_t start = 0;
    while (start < str.size()) {
        size_t next = start;
        if (!is_space(next_code_point(str, next))) {
            break;
        }
        start = next;
    }
    size_t end = str.size();
    while (end > start) {
        // back up to the lead byte of the last code point
        size_t lead = end - 1;
        while (lead > start && ((unsigned char)str[lead] & 0xC0) == 0x80) {
            -- lead;
        }
        size_t next = lead;
        char32_t cp = next_code_point(str, next);
        if (next != end || !is_space(cp)) {
            break;
        }
        end = lead;
    }
    return str.substr(start, end - start);
}

} // namespace collate
