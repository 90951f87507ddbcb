#include <collate/tokenize.hpp>
#include <collate/common.hpp>

namespace collate {

std::vector<std::string> tokenize(std::string_view sentence)
{
    std::u32string cps = decode_utf8(sentence);
    std::vector<std::string> tokens;

    size_t i = 0;
    while (i < cps.size()) {
        char32_t cp = cps[i];
        if (is_word(cp)) {
            size_t end = i + 1;
            size_t last_word = i;
            while (end < cps.size() && (is_word(cps[end]) || cps[end] == '.')) {
                if (cps[end] != '.') {
                    last_word = end;
                }
                ++ end;
            }
            // trailing periods are punctuation, not part of the word
            end = last_word + 1;
            std::string token;
            for (size_t j = i; j < end; ++ j) {
                encode_utf8(cps[j], token);
            }
            tokens.emplace_back(std::move(token));
            i = end;
        } else if (is_space(cp)) {
            ++ i;
        } else {
            std::string token;
            encode_utf8(cp, token);
            tokens.emplace_back(std::move(token));
            ++ i;
        }
    }

    return tokens;
}

} // namespace collate
