#include <biotok/text/greek.hpp>

#include <unordered_map>

namespace biotok::text {

namespace {

const std::unordered_map<std::string_view, std::string_view> GREEK_LETTERS = {
    {"alpha", "a"},   {"beta", "b"},    {"gamma", "g"},   {"delta", "d"},
    {"epsilon", "e"}, {"zeta", "z"},    {"eta", "e"},     {"theta", "th"},
    {"iota", "i"},    {"kappa", "k"},   {"lambda", "l"},  {"mu", "m"},
    {"nu", "n"},      {"xi", "x"},      {"omicron", "o"}, {"pi", "p"},
    {"rho", "r"},     {"sigma", "s"},   {"tau", "t"},     {"upsilon", "u"},
    {"phi", "ph"},    {"chi", "ch"},    {"psi", "ps"},    {"omega", "o"},
};

bool is_lower(char c) { return c >= 'a' && c <= 'z'; }

}  // namespace

std::optional<std::string_view> GreekNormalizer::lookup(std::string_view name) {
    auto it = GREEK_LETTERS.find(name);
    if (it == GREEK_LETTERS.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t GreekNormalizer::lexicon_size() {
    return GREEK_LETTERS.size();
}

std::string GreekNormalizer::normalize(const std::string& sub_token) {
    std::string result;
    result.reserve(sub_token.size());

    size_t pos = 0;
    while (pos < sub_token.size()) {
        if (!is_lower(sub_token[pos])) {
            result += sub_token[pos++];
            continue;
        }

        size_t end = pos;
        while (end < sub_token.size() && is_lower(sub_token[end])) {
            ++end;
        }

        std::string_view run(sub_token.data() + pos, end - pos);
        if (auto code = lookup(run)) {
            result.append(code->data(), code->size());
        } else {
            result.append(run.data(), run.size());
        }
        pos = end;
    }

    return result;
}

void GreekNormalizer::normalize_all(SubTokens& sub_tokens) {
    for (auto& sub : sub_tokens) {
        sub = normalize(sub);
    }
}

}  // namespace biotok::text
