#include <biotok/stem/s_stemmer.hpp>

#include <string_view>

namespace biotok::stem {

namespace {

bool ends_with(const std::string& word, std::string_view suffix) {
    return word.size() >= suffix.size() &&
           word.compare(word.size() - suffix.size(), suffix.size(),
                        suffix.data(), suffix.size()) == 0;
}

// Character just before a suffix of length n, or '\0' if there is none
char char_before(const std::string& word, size_t n) {
    return word.size() > n ? word[word.size() - n - 1] : '\0';
}

}  // namespace

std::string SStemmer::stem(const std::string& word) const {
    if (ends_with(word, "ies")) {
        if (word.size() == 3) {
            return "y";
        }
        const char before = char_before(word, 3);
        if (before != 'a' && before != 'e') {
            return word.substr(0, word.size() - 3) + "y";
        }
        return word;
    }

    if (ends_with(word, "es")) {
        if (word.size() == 2) {
            return "e";
        }
        const char before = char_before(word, 2);
        if (before != 'a' && before != 'e' && before != 'o') {
            return word.substr(0, word.size() - 1);
        }
        return word;
    }

    if (word.size() >= 2 && word.back() == 's') {
        const char before = char_before(word, 1);
        if (before != 'u' && before != 's') {
            return word.substr(0, word.size() - 1);
        }
    }

    return word;
}

}  // namespace biotok::stem
