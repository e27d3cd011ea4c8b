#include <biotok/stem/porter_stemmer.hpp>

#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <vector>

namespace biotok::stem {

namespace {

// ============================================================================
// Consonant/vowel pattern matching
// ============================================================================

enum class CharClass : uint8_t {
    CONSONANT,    // [^aeiou]    may start a consonant sequence, 'y' included
    NON_VOWEL,    // [^aeiouy]   continues a consonant sequence
    VOWEL,        // [aeiouy]    may start a vowel sequence, 'y' included
    PURE_VOWEL,   // [aeiou]     continues a vowel sequence
    CVC_TAIL      // [^aeiouwxy] last letter of a short cvc stem
};

struct Atom {
    CharClass cls;
    bool repeat;  // zero or more instead of exactly one
};

using Pattern = std::vector<Atom>;

bool is_aeiou(char c) {
    return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u';
}

bool in_class(const std::string& s, size_t i, bool leading_y, CharClass cls) {
    // A flagged leading 'y' sits outside every vowel set
    const bool y_consonant = leading_y && i == 0;
    const char c = s[i];

    switch (cls) {
        case CharClass::CONSONANT:
            return y_consonant || !is_aeiou(c);
        case CharClass::NON_VOWEL:
            return y_consonant || (!is_aeiou(c) && c != 'y');
        case CharClass::VOWEL:
            return !y_consonant && (is_aeiou(c) || c == 'y');
        case CharClass::PURE_VOWEL:
            return !y_consonant && is_aeiou(c);
        case CharClass::CVC_TAIL:
            return y_consonant ||
                   (!is_aeiou(c) && c != 'w' && c != 'x' && c != 'y');
    }
    return false;
}

// Anchored at the start of s; greedy with backtracking on repeated atoms.
bool match_at(const Pattern& pattern, size_t pi, const std::string& s, size_t si,
              bool leading_y, bool to_end) {
    if (pi == pattern.size()) {
        return !to_end || si == s.size();
    }

    const Atom& atom = pattern[pi];
    if (!atom.repeat) {
        return si < s.size() && in_class(s, si, leading_y, atom.cls) &&
               match_at(pattern, pi + 1, s, si + 1, leading_y, to_end);
    }

    size_t run_end = si;
    while (run_end < s.size() && in_class(s, run_end, leading_y, atom.cls)) {
        ++run_end;
    }
    for (size_t end = run_end + 1; end-- > si;) {
        if (match_at(pattern, pi + 1, s, end, leading_y, to_end)) {
            return true;
        }
    }
    return false;
}

Pattern concat(std::initializer_list<Pattern> parts) {
    Pattern result;
    for (const auto& part : parts) {
        result.insert(result.end(), part.begin(), part.end());
    }
    return result;
}

const Pattern C = {{CharClass::CONSONANT, false}, {CharClass::NON_VOWEL, true}};
const Pattern V = {{CharClass::VOWEL, false}, {CharClass::PURE_VOWEL, true}};
const Pattern SINGLE_VOWEL = {{CharClass::VOWEL, false}};
const Pattern CVC_TAIL = {{CharClass::CVC_TAIL, false}};

// ^(C)? followed by rest
bool matches_after_optional_c(const Pattern& rest, const std::string& s,
                              bool leading_y, bool to_end) {
    return match_at(concat({C, rest}), 0, s, 0, leading_y, to_end) ||
           match_at(rest, 0, s, 0, leading_y, to_end);
}

// ============================================================================
// Suffix tables
// ============================================================================

struct SuffixRule {
    std::string_view suffix;
    std::string_view replacement;
};

const std::vector<SuffixRule> STEP2_RULES = {
    {"ational", "ate"}, {"tional", "tion"}, {"enci", "ence"}, {"anci", "ance"},
    {"izer", "ize"}, {"bli", "ble"}, {"alli", "al"}, {"entli", "ent"},
    {"eli", "e"}, {"ousli", "ous"}, {"ization", "ize"}, {"ation", "ate"},
    {"ator", "ate"}, {"alism", "al"}, {"iveness", "ive"}, {"fulness", "ful"},
    {"ousness", "ous"}, {"aliti", "al"}, {"iviti", "ive"}, {"biliti", "ble"},
    {"logi", "log"},
};

const std::vector<SuffixRule> STEP3_RULES = {
    {"icate", "ic"}, {"ative", ""}, {"alize", "al"}, {"iciti", "ic"},
    {"ical", "ic"}, {"ful", ""}, {"ness", ""},
};

const std::vector<SuffixRule> STEP4_RULES = {
    {"al", ""}, {"ance", ""}, {"ence", ""}, {"er", ""}, {"ic", ""},
    {"able", ""}, {"ible", ""}, {"ant", ""}, {"ement", ""}, {"ment", ""},
    {"ent", ""}, {"ou", ""}, {"ism", ""}, {"ate", ""}, {"iti", ""},
    {"ous", ""}, {"ive", ""}, {"ize", ""},
};

bool ends_with(const std::string& word, std::string_view suffix) {
    return word.size() >= suffix.size() &&
           word.compare(word.size() - suffix.size(), suffix.size(),
                        suffix.data(), suffix.size()) == 0;
}

// The listed suffix starting left-most in the word, i.e. the longest match
const SuffixRule* longest_suffix(const std::string& word,
                                 const std::vector<SuffixRule>& rules) {
    const SuffixRule* best = nullptr;
    for (const auto& rule : rules) {
        if (ends_with(word, rule.suffix) &&
            (!best || rule.suffix.size() > best->suffix.size())) {
            best = &rule;
        }
    }
    return best;
}

// Last character is 'y' and is not the flagged leading 'y'
bool ends_with_plain_y(const std::string& w, bool leading_y) {
    return !w.empty() && w.back() == 'y' && !(leading_y && w.size() == 1);
}

void replace_suffix(std::string& w, const SuffixRule& rule) {
    w.resize(w.size() - rule.suffix.size());
    w.append(rule.replacement.data(), rule.replacement.size());
}

}  // namespace

// ============================================================================
// Measure predicates
// ============================================================================

bool PorterStemmer::measure_gt0(const std::string& stem, bool leading_y) {
    static const Pattern rest = concat({V, C});
    return matches_after_optional_c(rest, stem, leading_y, false);
}

bool PorterStemmer::measure_eq1(const std::string& stem, bool leading_y) {
    static const Pattern vc = concat({V, C});
    static const Pattern vcv = concat({V, C, V});
    return matches_after_optional_c(vc, stem, leading_y, true) ||
           matches_after_optional_c(vcv, stem, leading_y, true);
}

bool PorterStemmer::measure_gt1(const std::string& stem, bool leading_y) {
    static const Pattern rest = concat({V, C, V, C});
    return matches_after_optional_c(rest, stem, leading_y, false);
}

bool PorterStemmer::contains_vowel(const std::string& stem, bool leading_y) {
    return matches_after_optional_c(SINGLE_VOWEL, stem, leading_y, false);
}

bool PorterStemmer::ends_cvc(const std::string& stem, bool leading_y) {
    static const Pattern cvc = concat({C, SINGLE_VOWEL, CVC_TAIL});
    return match_at(cvc, 0, stem, 0, leading_y, true);
}

// ============================================================================
// Steps
// ============================================================================

void PorterStemmer::step1a(std::string& w) {
    if (ends_with(w, "sses") || ends_with(w, "ies")) {
        w.resize(w.size() - 2);
    } else if (w.size() >= 2 && w.back() == 's' && w[w.size() - 2] != 's') {
        w.pop_back();
    }
}

void PorterStemmer::step1b(std::string& w, bool leading_y) {
    if (ends_with(w, "eed")) {
        if (measure_gt0(w.substr(0, w.size() - 3), leading_y)) {
            w.pop_back();
        }
        return;
    }

    size_t suffix_len = 0;
    if (ends_with(w, "ed")) {
        suffix_len = 2;
    } else if (ends_with(w, "ing")) {
        suffix_len = 3;
    } else {
        return;
    }

    std::string stem = w.substr(0, w.size() - suffix_len);
    if (!contains_vowel(stem, leading_y)) {
        return;
    }
    w = std::move(stem);

    if (ends_with(w, "at") || ends_with(w, "bl") || ends_with(w, "iz")) {
        w += 'e';
    } else if (w.size() >= 2 && w.back() == w[w.size() - 2] &&
               std::string_view("aeiouylsz").find(w.back()) == std::string_view::npos) {
        w.pop_back();
    } else if (ends_cvc(w, leading_y)) {
        w += 'e';
    }
}

void PorterStemmer::step1c(std::string& w, bool leading_y) {
    if (!ends_with_plain_y(w, leading_y)) {
        return;
    }
    std::string stem = w.substr(0, w.size() - 1);
    if (contains_vowel(stem, leading_y)) {
        w = stem + "i";
    }
}

void PorterStemmer::step2(std::string& w, bool leading_y) {
    const SuffixRule* rule = longest_suffix(w, STEP2_RULES);
    if (rule && measure_gt0(w.substr(0, w.size() - rule->suffix.size()), leading_y)) {
        replace_suffix(w, *rule);
    }
}

void PorterStemmer::step3(std::string& w, bool leading_y) {
    const SuffixRule* rule = longest_suffix(w, STEP3_RULES);
    if (rule && measure_gt0(w.substr(0, w.size() - rule->suffix.size()), leading_y)) {
        replace_suffix(w, *rule);
    }
}

void PorterStemmer::step4(std::string& w, bool leading_y) {
    if (const SuffixRule* rule = longest_suffix(w, STEP4_RULES)) {
        std::string stem = w.substr(0, w.size() - rule->suffix.size());
        if (measure_gt1(stem, leading_y)) {
            w = std::move(stem);
        }
        return;
    }

    // (s|t)ion: the s or t stays with the stem
    if (w.size() >= 4 && ends_with(w, "ion") &&
        (w[w.size() - 4] == 's' || w[w.size() - 4] == 't')) {
        std::string stem = w.substr(0, w.size() - 3);
        if (measure_gt1(stem, leading_y)) {
            w = std::move(stem);
        }
    }
}

void PorterStemmer::step5(std::string& w, bool leading_y) {
    if (!w.empty() && w.back() == 'e') {
        std::string stem = w.substr(0, w.size() - 1);
        if (measure_gt1(stem, leading_y) ||
            (measure_eq1(stem, leading_y) && !ends_cvc(stem, leading_y))) {
            w = std::move(stem);
        }
    }

    if (ends_with(w, "ll") && measure_gt1(w, leading_y)) {
        w.pop_back();
    }
}

std::string PorterStemmer::stem(const std::string& word) const {
    if (word.size() < 3) {
        return word;
    }

    const bool leading_y = word[0] == 'y';
    std::string w = word;

    step1a(w);
    step1b(w, leading_y);
    step1c(w, leading_y);
    step2(w, leading_y);
    step3(w, leading_y);
    step4(w, leading_y);
    step5(w, leading_y);

    return w;
}

}  // namespace biotok::stem
