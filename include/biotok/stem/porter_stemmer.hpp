#pragma once

#include <biotok/stem/stemmer.hpp>

#include <string>

namespace biotok::stem {

/**
 * Porter (1980) suffix-stripping stemmer.
 *
 * Words shorter than three characters are returned unchanged. A word-initial
 * 'y' is classified as a consonant for the whole run; the measure predicates
 * take that as a flag instead of rewriting the character.
 */
class PorterStemmer : public Stemmer {
public:
    std::string stem(const std::string& word) const override;
    StemmerKind kind() const override { return StemmerKind::PORTER; }

    // Measure predicates over a stem. leading_y marks stem[0] == 'y' as a
    // consonant. Exposed for tests.
    static bool measure_gt0(const std::string& stem, bool leading_y);   // m > 0
    static bool measure_eq1(const std::string& stem, bool leading_y);   // m = 1
    static bool measure_gt1(const std::string& stem, bool leading_y);   // m > 1
    static bool contains_vowel(const std::string& stem, bool leading_y);
    static bool ends_cvc(const std::string& stem, bool leading_y);      // C v [^aeiouwxy]

private:
    static void step1a(std::string& w);
    static void step1b(std::string& w, bool leading_y);
    static void step1c(std::string& w, bool leading_y);
    static void step2(std::string& w, bool leading_y);
    static void step3(std::string& w, bool leading_y);
    static void step4(std::string& w, bool leading_y);
    static void step5(std::string& w, bool leading_y);
};

}  // namespace biotok::stem
