#pragma once

#include <biotok/stem/stemmer.hpp>

#include <string>

namespace biotok::stem {

/**
 * Harman's S stemmer: reduces English plurals only.
 *
 * The ending selects exactly one rule ("ies", else "es", else "s"); if that
 * rule's context does not hold the word is returned unchanged.
 */
class SStemmer : public Stemmer {
public:
    std::string stem(const std::string& word) const override;
    StemmerKind kind() const override { return StemmerKind::S_STEMMER; }
};

}  // namespace biotok::stem
