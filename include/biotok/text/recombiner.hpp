#pragma once

#include <biotok/stem/stemmer.hpp>
#include <biotok/types.hpp>

#include <string>

namespace biotok::text {

/**
 * Joins normalized sub-tokens into the emitted token and applies the
 * stemmer where the break-point policy and recombination mode call for it:
 *
 *   policy  mode     per-sub-token stem  join        whole-token stem
 *   NONE    any      no                  first only  yes
 *   other   HYPHEN   no                  "-"         yes
 *   other   SPACE    yes                 " "         no
 *   other   CONCAT   no                  ""          yes
 *
 * A null stemmer means no stemming at all.
 */
class Recombiner {
public:
    Recombiner(BreakPointPolicy policy, RecombineMode mode,
               const stem::Stemmer* stemmer);

    std::string recombine(SubTokens sub_tokens) const;

    bool stems_sub_tokens() const;
    bool stems_whole_token() const;

    // Separator placed between sub-tokens; unused under BreakPointPolicy::NONE
    const char* separator() const;

private:
    std::string apply_stemmer(const std::string& word) const;

    BreakPointPolicy policy_;
    RecombineMode mode_;
    const stem::Stemmer* stemmer_;  // not owned
};

}  // namespace biotok::text
