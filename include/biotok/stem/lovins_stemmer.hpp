#pragma once

#include <biotok/stem/stemmer.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace biotok::stem {

/**
 * Lovins (1968) longest-match stemmer.
 *
 * Phase 1 removes the longest ending from the ending table whose condition
 * holds for the remaining stem. Endings are at most 11 characters and at
 * least two characters of stem are always kept. Phase 2 respells the stem
 * according to its final character.
 */
class LovinsStemmer : public Stemmer {
public:
    // Context conditions attached to table endings
    enum class Condition : uint8_t {
        A, B, C, D, E, F, G, H, I, J, K, L, M, N, O, P, Q, R, S, T, U, V, W,
        X, Y, Z, AA, BB, CC
    };

    static constexpr size_t MAX_ENDING_LENGTH = 11;
    static constexpr size_t MIN_STEM_LENGTH = 2;

    std::string stem(const std::string& word) const override;
    StemmerKind kind() const override { return StemmerKind::LOVINS; }

    /**
     * Look up an ending in the ending table.
     *
     * @param ending Candidate suffix
     * @return Its condition, or nullopt if the ending is not listed
     */
    static std::optional<Condition> find_ending(std::string_view ending);

    // Whether the stem left after removing an ending satisfies a condition
    static bool condition_holds(Condition condition, std::string_view stem);

    // Phase 2 only
    static std::string respell(std::string stem);

    static size_t ending_count();
};

}  // namespace biotok::stem
