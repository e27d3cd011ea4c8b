#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace biotok {

// Sub-units of one raw whitespace-delimited token, in source order
using SubTokens = std::vector<std::string>;

/**
 * Which characters split a raw token into sub-tokens.
 */
enum class BreakPointPolicy : uint8_t {
    NONE = 0,        // Token is kept whole
    DELIMITER = 1,   // Split on ( ) [ ] - _ /
    ALNUM = 2,       // Keep ASCII letter/digit runs, drop everything else
    WORD_CLASS = 3   // Capitalized word, capitals, lowercase and digit runs
};

/**
 * How sub-tokens are joined back into the emitted token.
 */
enum class RecombineMode : uint8_t {
    HYPHEN,   // "a-b", then the whole token is stemmed
    SPACE,    // "a b", each sub-token stemmed separately
    CONCAT    // "ab", then the whole token is stemmed ("j" on the command line)
};

enum class StemmerKind : uint8_t {
    NONE,
    PORTER,
    LOVINS,
    S_STEMMER
};

enum class QueryType : uint8_t {
    SYMBOLIC,   // Gene/protein symbols only
    VERBOSE     // Full names mixed with ordinary English
};

/**
 * Normalization strategy for one run. A default-constructed config is the
 * default policy: delimiter break points, space recombination, no Greek
 * normalization, Porter stemming.
 */
struct TokenizerConfig {
    BreakPointPolicy break_points = BreakPointPolicy::DELIMITER;
    RecombineMode mode = RecombineMode::SPACE;
    bool greek_normalize = false;
    StemmerKind stemmer = StemmerKind::PORTER;

    static TokenizerConfig for_query_type(QueryType type);

    bool operator==(const TokenizerConfig& other) const {
        return break_points == other.break_points && mode == other.mode &&
               greek_normalize == other.greek_normalize &&
               stemmer == other.stemmer;
    }
    bool operator!=(const TokenizerConfig& other) const {
        return !(*this == other);
    }
};

const char* break_point_name(BreakPointPolicy policy);
const char* recombine_mode_name(RecombineMode mode);
const char* stemmer_name(StemmerKind kind);
const char* query_type_name(QueryType type);

// One-line summary, e.g. "break_points=delimiter mode=space greek=off stemmer=porter"
std::string describe(const TokenizerConfig& config);

}  // namespace biotok
