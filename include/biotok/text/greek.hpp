#pragma once

#include <biotok/types.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace biotok::text {

/**
 * Rewrites spelled-out Greek letter names to short codes ("alpha" -> "a").
 *
 * Each maximal run of lowercase ASCII letters is looked up as a whole, so
 * "alpha2" becomes "a2" while "alphabeta" is left alone. Other characters
 * are copied through. Expects lowercased input.
 */
class GreekNormalizer {
public:
    static std::string normalize(const std::string& sub_token);

    static void normalize_all(SubTokens& sub_tokens);

    // Code for a complete letter name, e.g. "theta" -> "th"
    static std::optional<std::string_view> lookup(std::string_view name);

    static size_t lexicon_size();
};

}  // namespace biotok::text
