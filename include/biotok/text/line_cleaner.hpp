#pragma once

#include <string>
#include <vector>

namespace biotok::text {

/**
 * Character-level cleanup of one content line before it is split into raw
 * tokens.
 *
 * Rules, applied in order to the line padded with one space on each side:
 * 1. delete ! " # $ % & * < = > ? @ \ | ~
 * 2. delete . : ; , when followed by a space
 * 3. unwrap " (X) " and " [X] " (two passes, for one level of nesting)
 * 4. delete an apostrophe standing alone between spaces, and a backtick
 *    followed by a space
 * 5. delete a 's or 't fragment followed by a space
 * 6. rule 2 again
 * 7. collapse a run of '/' followed by a space into a space
 */
class LineCleaner {
public:
    // Returns the padded, cleaned line (not yet trimmed)
    static std::string clean(const std::string& line);

    // Trim and split on whitespace runs
    static std::vector<std::string> split(const std::string& cleaned);

    // clean() followed by split()
    static std::vector<std::string> raw_tokens(const std::string& line);
};

}  // namespace biotok::text
