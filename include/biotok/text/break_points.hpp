#pragma once

#include <biotok/types.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace biotok::text {

// Position of one sub-token inside its raw token
struct Span {
    size_t offset = 0;
    size_t length = 0;

    bool operator==(const Span& other) const {
        return offset == other.offset && length == other.length;
    }
};

/**
 * Splits a raw token into sub-tokens.
 *
 * Characters outside the returned spans are dropped. Under DELIMITER they
 * are exactly the delimiter characters ( ) [ ] - _ /; under ALNUM and
 * WORD_CLASS they are whatever no sub-token class matched.
 */
class BreakPointExtractor {
public:
    static SubTokens extract(const std::string& token, BreakPointPolicy policy);

    static std::vector<Span> extract_spans(const std::string& token,
                                           BreakPointPolicy policy);

    static bool is_delimiter(char c);

private:
    static std::vector<Span> delimiter_spans(const std::string& token);
    static std::vector<Span> alnum_spans(const std::string& token);
    static std::vector<Span> word_class_spans(const std::string& token);

    // Length of the WORD_CLASS sub-token starting at pos, or 0 if none does
    static size_t word_class_match(const std::string& token, size_t pos);
};

}  // namespace biotok::text
