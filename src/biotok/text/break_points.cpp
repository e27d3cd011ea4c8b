#include <biotok/text/break_points.hpp>

#include <string_view>

namespace biotok::text {

namespace {

// ASCII only; <cctype> classification would follow the C locale
bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
bool is_lower(char c) { return c >= 'a' && c <= 'z'; }
bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_alnum(char c) { return is_upper(c) || is_lower(c) || is_digit(c); }

template<typename Pred>
size_t run_length(const std::string& s, size_t pos, Pred pred) {
    size_t end = pos;
    while (end < s.size() && pred(s[end])) {
        ++end;
    }
    return end - pos;
}

// Maximal runs of characters satisfying pred
template<typename Pred>
std::vector<Span> runs(const std::string& token, Pred pred) {
    std::vector<Span> spans;
    size_t pos = 0;
    while (pos < token.size()) {
        size_t len = run_length(token, pos, pred);
        if (len > 0) {
            spans.push_back({pos, len});
            pos += len;
        } else {
            ++pos;
        }
    }
    return spans;
}

}  // namespace

bool BreakPointExtractor::is_delimiter(char c) {
    static constexpr std::string_view DELIMITERS = "()[]-_/";
    return DELIMITERS.find(c) != std::string_view::npos;
}

std::vector<Span> BreakPointExtractor::delimiter_spans(const std::string& token) {
    return runs(token, [](char c) { return !is_delimiter(c); });
}

std::vector<Span> BreakPointExtractor::alnum_spans(const std::string& token) {
    return runs(token, is_alnum);
}

size_t BreakPointExtractor::word_class_match(const std::string& token, size_t pos) {
    const char c = token[pos];

    if (is_upper(c)) {
        // Capitalized word before a run of capitals
        size_t lower = run_length(token, pos + 1, is_lower);
        if (lower > 0) {
            return 1 + lower;
        }
        return run_length(token, pos, is_upper);
    }
    if (is_lower(c)) {
        return run_length(token, pos, is_lower);
    }
    if (is_digit(c)) {
        return run_length(token, pos, is_digit);
    }
    return 0;
}

std::vector<Span> BreakPointExtractor::word_class_spans(const std::string& token) {
    std::vector<Span> spans;
    size_t pos = 0;

    while (pos < token.size()) {
        size_t len = word_class_match(token, pos);
        if (len == 0) {
            ++pos;  // dropped, not a boundary
            continue;
        }
        spans.push_back({pos, len});
        pos += len;
    }

    return spans;
}

std::vector<Span> BreakPointExtractor::extract_spans(const std::string& token,
                                                     BreakPointPolicy policy) {
    switch (policy) {
        case BreakPointPolicy::NONE:
            if (token.empty()) {
                return {};
            }
            return {Span{0, token.size()}};
        case BreakPointPolicy::DELIMITER:
            return delimiter_spans(token);
        case BreakPointPolicy::ALNUM:
            return alnum_spans(token);
        case BreakPointPolicy::WORD_CLASS:
            return word_class_spans(token);
    }
    return {};
}

SubTokens BreakPointExtractor::extract(const std::string& token, BreakPointPolicy policy) {
    SubTokens sub_tokens;
    for (const auto& span : extract_spans(token, policy)) {
        sub_tokens.push_back(token.substr(span.offset, span.length));
    }
    return sub_tokens;
}

}  // namespace biotok::text
