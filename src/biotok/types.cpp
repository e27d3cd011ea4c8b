#include <biotok/types.hpp>

namespace biotok {

TokenizerConfig TokenizerConfig::for_query_type(QueryType type) {
    TokenizerConfig config;
    switch (type) {
        case QueryType::SYMBOLIC:
            config.break_points = BreakPointPolicy::DELIMITER;
            config.mode = RecombineMode::CONCAT;
            config.greek_normalize = true;
            config.stemmer = StemmerKind::NONE;
            break;
        case QueryType::VERBOSE:
            config.break_points = BreakPointPolicy::DELIMITER;
            config.mode = RecombineMode::SPACE;
            config.greek_normalize = false;
            config.stemmer = StemmerKind::PORTER;
            break;
    }
    return config;
}

const char* break_point_name(BreakPointPolicy policy) {
    switch (policy) {
        case BreakPointPolicy::NONE: return "none";
        case BreakPointPolicy::DELIMITER: return "delimiter";
        case BreakPointPolicy::ALNUM: return "alnum";
        case BreakPointPolicy::WORD_CLASS: return "word-class";
    }
    return "unknown";
}

const char* recombine_mode_name(RecombineMode mode) {
    switch (mode) {
        case RecombineMode::HYPHEN: return "hyphen";
        case RecombineMode::SPACE: return "space";
        case RecombineMode::CONCAT: return "join";
    }
    return "unknown";
}

const char* stemmer_name(StemmerKind kind) {
    switch (kind) {
        case StemmerKind::NONE: return "none";
        case StemmerKind::PORTER: return "porter";
        case StemmerKind::LOVINS: return "lovins";
        case StemmerKind::S_STEMMER: return "s-stemmer";
    }
    return "unknown";
}

const char* query_type_name(QueryType type) {
    switch (type) {
        case QueryType::SYMBOLIC: return "symbolic";
        case QueryType::VERBOSE: return "verbose";
    }
    return "unknown";
}

std::string describe(const TokenizerConfig& config) {
    std::string out = "break_points=";
    out += break_point_name(config.break_points);
    out += " mode=";
    out += recombine_mode_name(config.mode);
    out += " greek=";
    out += config.greek_normalize ? "on" : "off";
    out += " stemmer=";
    out += stemmer_name(config.stemmer);
    return out;
}

}  // namespace biotok
