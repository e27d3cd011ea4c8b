#include <biotok/pipeline.hpp>

#include <biotok/text/break_points.hpp>
#include <biotok/text/case_fold.hpp>
#include <biotok/text/greek.hpp>
#include <biotok/text/line_cleaner.hpp>

namespace biotok {

Pipeline::Pipeline(TokenizerConfig config)
    : config_(config),
      stemmer_(stem::make_stemmer(config.stemmer)),
      recombiner_(config.break_points, config.mode, stemmer_.get()) {}

SubTokens Pipeline::sub_tokens(const std::string& raw_token) const {
    SubTokens subs = text::BreakPointExtractor::extract(raw_token, config_.break_points);
    text::fold_case(subs);
    if (config_.greek_normalize) {
        text::GreekNormalizer::normalize_all(subs);
    }
    return subs;
}

std::string Pipeline::normalize_token(const std::string& raw_token) const {
    return recombiner_.recombine(sub_tokens(raw_token));
}

std::vector<std::string> Pipeline::tokenize_line(const std::string& line) const {
    std::vector<std::string> tokens;
    for (const auto& raw : text::LineCleaner::raw_tokens(line)) {
        tokens.push_back(normalize_token(raw));
    }
    return tokens;
}

std::string Pipeline::process_line(const std::string& line) const {
    return render(tokenize_line(line));
}

std::string Pipeline::render(const std::vector<std::string>& tokens) {
    std::string out;
    for (const auto& token : tokens) {
        if (token.empty()) {
            continue;
        }
        if (!out.empty()) {
            out += ' ';
        }
        out += token;
    }
    return out;
}

}  // namespace biotok
