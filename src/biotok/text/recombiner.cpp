#include <biotok/text/recombiner.hpp>

namespace biotok::text {

Recombiner::Recombiner(BreakPointPolicy policy, RecombineMode mode,
                       const stem::Stemmer* stemmer)
    : policy_(policy), mode_(mode), stemmer_(stemmer) {}

bool Recombiner::stems_sub_tokens() const {
    return stemmer_ != nullptr && policy_ != BreakPointPolicy::NONE &&
           mode_ == RecombineMode::SPACE;
}

bool Recombiner::stems_whole_token() const {
    return stemmer_ != nullptr &&
           (policy_ == BreakPointPolicy::NONE || mode_ != RecombineMode::SPACE);
}

const char* Recombiner::separator() const {
    switch (mode_) {
        case RecombineMode::HYPHEN: return "-";
        case RecombineMode::SPACE: return " ";
        case RecombineMode::CONCAT: return "";
    }
    return "";
}

std::string Recombiner::apply_stemmer(const std::string& word) const {
    return stemmer_ ? stemmer_->stem(word) : word;
}

std::string Recombiner::recombine(SubTokens sub_tokens) const {
    std::string token;

    if (policy_ == BreakPointPolicy::NONE) {
        if (!sub_tokens.empty()) {
            token = std::move(sub_tokens.front());
        }
    } else {
        if (stems_sub_tokens()) {
            for (auto& sub : sub_tokens) {
                sub = apply_stemmer(sub);
            }
        }

        const char* sep = separator();
        for (size_t i = 0; i < sub_tokens.size(); ++i) {
            if (i > 0) {
                token += sep;
            }
            token += sub_tokens[i];
        }
    }

    if (stems_whole_token()) {
        token = apply_stemmer(token);
    }
    return token;
}

}  // namespace biotok::text
