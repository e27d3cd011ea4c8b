#pragma once

#include <biotok/stem/stemmer.hpp>
#include <biotok/text/recombiner.hpp>
#include <biotok/types.hpp>

#include <string>
#include <vector>

namespace biotok {

/**
 * Pipeline - per-line token normalization.
 *
 * content line -> cleanup -> whitespace split -> for each raw token:
 * break-point split -> lowercase -> Greek normalization -> recombine/stem.
 *
 * Holds no mutable state after construction; const methods may be called
 * concurrently.
 */
class Pipeline {
public:
    explicit Pipeline(TokenizerConfig config = {});

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    /**
     * Normalize one raw (already cleaned and split) token.
     *
     * @param raw_token A whitespace-free token
     * @return The emitted text; may contain spaces under SPACE recombination
     *         and may be empty when no sub-token survives
     */
    std::string normalize_token(const std::string& raw_token) const;

    // Sub-tokens after splitting, lowercasing and Greek normalization
    SubTokens sub_tokens(const std::string& raw_token) const;

    // Emitted tokens of one content line, in order, including empty ones
    std::vector<std::string> tokenize_line(const std::string& line) const;

    // Non-empty emitted tokens joined by single spaces, no newline
    std::string process_line(const std::string& line) const;

    static std::string render(const std::vector<std::string>& tokens);

    const TokenizerConfig& config() const { return config_; }

    // nullptr when no stemmer is configured
    const stem::Stemmer* stemmer() const { return stemmer_.get(); }

private:
    TokenizerConfig config_;
    stem::StemmerPtr stemmer_;
    text::Recombiner recombiner_;
};

}  // namespace biotok
