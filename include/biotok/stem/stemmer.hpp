#pragma once

#include <biotok/types.hpp>

#include <memory>
#include <string>

namespace biotok::stem {

// ============================================================================
// Abstract Stemmer Interface
// ============================================================================

/**
 * A stemmer maps a lowercase word to its index form. Implementations are
 * pure: the result depends only on the input word and read-only rule tables,
 * so one instance may be shared freely across lines and threads.
 */
class Stemmer {
public:
    virtual ~Stemmer() = default;

    virtual std::string stem(const std::string& word) const = 0;

    virtual StemmerKind kind() const = 0;

    const char* name() const { return stemmer_name(kind()); }
};

using StemmerPtr = std::unique_ptr<Stemmer>;

/**
 * Create the stemmer for a configuration value.
 *
 * @param kind Selected algorithm
 * @return The stemmer, or nullptr for StemmerKind::NONE (identity)
 */
StemmerPtr make_stemmer(StemmerKind kind);

}  // namespace biotok::stem
