#pragma once

#include <biotok/result.hpp>
#include <biotok/types.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace biotok {

namespace fs = std::filesystem;

/**
 * Option values as a host received them, before validation.
 */
struct CommandLineOptions {
    std::optional<std::string> query_type;      // -t S|V
    std::optional<std::string> break_points;    // -b 0|1|2|3
    std::optional<std::string> normalization;   // -n h|s|j
    bool greek = false;                         // -g
    std::optional<std::string> stemmer;         // -s p|l|s
};

/**
 * Resolve options into a configuration.
 *
 * A query type overrides everything else. Otherwise, without a break-point
 * set the default policy applies; break-point set 0 turns normalization,
 * Greek and stemming off; any other set needs a normalization method.
 *
 * @return The configuration, or INVALID_ARGUMENT / MISSING_ARGUMENT
 */
Result<TokenizerConfig> resolve_config(const CommandLineOptions& options);

// Options that were given but have no effect under the resolved precedence
std::vector<std::string> ignored_options(const CommandLineOptions& options);

// Single values; both the short codes and the long names are accepted
std::optional<QueryType> parse_query_type(const std::string& value);
std::optional<BreakPointPolicy> parse_break_points(const std::string& value);
std::optional<RecombineMode> parse_recombine_mode(const std::string& value);
std::optional<StemmerKind> parse_stemmer(const std::string& value);

/**
 * Read options from a JSON object, e.g.
 *   {"query_type": "S"}
 *   {"break_points": 1, "normalization": "h", "greek": true, "stemmer": "porter"}
 * and resolve them like command-line options.
 *
 * @return The configuration, PARSE_ERROR for malformed JSON, or
 *         INVALID_ARGUMENT for unknown keys and mistyped values
 */
Result<TokenizerConfig> parse_config_json(const std::string& text);

Result<TokenizerConfig> load_config_file(const fs::path& path);

// Pretty-printed JSON; parse_config_json() maps it back to the same config
// for every config that resolve_config() can produce
std::string config_to_json(const TokenizerConfig& config);

}  // namespace biotok
