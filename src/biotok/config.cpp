#include <biotok/config.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace biotok {

using json = nlohmann::json;

namespace {

Error invalid(const std::string& message) {
    return Error(ErrorCode::INVALID_ARGUMENT, message);
}

Result<CommandLineOptions> options_from_json(const json& j) {
    if (!j.is_object()) {
        return invalid("Configuration must be a JSON object");
    }

    CommandLineOptions options;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        const json& value = it.value();

        if (key == "query_type") {
            if (!value.is_string()) return invalid("query_type must be a string");
            options.query_type = value.get<std::string>();
        } else if (key == "break_points") {
            if (value.is_number_integer()) {
                options.break_points = std::to_string(value.get<long long>());
            } else if (value.is_string()) {
                options.break_points = value.get<std::string>();
            } else {
                return invalid("break_points must be an integer or a string");
            }
        } else if (key == "normalization") {
            if (!value.is_string()) return invalid("normalization must be a string");
            options.normalization = value.get<std::string>();
        } else if (key == "greek") {
            if (!value.is_boolean()) return invalid("greek must be true or false");
            options.greek = value.get<bool>();
        } else if (key == "stemmer") {
            if (value.is_null()) continue;
            if (!value.is_string()) return invalid("stemmer must be a string");
            options.stemmer = value.get<std::string>();
        } else {
            return invalid("Unknown configuration key: " + key);
        }
    }
    return options;
}

}  // namespace

std::optional<QueryType> parse_query_type(const std::string& value) {
    if (value == "S" || value == "symbolic") return QueryType::SYMBOLIC;
    if (value == "V" || value == "verbose") return QueryType::VERBOSE;
    return std::nullopt;
}

std::optional<BreakPointPolicy> parse_break_points(const std::string& value) {
    if (value == "0") return BreakPointPolicy::NONE;
    if (value == "1") return BreakPointPolicy::DELIMITER;
    if (value == "2") return BreakPointPolicy::ALNUM;
    if (value == "3") return BreakPointPolicy::WORD_CLASS;
    return std::nullopt;
}

std::optional<RecombineMode> parse_recombine_mode(const std::string& value) {
    if (value == "h" || value == "hyphen") return RecombineMode::HYPHEN;
    if (value == "s" || value == "space") return RecombineMode::SPACE;
    if (value == "j" || value == "join") return RecombineMode::CONCAT;
    return std::nullopt;
}

std::optional<StemmerKind> parse_stemmer(const std::string& value) {
    if (value == "p" || value == "porter") return StemmerKind::PORTER;
    if (value == "l" || value == "lovins") return StemmerKind::LOVINS;
    if (value == "s" || value == "s-stemmer") return StemmerKind::S_STEMMER;
    return std::nullopt;
}

Result<TokenizerConfig> resolve_config(const CommandLineOptions& options) {
    if (options.query_type) {
        auto type = parse_query_type(*options.query_type);
        if (!type) {
            return invalid("The query type must be S(Symbolic) or V(Verbose)!");
        }
        return TokenizerConfig::for_query_type(*type);
    }

    if (!options.break_points) {
        return TokenizerConfig{};
    }

    auto break_points = parse_break_points(*options.break_points);
    if (!break_points) {
        return invalid("The break point set must be 0, 1, 2 or 3!");
    }

    TokenizerConfig config;
    config.break_points = *break_points;

    if (*break_points == BreakPointPolicy::NONE) {
        config.greek_normalize = false;
        config.stemmer = StemmerKind::NONE;
        return config;
    }

    if (!options.normalization) {
        return Error(ErrorCode::MISSING_ARGUMENT,
                     "If the break point set is not 0, a normalization method must be specified!");
    }
    auto mode = parse_recombine_mode(*options.normalization);
    if (!mode) {
        return invalid("The normalization method must be 'h', 's' or 'j'!");
    }
    config.mode = *mode;
    config.greek_normalize = options.greek;

    config.stemmer = StemmerKind::NONE;
    if (options.stemmer) {
        auto stemmer = parse_stemmer(*options.stemmer);
        if (!stemmer) {
            return invalid("The stemming method must be 'p', 'l' or 's'!");
        }
        config.stemmer = *stemmer;
    }

    return config;
}

std::vector<std::string> ignored_options(const CommandLineOptions& options) {
    std::vector<std::string> ignored;
    const bool override_all = options.query_type.has_value();
    const bool no_companions = override_all || !options.break_points ||
                               *options.break_points == "0";

    if (override_all && options.break_points) ignored.push_back("-b");
    if (no_companions) {
        if (options.normalization) ignored.push_back("-n");
        if (options.greek) ignored.push_back("-g");
        if (options.stemmer) ignored.push_back("-s");
    }
    return ignored;
}

Result<TokenizerConfig> parse_config_json(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        return Error(ErrorCode::PARSE_ERROR, e.what());
    }

    auto options = options_from_json(j);
    if (!options.ok()) {
        return options.error();
    }
    return resolve_config(options.value());
}

Result<TokenizerConfig> load_config_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error(ErrorCode::IO_ERROR, "Cannot open config file: " + path.string());
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Error(ErrorCode::IO_ERROR, "Failed to read config file: " + path.string());
    }

    auto result = parse_config_json(ss.str());
    if (!result.ok()) {
        return Error(result.error_code(),
                     path.string() + ": " + result.error().message());
    }
    return result;
}

std::string config_to_json(const TokenizerConfig& config) {
    json j;
    j["break_points"] = static_cast<int>(config.break_points);

    if (config.break_points != BreakPointPolicy::NONE) {
        j["normalization"] = recombine_mode_name(config.mode);
        j["greek"] = config.greek_normalize;
        if (config.stemmer != StemmerKind::NONE) {
            j["stemmer"] = stemmer_name(config.stemmer);
        }
    }
    return j.dump(2);
}

}  // namespace biotok
