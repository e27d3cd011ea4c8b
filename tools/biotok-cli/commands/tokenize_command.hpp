#pragma once

#include <biotok/config.hpp>
#include <biotok/util/logger.hpp>
#include <CLI/CLI.hpp>

#include <string>

namespace biotok::cli {

/**
 * Settings shared by the host and the command it runs.
 */
struct CommandContext {
    Logger* logger = nullptr;
    bool verbose = false;
};

/**
 * Normalizes a document file into an index-ready token file.
 *
 * setup() registers the options on a CLI11 app, execute() runs after
 * parsing succeeded and returns the process exit code.
 */
class TokenizeCommand {
public:
    void setup(CLI::App& app);

    int execute(CommandContext& ctx);

private:
    CommandLineOptions collect_options() const;
    Result<TokenizerConfig> resolve(CommandContext& ctx) const;
    void warn_ignored(CommandContext& ctx, const CommandLineOptions& options) const;

    std::string input_;
    std::string output_;
    std::string query_type_;
    std::string break_points_;
    std::string normalization_;
    bool greek_ = false;
    std::string stemmer_;
    std::string config_file_;
    bool print_config_ = false;

    CLI::Option* query_type_opt_ = nullptr;
    CLI::Option* break_points_opt_ = nullptr;
    CLI::Option* normalization_opt_ = nullptr;
    CLI::Option* stemmer_opt_ = nullptr;
};

}  // namespace biotok::cli
