#include "tokenize_command.hpp"
#include "exit_codes.hpp"

#include <biotok/biotok.hpp>

#include <fstream>
#include <iostream>

namespace biotok::cli {

namespace {

constexpr const char* STDIO_PATH = "-";

int exit_code_for(const Error& error) {
    switch (error.code()) {
        case ErrorCode::INVALID_ARGUMENT:
        case ErrorCode::MISSING_ARGUMENT:
        case ErrorCode::PARSE_ERROR:
            return BIOTOK_EXIT_USER_ERROR;
        case ErrorCode::IO_ERROR:
            return BIOTOK_EXIT_IO_ERROR;
        default:
            return BIOTOK_EXIT_INTERNAL;
    }
}

}  // namespace

void TokenizeCommand::setup(CLI::App& app) {
    app.add_option("-i,--input", input_, "Input document file ('-' for stdin)")
        ->type_name("<file>");

    app.add_option("-o,--output", output_, "Output token file ('-' for stdout)")
        ->type_name("<file>");

    query_type_opt_ = app.add_option("-t,--query-type", query_type_,
                                     "Query type: S (symbolic) or V (verbose)")
        ->type_name("S|V");

    break_points_opt_ = app.add_option("-b,--break-points", break_points_,
                                       "Break point set: 0 (none), 1 (delimiters), "
                                       "2 (alphanumeric), 3 (word class)")
        ->type_name("0|1|2|3");

    normalization_opt_ = app.add_option("-n,--normalization", normalization_,
                                        "Normalization: h (hyphen), s (space), j (join)")
        ->type_name("h|s|j");

    app.add_flag("-g,--greek", greek_, "Normalize Greek letter names");

    stemmer_opt_ = app.add_option("-s,--stemmer", stemmer_,
                                  "Stemmer: p (Porter), l (Lovins), s (S-stemmer)")
        ->type_name("p|l|s");

    app.add_option("-c,--config", config_file_,
                   "Read the configuration from a JSON file")
        ->type_name("<file>")
        ->excludes(query_type_opt_)
        ->excludes(break_points_opt_)
        ->excludes(normalization_opt_)
        ->excludes(stemmer_opt_);

    app.add_flag("--print-config", print_config_,
                 "Print the resolved configuration as JSON and exit");
}

CommandLineOptions TokenizeCommand::collect_options() const {
    CommandLineOptions options;
    if (query_type_opt_->count() > 0) options.query_type = query_type_;
    if (break_points_opt_->count() > 0) options.break_points = break_points_;
    if (normalization_opt_->count() > 0) options.normalization = normalization_;
    if (stemmer_opt_->count() > 0) options.stemmer = stemmer_;
    options.greek = greek_;
    return options;
}

void TokenizeCommand::warn_ignored(CommandContext& ctx,
                                   const CommandLineOptions& options) const {
    for (const auto& flag : ignored_options(options)) {
        ctx.logger->warning("Option " + flag + " has no effect with the given options");
    }
}

Result<TokenizerConfig> TokenizeCommand::resolve(CommandContext& ctx) const {
    if (!config_file_.empty()) {
        if (greek_) {
            ctx.logger->warning("Option -g has no effect with --config");
        }
        ctx.logger->debug("Loading configuration from " + config_file_);
        return load_config_file(config_file_);
    }

    CommandLineOptions options = collect_options();
    warn_ignored(ctx, options);
    return resolve_config(options);
}

int TokenizeCommand::execute(CommandContext& ctx) {
    auto config_result = resolve(ctx);
    if (!config_result.ok()) {
        std::cerr << "Error: " << config_result.error().message() << "\n";
        return exit_code_for(config_result.error());
    }
    const TokenizerConfig& config = config_result.value();

    if (print_config_) {
        std::cout << config_to_json(config) << "\n";
        return BIOTOK_EXIT_SUCCESS;
    }

    if (input_.empty() || output_.empty()) {
        std::cerr << "Error: Both an input file (-i) and an output file (-o) are required\n";
        std::cerr << "Usage: biotok -i <input> -o <output> [-t S|V] [-b 0|1|2|3] "
                     "[-n h|s|j] [-g] [-s p|l|s]\n";
        return BIOTOK_EXIT_USER_ERROR;
    }

    Pipeline pipeline(config);
    DocumentProcessor processor(pipeline, ctx.logger);

    Result<ProcessingStats> result = Error(ErrorCode::INTERNAL_ERROR);
    if (input_ == STDIO_PATH && output_ == STDIO_PATH) {
        result = processor.process(std::cin, std::cout);
    } else if (input_ == STDIO_PATH) {
        std::ofstream out(output_, std::ios::trunc);
        if (!out) {
            std::cerr << "Error: Cannot open output file: " << output_ << "\n";
            return BIOTOK_EXIT_IO_ERROR;
        }
        result = processor.process(std::cin, out);
    } else if (output_ == STDIO_PATH) {
        std::ifstream in(input_);
        if (!in) {
            std::cerr << "Error: Cannot open input file: " << input_ << "\n";
            return BIOTOK_EXIT_IO_ERROR;
        }
        result = processor.process(in, std::cout);
    } else {
        result = processor.process_file(input_, output_);
    }

    if (!result.ok()) {
        std::cerr << "Error: " << result.error().message() << "\n";
        return exit_code_for(result.error());
    }

    if (ctx.verbose) {
        const ProcessingStats& stats = result.value();
        ctx.logger->debug("Wrote " + std::to_string(stats.tokens) + " tokens to " +
                          (output_ == STDIO_PATH ? std::string("stdout") : output_));
    }
    return BIOTOK_EXIT_SUCCESS;
}

}  // namespace biotok::cli
