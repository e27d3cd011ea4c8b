#include "commands/exit_codes.hpp"
#include "commands/tokenize_command.hpp"

#include <biotok/util/logger.hpp>
#include <CLI/CLI.hpp>

#include <iostream>
#include <memory>

using namespace biotok;
using namespace biotok::cli;

int main(int argc, char* argv[]) {
    CLI::App app{"biotok - biomedical text tokenizer for index construction"};
    app.name("biotok");

    TokenizeCommand command;
    command.setup(app);

    bool verbose = false;
    bool quiet = false;
    auto* verbose_opt = app.add_flag("--verbose", verbose, "Log per-line diagnostics");
    app.add_flag("--quiet", quiet, "Suppress all diagnostics")->excludes(verbose_opt);

    CLI11_PARSE(app, argc, argv);

    std::unique_ptr<Logger> logger;
    if (quiet) {
        logger = std::make_unique<NullLogger>();
    } else {
        logger = std::make_unique<ConsoleLogger>();
        if (verbose) {
            logger->set_min_level(LogLevel::DEBUG);
        }
    }

    CommandContext ctx;
    ctx.logger = logger.get();
    ctx.verbose = verbose;

    try {
        return command.execute(ctx);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return BIOTOK_EXIT_INTERNAL;
    }
}
