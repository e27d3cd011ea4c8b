#include <biotok/document_processor.hpp>

#include <array>
#include <fstream>
#include <istream>
#include <ostream>
#include <string_view>

namespace biotok {

namespace {

constexpr std::array<std::string_view, 7> MARKUP_PREFIXES = {
    "<DOC>", "<DOCNO", "</DOC>",
    "<TITLE", "</TITLE>",
    "<TEXT", "</TEXT>",
};

bool starts_with(const std::string& s, std::string_view prefix) {
    return s.size() >= prefix.size() &&
           s.compare(0, prefix.size(), prefix.data(), prefix.size()) == 0;
}

}  // namespace

DocumentProcessor::DocumentProcessor(const Pipeline& pipeline, Logger* logger)
    : pipeline_(pipeline), logger_(logger) {}

void DocumentProcessor::log(LogLevel level, const std::string& message) const {
    if (logger_) {
        logger_->log(level, message);
    }
}

bool DocumentProcessor::is_markup_line(const std::string& line) {
    for (auto prefix : MARKUP_PREFIXES) {
        if (starts_with(line, prefix)) {
            return true;
        }
    }
    return false;
}

Result<ProcessingStats> DocumentProcessor::process(std::istream& in, std::ostream& out) const {
    ProcessingStats stats;
    std::string line;
    size_t line_number = 0;

    log(LogLevel::INFO, "Tokenizing with " + describe(pipeline_.config()));

    while (std::getline(in, line)) {
        ++line_number;

        if (is_markup_line(line)) {
            out << line << '\n';
            ++stats.markup_lines;
            continue;
        }

        std::vector<std::string> tokens = pipeline_.tokenize_line(line);
        size_t emitted = 0;
        for (const auto& token : tokens) {
            if (!token.empty()) ++emitted;
        }

        out << Pipeline::render(tokens) << '\n';
        ++stats.content_lines;
        stats.tokens += emitted;

        log(LogLevel::DEBUG, "line " + std::to_string(line_number) + ": " +
                                 std::to_string(emitted) + " tokens");

        if (!out) {
            return Error(ErrorCode::IO_ERROR,
                         "Failed to write output at line " + std::to_string(line_number));
        }
    }

    if (in.bad()) {
        return Error(ErrorCode::IO_ERROR,
                     "Failed to read input after line " + std::to_string(line_number));
    }

    out.flush();
    if (!out) {
        return Error(ErrorCode::IO_ERROR, "Failed to flush output");
    }

    log(LogLevel::INFO, "Processed " + std::to_string(stats.content_lines) +
                            " content lines, " + std::to_string(stats.markup_lines) +
                            " markup lines, " + std::to_string(stats.tokens) + " tokens");
    return stats;
}

Result<ProcessingStats> DocumentProcessor::process_file(const fs::path& input,
                                                        const fs::path& output) const {
    std::ifstream in(input);
    if (!in) {
        return Error(ErrorCode::IO_ERROR, "Cannot open input file: " + input.string());
    }

    std::ofstream out(output, std::ios::trunc);
    if (!out) {
        return Error(ErrorCode::IO_ERROR, "Cannot open output file: " + output.string());
    }

    return process(in, out);
}

}  // namespace biotok
