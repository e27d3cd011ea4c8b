#pragma once

#include <biotok/pipeline.hpp>
#include <biotok/result.hpp>
#include <biotok/util/logger.hpp>

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>

namespace biotok {

namespace fs = std::filesystem;

struct ProcessingStats {
    size_t content_lines = 0;
    size_t markup_lines = 0;
    size_t tokens = 0;  // non-empty tokens written
};

/**
 * DocumentProcessor - runs a TREC/Indri-style document file through a
 * Pipeline.
 *
 * Document markup lines (<DOC>, <DOCNO ...>, </DOC>, <TITLE ...>, </TITLE>,
 * <TEXT ...>, </TEXT>) are copied unchanged. Every other line is normalized
 * and written as its tokens separated by single spaces, one output line per
 * input line.
 */
class DocumentProcessor {
public:
    /**
     * @param pipeline Normalization pipeline (not owned)
     * @param logger Optional diagnostics sink (not owned)
     */
    explicit DocumentProcessor(const Pipeline& pipeline, Logger* logger = nullptr);

    static bool is_markup_line(const std::string& line);

    Result<ProcessingStats> process(std::istream& in, std::ostream& out) const;

    Result<ProcessingStats> process_file(const fs::path& input,
                                         const fs::path& output) const;

private:
    void log(LogLevel level, const std::string& message) const;

    const Pipeline& pipeline_;
    Logger* logger_;
};

}  // namespace biotok
