#include <gtest/gtest.h>
#include <biotok/document_processor.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace biotok;
namespace fs = std::filesystem;

class DocumentProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "biotok_document_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    static std::string read_file(const fs::path& path) {
        std::ifstream in(path);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path test_dir_;
    Pipeline pipeline_;
};

TEST_F(DocumentProcessorTest, MarkupLines) {
    EXPECT_TRUE(DocumentProcessor::is_markup_line("<DOC>"));
    EXPECT_TRUE(DocumentProcessor::is_markup_line("<DOCNO> 12 </DOCNO>"));
    EXPECT_TRUE(DocumentProcessor::is_markup_line("<TITLE>"));
    EXPECT_TRUE(DocumentProcessor::is_markup_line("</TEXT>"));
    EXPECT_FALSE(DocumentProcessor::is_markup_line(" <DOC>"));
    EXPECT_FALSE(DocumentProcessor::is_markup_line("<doc>"));
    EXPECT_FALSE(DocumentProcessor::is_markup_line("<P>"));
}

TEST_F(DocumentProcessorTest, ProcessesDocument) {
    std::istringstream in(
        "<DOC>\n"
        "<DOCNO> 1 </DOCNO>\n"
        "<TEXT>\n"
        "Cells were running.\n"
        "\n"
        "</TEXT>\n"
        "</DOC>\n");
    std::ostringstream out;

    DocumentProcessor processor(pipeline_);
    auto result = processor.process(in, out);
    ASSERT_TRUE(result.ok());

    EXPECT_EQ(out.str(),
              "<DOC>\n"
              "<DOCNO> 1 </DOCNO>\n"
              "<TEXT>\n"
              "cell were run\n"
              "\n"
              "</TEXT>\n"
              "</DOC>\n");
    EXPECT_EQ(result->content_lines, 2u);
    EXPECT_EQ(result->markup_lines, 5u);
    EXPECT_EQ(result->tokens, 3u);
}

TEST_F(DocumentProcessorTest, LastLineWithoutNewline) {
    std::istringstream in("cats");
    std::ostringstream out;

    auto result = DocumentProcessor(pipeline_).process(in, out);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(out.str(), "cat\n");
}

TEST_F(DocumentProcessorTest, LogsConfigAndSummary) {
    std::ostringstream log;
    StreamLogger logger(log);
    logger.set_min_level(LogLevel::DEBUG);

    std::istringstream in("<DOC>\ncats dogs\n</DOC>\n");
    std::ostringstream out;
    auto result = DocumentProcessor(pipeline_, &logger).process(in, out);
    ASSERT_TRUE(result.ok());

    const std::string text = log.str();
    EXPECT_NE(text.find("[INFO] Tokenizing with " + describe(pipeline_.config())),
              std::string::npos);
    EXPECT_NE(text.find("[DEBUG] line 2: 2 tokens"), std::string::npos);
    EXPECT_NE(text.find("1 content lines, 2 markup lines, 2 tokens"), std::string::npos);
}

TEST_F(DocumentProcessorTest, ProcessFile) {
    fs::path input = test_dir_ / "docs.txt";
    fs::path output = test_dir_ / "tokens.txt";
    {
        std::ofstream f(input);
        f << "<DOC>\nThe (ponies) jumped\n</DOC>\n";
    }

    auto result = DocumentProcessor(pipeline_).process_file(input, output);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(read_file(output), "<DOC>\nthe poni jump\n</DOC>\n");
}

TEST_F(DocumentProcessorTest, MissingInput) {
    auto result = DocumentProcessor(pipeline_).process_file(test_dir_ / "missing.txt",
                                                            test_dir_ / "out.txt");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::IO_ERROR);
}

TEST_F(DocumentProcessorTest, UnwritableOutput) {
    fs::path input = test_dir_ / "docs.txt";
    {
        std::ofstream f(input);
        f << "text\n";
    }

    auto result = DocumentProcessor(pipeline_).process_file(
        input, test_dir_ / "no_such_dir" / "out.txt");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::IO_ERROR);
}
