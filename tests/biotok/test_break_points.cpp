#include <gtest/gtest.h>
#include <biotok/text/break_points.hpp>

#include <cctype>

using namespace biotok;
using namespace biotok::text;

class BreakPointTest : public ::testing::Test {
protected:
    SubTokens extract(const std::string& token, BreakPointPolicy policy) {
        return BreakPointExtractor::extract(token, policy);
    }

    // Every span is in range, spans are ordered and disjoint, and each
    // character outside the spans belongs to the policy's drop set
    void expect_consistent_spans(const std::string& token, BreakPointPolicy policy) {
        auto spans = BreakPointExtractor::extract_spans(token, policy);
        std::vector<bool> covered(token.size(), false);
        size_t prev_end = 0;

        for (const auto& span : spans) {
            EXPECT_GT(span.length, 0u);
            EXPECT_GE(span.offset, prev_end);
            ASSERT_LE(span.offset + span.length, token.size());
            for (size_t i = span.offset; i < span.offset + span.length; ++i) {
                covered[i] = true;
            }
            prev_end = span.offset + span.length;
        }

        for (size_t i = 0; i < token.size(); ++i) {
            if (covered[i]) continue;
            if (policy == BreakPointPolicy::DELIMITER) {
                EXPECT_TRUE(BreakPointExtractor::is_delimiter(token[i])) << token;
            } else {
                EXPECT_FALSE(std::isalnum(static_cast<unsigned char>(token[i]))) << token;
            }
        }
    }
};

TEST_F(BreakPointTest, NoneKeepsToken) {
    EXPECT_EQ(extract("TNF-alpha", BreakPointPolicy::NONE), (SubTokens{"TNF-alpha"}));
    EXPECT_TRUE(extract("", BreakPointPolicy::NONE).empty());
}

TEST_F(BreakPointTest, Delimiters) {
    EXPECT_EQ(extract("IL-2(a)", BreakPointPolicy::DELIMITER),
              (SubTokens{"IL", "2", "a"}));
    EXPECT_EQ(extract("a_b/c[d]", BreakPointPolicy::DELIMITER),
              (SubTokens{"a", "b", "c", "d"}));
    EXPECT_EQ(extract("p53+", BreakPointPolicy::DELIMITER), (SubTokens{"p53+"}));
    EXPECT_TRUE(extract("--", BreakPointPolicy::DELIMITER).empty());
}

TEST_F(BreakPointTest, Alnum) {
    EXPECT_EQ(extract("TNF-alpha2", BreakPointPolicy::ALNUM),
              (SubTokens{"TNF", "alpha2"}));
    EXPECT_EQ(extract("p53+", BreakPointPolicy::ALNUM), (SubTokens{"p53"}));
    EXPECT_TRUE(extract("+.+", BreakPointPolicy::ALNUM).empty());
}

TEST_F(BreakPointTest, WordClass) {
    EXPECT_EQ(extract("TNF-alpha2", BreakPointPolicy::WORD_CLASS),
              (SubTokens{"TNF", "alpha", "2"}));
    EXPECT_EQ(extract("NFkappaB", BreakPointPolicy::WORD_CLASS),
              (SubTokens{"NF", "kappa", "B"}));
    EXPECT_EQ(extract("Interleukin6", BreakPointPolicy::WORD_CLASS),
              (SubTokens{"Interleukin", "6"}));
    EXPECT_EQ(extract("ABCdef", BreakPointPolicy::WORD_CLASS),
              (SubTokens{"ABC", "def"}));
}

TEST_F(BreakPointTest, WordClassSpans) {
    auto spans = BreakPointExtractor::extract_spans("TNF-alpha2", BreakPointPolicy::WORD_CLASS);
    ASSERT_EQ(spans.size(), 3u);
    EXPECT_EQ(spans[0], (Span{0, 3}));
    EXPECT_EQ(spans[1], (Span{4, 5}));
    EXPECT_EQ(spans[2], (Span{9, 1}));
}

TEST_F(BreakPointTest, SpansCoverAllButDroppedCharacters) {
    const std::vector<std::string> samples = {
        "TNF-alpha2", "IL-2(a)", "NFkappaB/p65", "[Ca2+]i", "a__b", "x", "-",
    };
    for (const auto& token : samples) {
        expect_consistent_spans(token, BreakPointPolicy::DELIMITER);
        expect_consistent_spans(token, BreakPointPolicy::ALNUM);
        expect_consistent_spans(token, BreakPointPolicy::WORD_CLASS);
    }
}

TEST_F(BreakPointTest, NonAsciiBytesAreNotLetters) {
    const std::string token = "a\xC3\xA9" "b";
    EXPECT_EQ(extract(token, BreakPointPolicy::ALNUM), (SubTokens{"a", "b"}));
}
