#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "tools/text_edit.hpp"

namespace {

using namespace memvault::tools::text;

TEST(TextEditTest, SplitsLinesKeepingTerminators) {
    EXPECT_TRUE(split_lines("").empty());
    EXPECT_EQ(split_lines("a\nb\n"), (std::vector<std::string>{"a\n", "b\n"}));
    EXPECT_EQ(split_lines("a\nb"), (std::vector<std::string>{"a\n", "b"}));
    EXPECT_EQ(split_lines("a\r\n\nb"), (std::vector<std::string>{"a\r\n", "\n", "b"}));
}

TEST(TextEditTest, StripsLineEndings) {
    EXPECT_EQ(strip_line_ending("a\n"), "a");
    EXPECT_EQ(strip_line_ending("a\r\n"), "a");
    EXPECT_EQ(strip_line_ending("a"), "a");
    EXPECT_EQ(strip_line_ending("\n"), "");
}

TEST(TextEditTest, DetectsLineEnding) {
    EXPECT_EQ(detect_line_ending("a\r\nb\r\n"), "\r\n");
    EXPECT_EQ(detect_line_ending("a\nb\r\n"), "\n");
    EXPECT_EQ(detect_line_ending("no newline"), "\n");
}

TEST(TextEditTest, CountsOccurrencesUpToLimit) {
    EXPECT_EQ(count_occurrences("abc", "x"), 0u);
    EXPECT_EQ(count_occurrences("abc", "b"), 1u);
    EXPECT_EQ(count_occurrences("b b b b", "b"), 2u);
    EXPECT_EQ(count_occurrences("b b b b", "b", 10), 4u);
    EXPECT_EQ(count_occurrences("aaa", "aa"), 2u);
    EXPECT_EQ(count_occurrences("abc", ""), 0u);
}

TEST(TextEditTest, RendersNumberedRows) {
    const auto lines = split_lines("one\ntwo\r\nthree");
    EXPECT_EQ(render_numbered(lines, 1, 3), "1\tone\n2\ttwo\n3\tthree");
    EXPECT_EQ(render_numbered(lines, 2, 2), "2\ttwo");
    EXPECT_EQ(render_numbered(lines, 2, 9), "2\ttwo\n3\tthree");
    EXPECT_EQ(render_numbered({}, 1, 0), "");
}

TEST(TextEditTest, InsertsAtBeginningMiddleAndEnd) {
    EXPECT_EQ(insert_at_line("a\nb\n", 0, "x"), "x\na\nb\n");
    EXPECT_EQ(insert_at_line("a\nb\n", 1, "x"), "a\nx\nb\n");
    EXPECT_EQ(insert_at_line("a\nb\n", 2, "x"), "a\nb\nx\n");
}

TEST(TextEditTest, InsertsMultipleLines) {
    EXPECT_EQ(insert_at_line("a\nb\n", 1, "x\ny"), "a\nx\ny\nb\n");
    EXPECT_EQ(insert_at_line("a\nb\n", 1, "x\ny\n"), "a\nx\ny\nb\n");
}

TEST(TextEditTest, InsertIntoEmptyContentIsExactText) {
    EXPECT_EQ(insert_at_line("", 0, "hello"), "hello");
    EXPECT_EQ(insert_at_line("", 0, "a\nb"), "a\nb");
}

TEST(TextEditTest, AppendAfterUnterminatedLastLine) {
    EXPECT_EQ(insert_at_line("a\nb", 2, "c"), "a\nb\nc");
    EXPECT_EQ(insert_at_line("a\nb", 1, "c"), "a\nc\nb");
}

TEST(TextEditTest, PreservesCrlfConvention) {
    EXPECT_EQ(insert_at_line("a\r\nb\r\n", 1, "x\ny"), "a\r\nx\r\ny\r\nb\r\n");
    EXPECT_EQ(insert_at_line("a\r\nb", 2, "c"), "a\r\nb\r\nc");
}

TEST(TextEditTest, InsertsEmptyLine) {
    EXPECT_EQ(insert_at_line("a\nb\n", 1, ""), "a\n\nb\n");
}

}  // namespace
