/**
 * @file test_format_tools.cpp
 * @brief Unit tests for format_tools: durations, output tails, line splitting and
 *        command-line rendering.
 */
#include "cgt_base.hpp"
#include "shared_test_helpers.h"
#include <gtest/gtest.h>

#include <chrono>

using namespace cellgate;
using namespace std::chrono_literals;
using cellgate::tests::helper::TempDir;
using cellgate::tests::helper::write_text_file;

TEST(FormatToolsTest, FormattedDuration)
{
    EXPECT_EQ(format_tools::formatted_duration(0ms), "0ms");
    EXPECT_EQ(format_tools::formatted_duration(999ms), "999ms");
    EXPECT_EQ(format_tools::formatted_duration(1500ms), "1.5s");
    EXPECT_EQ(format_tools::formatted_duration(65s), "1m05s");
    EXPECT_EQ(format_tools::formatted_duration(std::chrono::minutes(12)), "12m00s");
}

TEST(FormatToolsTest, TailBytesKeepsShortText)
{
    EXPECT_EQ(format_tools::tail_bytes("short", 100), "short");
    EXPECT_EQ(format_tools::tail_bytes("", 10), "");
}

TEST(FormatToolsTest, TailBytesCutsAtLineBoundary)
{
    // Last 5 bytes are "f\nghi"; the partial line is dropped.
    EXPECT_EQ(format_tools::tail_bytes("abc\ndef\nghi", 5), "...\nghi");
}

TEST(FormatToolsTest, TailBytesWithoutNewline)
{
    EXPECT_EQ(format_tools::tail_bytes("0123456789", 4), "...\n6789");
}

TEST(FormatToolsTest, TailBytesDoesNotSplitUtf8Sequence)
{
    // "x\xC3\xA9y": the last 2 bytes would start inside the two-byte "\xC3\xA9".
    EXPECT_EQ(format_tools::tail_bytes("x\xC3\xA9y", 2), "...\ny");
    EXPECT_EQ(format_tools::tail_bytes("x\xC3\xA9y", 3), "...\n\xC3\xA9y");
    EXPECT_EQ(format_tools::tail_bytes("ab\xE2\x82\xAC", 2), "...\n");
}

TEST(FormatToolsTest, StripAnsi)
{
    EXPECT_EQ(format_tools::strip_ansi("plain"), "plain");
    EXPECT_EQ(format_tools::strip_ansi("\x1b[1m\x1b[33mwarning\x1b[0m\x1b[1m: unused\x1b[0m"),
              "warning: unused");
    EXPECT_EQ(format_tools::strip_ansi("\x1b[38;5;208mx\x1b[K"), "x");
    EXPECT_EQ(format_tools::strip_ansi("a\x1b(Bb"), "aBb");
    EXPECT_EQ(format_tools::strip_ansi("cut\x1b[1;3"), "cut");
}

TEST(FormatToolsTest, SplitLines)
{
    auto lines = format_tools::split_lines("a\r\nb\n\nc");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "c");

    EXPECT_EQ(format_tools::split_lines("one\n").size(), 1u);
    EXPECT_TRUE(format_tools::split_lines("").empty());
}

TEST(FormatToolsTest, JoinCommandLineQuotes)
{
    EXPECT_EQ(format_tools::join_command_line({"cargo", "fmt", "--check"}), "cargo fmt --check");
    EXPECT_EQ(format_tools::join_command_line({"echo", "a b", ""}), "echo \"a b\" \"\"");
    EXPECT_EQ(format_tools::join_command_line({"say", "x\"y"}), "say \"x\\\"y\"");
}

TEST(FormatToolsTest, ReadFile)
{
    TempDir tmp("format_tools_read");
    write_text_file(tmp / "f.txt", "line1\nline2\n");
    auto contents = format_tools::read_file(tmp / "f.txt");
    ASSERT_TRUE(contents.has_value());
    EXPECT_EQ(*contents, "line1\nline2\n");
    EXPECT_FALSE(format_tools::read_file(tmp / "missing.txt").has_value());
}

TEST(FormatToolsTest, FormattedTimeHasMicroseconds)
{
    const auto s = format_tools::formatted_time(std::chrono::system_clock::now());
    // "YYYY-mm-dd HH:MM:SS.uuuuuu"
    ASSERT_EQ(s.size(), 26u);
    EXPECT_EQ(s[4], '-');
    EXPECT_EQ(s[10], ' ');
    EXPECT_EQ(s[19], '.');
}
