//! # Text Pass Tests
//!
//! Header detection, insertion and replacement, and line-ending
//! normalization.

#include "pipeline/passes.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace srcfmt;
using namespace srcfmt::pipeline;
using config::LineSeparator;

// ============================================================================
// Header Detection
// ============================================================================

TEST(HeaderDetectionTest, LineComments) {
    std::string text = "// one\n// two\nclass A {}\n";
    auto end = detect_header_block(text);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(*end, 13u); // just before the second '\n'
}

TEST(HeaderDetectionTest, BlockCommentFollowedByLineComment) {
    std::string text = "/*\n * License\n */\n// extra\npackage a;\n";
    auto end = detect_header_block(text);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(text.substr(*end), "\npackage a;\n");
}

TEST(HeaderDetectionTest, BlankLineEndsBlock) {
    std::string text = "// license\n\n// about the class\nclass A {}\n";
    auto end = detect_header_block(text);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(text.substr(0, *end), "// license");
}

TEST(HeaderDetectionTest, DocCommentIsNotAHeader) {
    EXPECT_FALSE(detect_header_block("/** Class docs. */\nclass A {}\n").has_value());
}

TEST(HeaderDetectionTest, CodeAfterCloseIsNotAHeader) {
    EXPECT_FALSE(detect_header_block("/* x */ int a;\n").has_value());
}

TEST(HeaderDetectionTest, UnterminatedBlockIsNotAHeader) {
    EXPECT_FALSE(detect_header_block("/* never closed\nint a;\n").has_value());
}

TEST(HeaderDetectionTest, MustStartAtOffsetZero) {
    EXPECT_FALSE(detect_header_block("  // indented\nint a;\n").has_value());
    EXPECT_FALSE(detect_header_block("package a;\n// late\n").has_value());
}

TEST(HeaderDetectionTest, CrLfText) {
    std::string text = "// one\r\n// two\r\nint a;\r\n";
    auto end = detect_header_block(text);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(text.substr(*end), "\r\nint a;\r\n");
}

// ============================================================================
// Header Application
// ============================================================================

TEST(ApplyHeaderTest, PrependsWhenAbsent) {
    EXPECT_EQ(apply_header("class A {}\n", "// Copyright X"), "// Copyright X\n\nclass A {}\n");
}

TEST(ApplyHeaderTest, IdenticalHeaderUnchanged) {
    std::string text = "// Copyright X\n\nclass A {}\n";
    EXPECT_EQ(apply_header(text, "// Copyright X"), text);
}

TEST(ApplyHeaderTest, IdenticalHeaderWithOtherLineEndingsUnchanged) {
    std::string text = "// Copyright X\r\n// Line 2\r\n\r\nclass A {}\r\n";
    EXPECT_EQ(apply_header(text, "// Copyright X\n// Line 2"), text);
}

TEST(ApplyHeaderTest, ReplacesDifferentHeader) {
    std::string text = "/* Copyright Old Corp */\n\npackage a;\n";
    EXPECT_EQ(apply_header(text, "// Copyright X"), "// Copyright X\n\npackage a;\n");
}

TEST(ApplyHeaderTest, KeepsDocCommentBelowNewHeader) {
    std::string text = "/** Docs. */\nclass A {}\n";
    EXPECT_EQ(apply_header(text, "// H"), "// H\n\n/** Docs. */\nclass A {}\n");
}

TEST(ApplyHeaderTest, HeaderOnlyFile) {
    EXPECT_EQ(apply_header("// Old", "// New"), "// New");
}

TEST(ApplyHeaderTest, EmptyText) {
    std::string once = apply_header("", "// H");
    EXPECT_EQ(once, "// H\n\n");
    EXPECT_EQ(apply_header(once, "// H"), once);
}

TEST(ApplyHeaderTest, Idempotent) {
    const std::string header = "/*\n * Copyright X\n */";
    const std::string inputs[] = {
        "class A {}\n",
        "// old\n// header\nclass A {}\n",
        "/* old */\n\n\nclass A {}",
        "/** Docs */\nclass A {}\n",
        "\n\nclass A {}\n",
    };
    for (const auto& input : inputs) {
        std::string once = apply_header(input, header);
        EXPECT_EQ(apply_header(once, header), once) << "input: " << input;
        EXPECT_TRUE(starts_with_header(once, header)) << "input: " << input;
    }
}

TEST(ApplyHeaderTest, ByteOrderMarkStaysFirst) {
    std::string bom(UTF8_BOM);
    std::string out = apply_header(bom + "// Old header\npackage a;\n", "// Copyright X");
    EXPECT_EQ(out, bom + "// Copyright X\npackage a;\n");
    EXPECT_EQ(apply_header(out, "// Copyright X"), out);

    EXPECT_EQ(apply_header(bom + "package a;\n", "// Copyright X"),
              bom + "// Copyright X\n\npackage a;\n");
}

TEST(ApplyHeaderTest, MultiParagraphHeaderReplacesAllParagraphs) {
    std::string header = "// A\n\n// B";
    EXPECT_EQ(count_paragraphs(header), 2u);

    std::string out = apply_header("// A\n\n// C\n\nclass X {}\n", header);
    EXPECT_EQ(out, "// A\n\n// B\n\nclass X {}\n");
    EXPECT_EQ(apply_header(out, header), out);
}

TEST(ApplyHeaderTest, SingleParagraphHeaderKeepsSecondComment) {
    EXPECT_EQ(apply_header("// old\n\n// About X\nclass X {}\n", "// new"),
              "// new\n\n// About X\nclass X {}\n");
}

TEST(HeaderDetectionTest, ParagraphsStopAtCode) {
    std::string text = "// one\n\nclass A {}\n";
    auto end = detect_header_block(text, 3);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(*end, 6u);
}

// ============================================================================
// Line Endings
// ============================================================================

TEST(LineEndingsTest, LfToCrLf) {
    EXPECT_EQ(normalize_line_endings("a\nb\n", LineSeparator::CRLF), "a\r\nb\r\n");
}

TEST(LineEndingsTest, MixedToLf) {
    EXPECT_EQ(normalize_line_endings("a\r\nb\rc\nd", LineSeparator::LF), "a\nb\nc\nd");
}

TEST(LineEndingsTest, CrLfPairIsOneLineEnding) {
    EXPECT_EQ(normalize_line_endings("a\r\n\r\nb", LineSeparator::CR), "a\r\rb");
}

TEST(LineEndingsTest, OnlyConfiguredSeparatorAndSameLineCount) {
    const std::string input = "one\r\ntwo\rthree\n\r\nfive\r\r\n";
    for (auto sep : {LineSeparator::LF, LineSeparator::CR, LineSeparator::CRLF}) {
        std::string out = normalize_line_endings(input, sep);
        EXPECT_EQ(count_lines(out), count_lines(input));
        EXPECT_EQ(normalize_line_endings(out, sep), out);

        std::string stripped = out;
        std::string eol(config::line_separator_text(sep));
        for (size_t pos = stripped.find(eol); pos != std::string::npos;
             pos = stripped.find(eol, pos)) {
            stripped.erase(pos, eol.size());
        }
        EXPECT_EQ(stripped.find_first_of("\r\n"), std::string::npos);
    }
}

TEST(LineEndingsTest, CountLines) {
    EXPECT_EQ(count_lines(""), 0u);
    EXPECT_EQ(count_lines("a"), 1u);
    EXPECT_EQ(count_lines("a\n"), 1u);
    EXPECT_EQ(count_lines("a\r\nb"), 2u);
    EXPECT_EQ(count_lines("\r\r\n\n"), 3u);
}
