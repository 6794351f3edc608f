//! # Text Passes
//!
//! Post-formatter passes run by the pipeline on decoded UTF-8 text.
//!
//! ## Header Detection
//!
//! Lines are compared without their end-of-line sequence, so the header
//! pass behaves the same on `\n`, `\r\n` and `\r` text.
//!
//! | Text starts with                              | Result                          |
//! |-----------------------------------------------|---------------------------------|
//! | exactly the header lines                      | unchanged                       |
//! | a comment block at offset 0                   | block replaced by the header    |
//! | anything else (including `/**` doc comments)  | header + blank line prepended   |
//!
//! A comment block is a maximal run of `//` lines and `/* ... */` blocks
//! with no blank line between them. A block line must not carry code after
//! its closing `*/`. A header made of several blank-separated paragraphs
//! replaces up to as many comment paragraphs at the top of the text.
//!
//! A leading UTF-8 byte-order mark stays at offset 0; the rule applies to
//! the text after it.

#ifndef SRCFMT_PIPELINE_PASSES_HPP
#define SRCFMT_PIPELINE_PASSES_HPP

#include "config/config.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace srcfmt::pipeline {

/// Returns true if `text` begins with exactly the lines of `header`, the
/// last one followed by an end of line or the end of the text.
bool starts_with_header(std::string_view text, std::string_view header);

/// UTF-8 encoding of U+FEFF.
inline constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

/// Returns the end offset (before its final end of line) of the comment
/// block starting at offset 0, or nullopt when the text has none. Up to
/// `paragraphs` blank-separated comment paragraphs are taken.
std::optional<size_t> detect_header_block(std::string_view text, size_t paragraphs = 1);

/// Number of blank-separated paragraphs in `header` (at least 1).
size_t count_paragraphs(std::string_view header);

/// Ensures `text` starts with `header` ('\n'-separated, no trailing newline).
std::string apply_header(std::string_view text, std::string_view header);

/// Rewrites every `\r\n`, `\r` and `\n` in `text` as `sep`.
std::string normalize_line_endings(std::string_view text, config::LineSeparator sep);

/// Number of logical lines: end-of-line sequences, plus one for a trailing
/// unterminated line.
size_t count_lines(std::string_view text);

} // namespace srcfmt::pipeline

#endif // SRCFMT_PIPELINE_PASSES_HPP
