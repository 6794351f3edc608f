//! # Header Pass
//!
//! Implements header detection and replacement. See `pipeline/passes.hpp`
//! for the detection rule.

#include "pipeline/passes.hpp"

#include <algorithm>
#include <vector>

namespace srcfmt::pipeline {

namespace {

/// One line of text: `[begin, end)` is the content, `next` the start of the
/// following line (past the end of line).
struct LineSpan {
    size_t begin;
    size_t end;
    size_t next;
};

/// Reads the line starting at `pos`. `pos` must be < text.size().
LineSpan line_at(std::string_view text, size_t pos) {
    size_t end = pos;
    while (end < text.size() && text[end] != '\n' && text[end] != '\r') {
        ++end;
    }
    size_t next = end;
    if (next < text.size()) {
        if (text[next] == '\r' && next + 1 < text.size() && text[next + 1] == '\n') {
            next += 2;
        } else {
            next += 1;
        }
    }
    return {pos, end, next};
}

bool is_blank(std::string_view line) {
    return line.find_first_not_of(" \t\f\v") == std::string_view::npos;
}

std::string_view trim_left(std::string_view line) {
    size_t i = line.find_first_not_of(" \t");
    return i == std::string_view::npos ? std::string_view{} : line.substr(i);
}

/// `/**` opens a documentation comment, except for the empty `/**/`.
bool is_doc_comment(std::string_view line) {
    return line.starts_with("/**") && !line.starts_with("/**/");
}

std::vector<std::string_view> split_header(std::string_view header) {
    std::vector<std::string_view> lines;
    size_t pos = 0;
    while (true) {
        size_t nl = header.find('\n', pos);
        if (nl == std::string_view::npos) {
            lines.push_back(header.substr(pos));
            break;
        }
        lines.push_back(header.substr(pos, nl - pos));
        pos = nl + 1;
    }
    return lines;
}

/// Scans one comment unit starting at `pos`. Returns the span of its last
/// line, or nullopt when the line at `pos` does not start a unit.
std::optional<LineSpan> comment_unit(std::string_view text, size_t pos, bool first) {
    LineSpan line = line_at(text, pos);
    std::string_view content = text.substr(line.begin, line.end - line.begin);
    std::string_view code = first ? content : trim_left(content);

    if (code.starts_with("//")) {
        return line;
    }
    if (!code.starts_with("/*") || is_doc_comment(code)) {
        return std::nullopt;
    }

    // Block comment: ends on the line holding "*/", with nothing but
    // whitespace after it.
    size_t search_from = 2;
    while (true) {
        size_t close = code.find("*/", search_from);
        if (close != std::string_view::npos) {
            if (!is_blank(code.substr(close + 2))) {
                return std::nullopt;
            }
            return line;
        }
        if (line.next >= text.size() || line.next == line.end) {
            return std::nullopt; // unterminated
        }
        line = line_at(text, line.next);
        code = text.substr(line.begin, line.end - line.begin);
        search_from = 0;
    }
}

} // namespace

bool starts_with_header(std::string_view text, std::string_view header) {
    size_t pos = 0;
    for (std::string_view expected : split_header(header)) {
        if (pos >= text.size()) {
            return false;
        }
        LineSpan line = line_at(text, pos);
        if (text.substr(line.begin, line.end - line.begin) != expected) {
            return false;
        }
        pos = line.next;
    }
    return true;
}

std::optional<size_t> detect_header_block(std::string_view text, size_t paragraphs) {
    std::optional<size_t> block_end;
    size_t pos = 0;
    bool first = true;
    size_t paragraph = 1;

    while (pos < text.size()) {
        LineSpan line = line_at(text, pos);
        if (is_blank(text.substr(line.begin, line.end - line.begin))) {
            if (!block_end || paragraph >= paragraphs) {
                break;
            }
            // Another paragraph only if a comment unit follows the blank run.
            size_t next = pos;
            while (next < text.size()) {
                LineSpan blank = line_at(text, next);
                if (!is_blank(text.substr(blank.begin, blank.end - blank.begin))) {
                    break;
                }
                next = blank.next == blank.end ? text.size() : blank.next;
            }
            if (next >= text.size() || !comment_unit(text, next, true)) {
                break;
            }
            pos = next;
            first = true;
            ++paragraph;
            continue;
        }
        auto unit = comment_unit(text, pos, first);
        if (!unit) {
            break;
        }
        block_end = unit->end;
        if (unit->next == unit->end) {
            break; // end of text
        }
        pos = unit->next;
        first = false;
    }
    return block_end;
}

size_t count_paragraphs(std::string_view header) {
    size_t paragraphs = 0;
    bool previous_blank = true;
    for (std::string_view line : split_header(header)) {
        bool blank = is_blank(line);
        if (!blank && previous_blank) {
            ++paragraphs;
        }
        previous_blank = blank;
    }
    return std::max<size_t>(paragraphs, 1);
}

std::string apply_header(std::string_view text, std::string_view header) {
    if (text.starts_with(UTF8_BOM)) {
        return std::string(UTF8_BOM) + apply_header(text.substr(UTF8_BOM.size()), header);
    }

    if (starts_with_header(text, header)) {
        return std::string(text);
    }

    std::string result(header);
    if (auto block_end = detect_header_block(text, count_paragraphs(header))) {
        result.append(text.substr(*block_end));
        return result;
    }

    result.append("\n\n");
    result.append(text);
    return result;
}

} // namespace srcfmt::pipeline
