#include "pipeline/passes.hpp"

namespace srcfmt::pipeline {

std::string normalize_line_endings(std::string_view text, config::LineSeparator sep) {
    std::string_view eol = config::line_separator_text(sep);
    std::string result;
    result.reserve(text.size() + text.size() / 32);

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            result.append(eol);
        } else if (c == '\n') {
            result.append(eol);
        } else {
            result.push_back(c);
        }
    }
    return result;
}

size_t count_lines(std::string_view text) {
    size_t lines = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            ++lines;
        } else if (text[i] == '\n') {
            ++lines;
        }
    }
    if (!text.empty() && text.back() != '\n' && text.back() != '\r') {
        ++lines;
    }
    return lines;
}

} // namespace srcfmt::pipeline
