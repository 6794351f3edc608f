//! # Formatter Pipeline
//!
//! Implements `FormatterPipeline::apply()`. Each stage either hands its text
//! to the next or stops the file with a `FileError`.

#include "pipeline/pipeline.hpp"

#include "charset/charset.hpp"
#include "log/log.hpp"
#include "pipeline/passes.hpp"

namespace srcfmt::pipeline {

Result<std::string, FileError> FormatterPipeline::apply(
    std::string_view raw, const std::vector<const format::FormatterCapability*>& formatters) const {
    auto decoded = charset::decode(raw, config_.encoding);
    if (is_err(decoded)) {
        return FileError::from(unwrap_err(decoded));
    }
    std::string text = std::move(unwrap(decoded));

    for (const auto* formatter : formatters) {
        SRCFMT_LOG_TRACE("pipeline", "Running formatter " << formatter->name());
        auto formatted = formatter->format(text, config_);
        if (is_err(formatted)) {
            return FileError::from(unwrap_err(formatted));
        }
        text = std::move(unwrap(formatted));
    }

    if (config_.header) {
        text = apply_header(text, *config_.header);
    }

    text = normalize_line_endings(text, config_.line_separator);

    auto encoded = charset::encode(text, config_.encoding);
    if (is_err(encoded)) {
        return FileError::from(unwrap_err(encoded));
    }
    return std::move(unwrap(encoded));
}

} // namespace srcfmt::pipeline
