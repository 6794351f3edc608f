//! # Formatter Pipeline
//!
//! Turns a file's raw bytes into its final bytes:
//!
//! ```text
//! raw bytes -> decode -> formatter 1 -> ... -> formatter N
//!           -> header pass -> line endings -> encode -> final bytes
//! ```
//!
//! Formatters run in registration order. The first failure aborts the file
//! and discards any intermediate output; nothing is written here, so the
//! file on disk stays untouched.

#ifndef SRCFMT_PIPELINE_PIPELINE_HPP
#define SRCFMT_PIPELINE_PIPELINE_HPP

#include "common.hpp"
#include "config/config.hpp"
#include "format/formatter.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace srcfmt::pipeline {

class FormatterPipeline {
public:
    explicit FormatterPipeline(const config::FormatterConfiguration& config) : config_(config) {}

    /// Runs `formatters` (already filtered for applicability, in order) and
    /// the text passes over `raw`.
    Result<std::string, FileError>
    apply(std::string_view raw, const std::vector<const format::FormatterCapability*>& formatters) const;

    const config::FormatterConfiguration& config() const {
        return config_;
    }

private:
    const config::FormatterConfiguration& config_;
};

} // namespace srcfmt::pipeline

#endif // SRCFMT_PIPELINE_PIPELINE_HPP
