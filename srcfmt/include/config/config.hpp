//! # Formatter Configuration
//!
//! This header defines the immutable configuration shared by every file of a
//! run, and the single resolution step that builds it at startup.
//!
//! ## Resolution Order
//!
//! ```text
//! --conf <url>                      explicit profile, must be readable
//!   else $HOME/formatter-profile.yml  per-user profile, if it exists
//!   else (none)                       formatting engine default
//! ```
//!
//! Resolution happens once, before traversal. The result is handed out as
//! `Rc<const FormatterConfiguration>` and never mutated afterwards, so
//! worker threads read it without synchronization.

#ifndef SRCFMT_CONFIG_CONFIG_HPP
#define SRCFMT_CONFIG_CONFIG_HPP

#include "charset/charset.hpp"
#include "common.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace srcfmt::config {

// ============================================================================
// Line Separators
// ============================================================================

enum class LineSeparator { LF, CR, CRLF };

/// Returns the byte sequence for a separator ("\n", "\r" or "\r\n").
std::string_view line_separator_text(LineSeparator sep);

/// Returns the flag spelling for a separator ("lf", "cr" or "crlf").
const char* line_separator_name(LineSeparator sep);

/// Parses a `--linesep` value. Only "lf", "cr" and "crlf" are accepted.
Result<LineSeparator, FatalError> parse_line_separator(std::string_view value);

// ============================================================================
// Configuration
// ============================================================================

/// Options resolved once at startup and shared read-only by all files.
struct FormatterConfiguration {
    /// Opaque profile handed to the formatting engine; empty means engine default.
    std::optional<fs::path> profile;
    /// Target language version hint for the formatting engine.
    std::optional<std::string> source_level;
    /// Charset of the files on disk.
    std::string encoding = charset::DEFAULT_CHARSET;
    LineSeparator line_separator = LineSeparator::LF;
    /// Header block kept at the top of every file. Lines are '\n'-separated,
    /// without a trailing newline.
    std::optional<std::string> header;
};

/// Raw flag values collected by the command line.
struct ConfigRequest {
    std::optional<std::string> conf;
    std::optional<std::string> level;
    std::optional<std::string> header_file;
    std::optional<std::string> encoding;
    std::optional<std::string> line_separator;
};

/// Returns the candidate per-user profile path (may not exist).
using ProfileLocator = std::function<fs::path()>;

/// `$HOME/formatter-profile.yml` (`%USERPROFILE%` on Windows).
fs::path default_profile_path();

/// Converts a `--conf`/`--header` argument (plain path or `file://` URL) to a path.
Result<fs::path, FatalError> path_from_url(std::string_view url);

/// Normalizes header text: '\n' line endings, no trailing blank lines or newline.
std::string normalize_header(std::string_view text);

/// Builds the run configuration. Fails before any file is touched when a
/// flag value is invalid or a referenced file cannot be read.
Result<Rc<const FormatterConfiguration>, FatalError>
resolve_configuration(const ConfigRequest& request,
                      const ProfileLocator& locate_profile = default_profile_path);

} // namespace srcfmt::config

#endif // SRCFMT_CONFIG_CONFIG_HPP
