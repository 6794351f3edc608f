//! # Formatting Engine Interface
//!
//! The syntax-aware reformatting itself is delegated to an external engine.
//! Formatters only see this interface: text in, text out, or an
//! `EngineFailure` the formatter turns into a `FormatError`.
//!
//! ## Engines
//!
//! | Class                    | Backend                       | Used for |
//! |--------------------------|-------------------------------|----------|
//! | `ClangFormatEngine`      | `clang-format` binary         | C/C++    |
//! | `GoogleJavaFormatEngine` | `google-java-format` binary   | Java     |
//!
//! The Java engine parses its input and rejects text with syntax errors.
//!
//! Engines must be safe to call from several worker threads at once.

#ifndef SRCFMT_FORMAT_ENGINE_HPP
#define SRCFMT_FORMAT_ENGINE_HPP

#include "common.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace srcfmt::format {

/// Languages the engine is asked to format.
enum class Language { Java, Cpp };

const char* language_name(Language lang);

/// Everything the engine needs besides the text itself.
struct EngineRequest {
    Language language;
    /// File name used by the engine for language detection (e.g. "Source.java").
    std::string assume_filename;
    /// Engine profile. Empty means `default_style`.
    std::optional<fs::path> profile;
    std::optional<std::string> source_level;
    /// Built-in style used when no profile is given.
    std::string default_style;
};

/// Engine-side failure (non-zero exit, missing binary, ...).
struct EngineFailure {
    std::string message;
};

class FormattingEngine {
public:
    virtual ~FormattingEngine() = default;

    virtual std::string_view name() const = 0;

    /// Whether the engine can run at all (binary present, etc.).
    virtual bool available() const = 0;

    virtual Result<std::string, EngineFailure> reformat(std::string_view text,
                                                        const EngineRequest& request) const = 0;
};

// ============================================================================
// clang-format
// ============================================================================

/// Runs `clang-format` as a child process, feeding the text through a
/// temporary file on stdin and capturing stdout.
class ClangFormatEngine : public FormattingEngine {
public:
    /// Uses `SRCFMT_CLANG_FORMAT` if set, otherwise `clang-format` from PATH.
    ClangFormatEngine();
    explicit ClangFormatEngine(std::string binary);

    std::string_view name() const override {
        return "clang-format";
    }

    bool available() const override;

    Result<std::string, EngineFailure> reformat(std::string_view text,
                                                const EngineRequest& request) const override;

    const std::string& binary() const {
        return binary_;
    }

    /// Builds the `--style=` argument for a request.
    static std::string style_argument(const EngineRequest& request);

private:
    std::string binary_;
    mutable std::once_flag probe_once_;
    mutable bool available_ = false;
};

/// Finds the clang-format binary: `SRCFMT_CLANG_FORMAT` or PATH lookup.
std::string find_clang_format();

// ============================================================================
// google-java-format
// ============================================================================

/// Runs `google-java-format` as a child process. The text is parsed, so a
/// syntax error is reported as a failure and no output is produced.
class GoogleJavaFormatEngine : public FormattingEngine {
public:
    /// Uses `SRCFMT_GOOGLE_JAVA_FORMAT` if set, otherwise `google-java-format` from PATH.
    GoogleJavaFormatEngine();
    explicit GoogleJavaFormatEngine(std::string binary);

    std::string_view name() const override {
        return "google-java-format";
    }

    bool available() const override;

    Result<std::string, EngineFailure> reformat(std::string_view text,
                                                const EngineRequest& request) const override;

    const std::string& binary() const {
        return binary_;
    }

    /// Command-line arguments for a request, `-` (stdin) last.
    static std::vector<std::string> arguments(const EngineRequest& request);

private:
    std::string binary_;
    mutable std::once_flag probe_once_;
    mutable bool available_ = false;
};

/// Finds the google-java-format binary: `SRCFMT_GOOGLE_JAVA_FORMAT` or PATH lookup.
std::string find_google_java_format();

} // namespace srcfmt::format

#endif // SRCFMT_FORMAT_ENGINE_HPP
