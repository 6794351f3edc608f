//! # clang-format Engine
//!
//! Delegates reformatting to the `clang-format` binary.
//!
//! ## Invocation
//!
//! ```text
//! clang-format --style=<style> --assume-filename=<name> < in.tmp 2> err.tmp
//! ```
//!
//! | Request field   | Argument                                       |
//! |-----------------|------------------------------------------------|
//! | `profile`       | `--style=file:<profile>`                       |
//! | `source_level`  | `Standard: c++NN` in an inline style (C++ only) |
//! | `default_style` | `--style=<default_style>`                      |

#include "format/engine.hpp"

#include "log/log.hpp"
#include "process.hpp"

#include <cstdlib>

namespace srcfmt::format {

const char* language_name(Language lang) {
    switch (lang) {
    case Language::Java:
        return "java";
    case Language::Cpp:
        return "cpp";
    }
    return "unknown";
}

// ============================================================================
// Discovery
// ============================================================================

std::string find_clang_format() {
    if (const char* env = std::getenv("SRCFMT_CLANG_FORMAT"); env && *env) {
        return env;
    }
    return "clang-format";
}

ClangFormatEngine::ClangFormatEngine() : binary_(find_clang_format()) {}

ClangFormatEngine::ClangFormatEngine(std::string binary) : binary_(std::move(binary)) {}

bool ClangFormatEngine::available() const {
    std::call_once(probe_once_, [this] {
        auto version = probe_version(binary_);
        available_ = version.has_value();
        if (available_) {
            SRCFMT_LOG_DEBUG("engine", "Found " << *version);
        }
    });
    return available_;
}

// ============================================================================
// Reformatting
// ============================================================================

std::string ClangFormatEngine::style_argument(const EngineRequest& request) {
    if (request.profile) {
        return "--style=file:" + request.profile->string();
    }

    if (request.source_level && request.language == Language::Cpp) {
        std::string standard = *request.source_level;
        if (!standard.starts_with("c++") && standard != "Latest" && standard != "Auto") {
            standard = "c++" + standard;
        }
        return "--style={BasedOnStyle: " + request.default_style + ", Standard: " + standard + "}";
    }

    return "--style=" + request.default_style;
}

Result<std::string, EngineFailure> ClangFormatEngine::reformat(std::string_view text,
                                                               const EngineRequest& request) const {
    if (!available()) {
        return EngineFailure{"clang-format not found (" + binary_ +
                             "); install LLVM or set SRCFMT_CLANG_FORMAT"};
    }

    if (request.source_level && request.language != Language::Cpp) {
        SRCFMT_LOG_DEBUG("engine", "Source level " << *request.source_level << " has no "
                                                   << language_name(request.language)
                                                   << " equivalent in clang-format");
    }

    std::string cmd = shell_quote(binary_) + " " + shell_quote(style_argument(request)) + " " +
                      shell_quote("--assume-filename=" + request.assume_filename);
    auto run = run_with_input(cmd, text);
    if (is_err(run)) {
        return unwrap_err(run);
    }

    auto& result = unwrap(run);
    if (result.status != 0) {
        return EngineFailure{"clang-format exited with status " + std::to_string(result.status) +
                             (result.diagnostics.empty() ? "" : ": " + result.diagnostics)};
    }
    return std::move(result.out);
}

} // namespace srcfmt::format
