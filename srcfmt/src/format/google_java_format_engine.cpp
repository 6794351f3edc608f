//! # google-java-format Engine
//!
//! Delegates Java reformatting to the `google-java-format` binary.
//!
//! ## Invocation
//!
//! ```text
//! google-java-format [--aosp] - < in.tmp 2> err.tmp
//! ```
//!
//! | Request field   | Argument                                    |
//! |-----------------|---------------------------------------------|
//! | `default_style` | `--aosp` for `AOSP`, nothing for `Google`   |
//! | `profile`       | not supported, logged at Debug              |
//! | `source_level`  | not supported, logged at Debug              |
//!
//! A parse error makes the binary exit 1 with the diagnostics on stderr.

#include "format/engine.hpp"

#include "log/log.hpp"
#include "process.hpp"

#include <cstdlib>

namespace srcfmt::format {

std::string find_google_java_format() {
    if (const char* env = std::getenv("SRCFMT_GOOGLE_JAVA_FORMAT"); env && *env) {
        return env;
    }
    return "google-java-format";
}

GoogleJavaFormatEngine::GoogleJavaFormatEngine() : binary_(find_google_java_format()) {}

GoogleJavaFormatEngine::GoogleJavaFormatEngine(std::string binary) : binary_(std::move(binary)) {}

bool GoogleJavaFormatEngine::available() const {
    std::call_once(probe_once_, [this] {
        auto version = probe_version(binary_);
        available_ = version.has_value();
        if (available_) {
            SRCFMT_LOG_DEBUG("engine", "Found " << *version);
        }
    });
    return available_;
}

std::vector<std::string> GoogleJavaFormatEngine::arguments(const EngineRequest& request) {
    std::vector<std::string> args;
    if (request.default_style == "AOSP") {
        args.push_back("--aosp");
    }
    args.push_back("-");
    return args;
}

Result<std::string, EngineFailure>
GoogleJavaFormatEngine::reformat(std::string_view text, const EngineRequest& request) const {
    if (!available()) {
        return EngineFailure{"google-java-format not found (" + binary_ +
                             "); install it or set SRCFMT_GOOGLE_JAVA_FORMAT"};
    }

    if (request.profile) {
        SRCFMT_LOG_DEBUG("engine", "Profile " << request.profile->string()
                                              << " ignored by google-java-format");
    }
    if (request.source_level) {
        SRCFMT_LOG_DEBUG("engine", "Source level " << *request.source_level
                                                   << " ignored by google-java-format");
    }

    std::string cmd = shell_quote(binary_);
    for (const auto& arg : arguments(request)) {
        cmd += " " + shell_quote(arg);
    }
    auto run = run_with_input(cmd, text);
    if (is_err(run)) {
        return unwrap_err(run);
    }

    auto& result = unwrap(run);
    if (result.status != 0) {
        return EngineFailure{"google-java-format exited with status " +
                             std::to_string(result.status) +
                             (result.diagnostics.empty() ? "" : ": " + result.diagnostics)};
    }
    return std::move(result.out);
}

} // namespace srcfmt::format
