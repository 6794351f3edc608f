//! # Engine Process Helpers
//!
//! Shell plumbing shared by the engines that run an external formatter
//! binary: argument quoting, stdout capture, and a run that feeds the text
//! through a temporary file on stdin and collects stderr separately.

#pragma once

#include "common.hpp"
#include "format/engine.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace srcfmt::format {

/// Quotes one argument for the platform shell.
std::string shell_quote(const std::string& arg);

/// Runs `cmd` through the shell, capturing stdout as raw bytes. The exit
/// status is -1 when the process could not be started or did not exit.
auto run_capture(const std::string& cmd) -> std::pair<std::string, int>;

/// Runs `<binary> --version` and returns its first output line, or nullopt
/// when the binary does not run.
std::optional<std::string> probe_version(const std::string& binary);

/// Output of a formatter process.
struct ProcessOutput {
    std::string out;
    /// Stderr with trailing line breaks removed.
    std::string diagnostics;
    int status;
};

/// Runs `command < input 2> errors`, where `input` holds `text`.
Result<ProcessOutput, EngineFailure> run_with_input(const std::string& command,
                                                    std::string_view text);

} // namespace srcfmt::format
