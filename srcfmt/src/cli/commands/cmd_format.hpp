//! # Format Command Interface
//!
//! `run_format()` resolves the configuration, walks the given path and
//! prints a summary. It returns the process exit code.
//!
//! | Code | Meaning                                               |
//! |------|-------------------------------------------------------|
//! | 0    | Every file formatted or already clean                 |
//! | 1    | Some file failed (or needs formatting under --check)  |
//! | 2    | Invalid flag value                                    |
//! | 3    | Unreadable profile/header, or unsupported path        |
//! | 130  | Interrupted                                           |
//! | 255  | No path given                                         |

#pragma once

#include "../options.hpp"
#include "config/config.hpp"
#include "format/formatter.hpp"
#include "io/file_rewriter.hpp"

#include <ostream>

namespace srcfmt::cli {

/// Collaborators of the format command, replaceable in tests.
struct FormatCommand {
    format::FormatterList formatters;
    config::ProfileLocator locate_profile = config::default_profile_path;
    io::FileRewriter rewriter;
};

int run_format(const CliOptions& options, const FormatCommand& command, std::ostream& out);

} // namespace srcfmt::cli
