//! # Command-Line Options
//!
//! | Flag                       | Field                        |
//! |----------------------------|------------------------------|
//! | `-c`, `--conf <url>`       | `config.conf`                |
//! | `-l`, `--level <version>`  | `config.level`               |
//! | `-H`, `--header <file>`    | `config.header_file`         |
//! | `-e`, `--encoding <name>`  | `config.encoding`            |
//! | `-s`, `--linesep <sep>`    | `config.line_separator`      |
//! | `-j`, `--jobs <n>`         | `jobs` (0 = cores, max 256)  |
//! | `--check`                  | `check`                      |
//! | `-h`, `--help`             | `help`                       |
//! | `-V`, `--version`          | `version`                    |
//! | `<path>`                   | `path` (last one wins)       |
//!
//! Value flags accept both `--conf x` and `--conf=x`. Logging flags are
//! left to `log::parse_log_options()`.

#pragma once

#include "common.hpp"
#include "config/config.hpp"

#include <optional>
#include <string>

namespace srcfmt::cli {

struct CliOptions {
    config::ConfigRequest config;
    std::optional<std::string> path;
    int jobs = 1;
    bool check = false;
    bool help = false;
    bool version = false;
};

/// Parses argv. Unknown options and missing or malformed values are
/// `InvalidArgument` errors. Flag values are checked later, by
/// `config::resolve_configuration()`.
Result<CliOptions, FatalError> parse_args(int argc, char* argv[]);

} // namespace srcfmt::cli
