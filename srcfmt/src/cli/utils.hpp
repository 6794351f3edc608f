//! # CLI Utilities Interface
//!
//! | Function          | Description                                  |
//! |-------------------|----------------------------------------------|
//! | `print_usage()`   | Help text followed by the formatter list     |
//! | `print_version()` | Tool version                                 |
//! | `print_summary()` | One-line report of a run                     |

#pragma once

#include "format/formatter.hpp"
#include "traversal/traversal.hpp"

#include <ostream>

namespace srcfmt::cli {

void print_usage(std::ostream& out, const format::FormatterList& formatters);
void print_version(std::ostream& out);
void print_summary(std::ostream& out, const traversal::RunSummary& summary);

} // namespace srcfmt::cli
