//! # Driver Interface
//!
//! `srcfmt_main()` sets up logging, parses the command line and runs the
//! format command.

#pragma once

namespace srcfmt::cli {

int srcfmt_main(int argc, char* argv[]);

} // namespace srcfmt::cli
